#ifndef BRICKED_SOLID_COMPILER_H_
#define BRICKED_SOLID_COMPILER_H_

#include <cstddef>
#include <cstdint>
#include <deque>
#include <future>
#include <string>
#include <vector>

#include "manifold/manifold.h"
#include "mesh_compiler.h"

namespace bricked {

// Evaluates the OpenSCAD subset emitted by BuildPartSolidSource:
//   $fn = <n>;
//   union() { ... }
//   translate([x, y, z]) <child>
//   cube(<size>|[x, y, z], center=<bool>)
//   cylinder(h=, r=|d=|r1=,r2=|d1=,d2=, center=, $fn=)
//   polyhedron(points=[...], faces=[...])
// Top-level solids are unioned. Errors carry the source line.
bool EvaluateSolidSource(const std::string &source, manifold::Manifold *out, std::string *error);

// EvaluateSolidSource followed by binary STL encoding.
bool CompileSolidSourceToStl(const std::string &source, std::vector<uint8_t> *bytes, std::string *error);

// In-process compiler backed by manifold. Up to `max_workers` sources are
// evaluated on std::async threads; 0 evaluates inline inside Poll().
class ManifoldMeshCompiler : public MeshCompiler {
 public:
  explicit ManifoldMeshCompiler(size_t max_workers = 2);
  ~ManifoldMeshCompiler() override;

  ManifoldMeshCompiler(const ManifoldMeshCompiler &) = delete;
  ManifoldMeshCompiler &operator=(const ManifoldMeshCompiler &) = delete;

  uint64_t Submit(const std::string &source, Callback done) override;
  size_t Poll() override;
  size_t pending() const override { return queued_.size() + running_.size(); }
  const char *name() const override { return "manifold"; }

 private:
  struct Job {
    uint64_t id = 0;
    std::string source;
    Callback done;
  };
  struct Running {
    Job job;
    std::future<CompileResult> result;
  };

  size_t max_workers_;
  uint64_t next_id_;
  std::deque<Job> queued_;
  std::vector<Running> running_;
};

}  // namespace bricked

#endif  // BRICKED_SOLID_COMPILER_H_
