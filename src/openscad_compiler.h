#ifndef BRICKED_OPENSCAD_COMPILER_H_
#define BRICKED_OPENSCAD_COMPILER_H_

#include <chrono>
#include <cstddef>
#include <cstdint>
#include <deque>
#include <string>
#include <vector>

#include "mesh_compiler.h"

namespace bricked {

struct OpenScadCompilerOptions {
  // Executable looked up on PATH unless it contains a slash.
  std::string executable = "openscad";
  size_t maxProcesses = 2;
  // A child still running after this long is killed and its job fails.
  int timeoutMs = 60 * 1000;
};

// Runs `openscad -o <job>.stl <job>.scad` per job in a private temp
// directory. Children are reaped with waitpid(WNOHANG) from Poll().
class OpenScadMeshCompiler : public MeshCompiler {
 public:
  explicit OpenScadMeshCompiler(OpenScadCompilerOptions options = {});
  ~OpenScadMeshCompiler() override;

  OpenScadMeshCompiler(const OpenScadMeshCompiler &) = delete;
  OpenScadMeshCompiler &operator=(const OpenScadMeshCompiler &) = delete;

  uint64_t Submit(const std::string &source, Callback done) override;
  size_t Poll() override;
  size_t pending() const override { return queued_.size() + running_.size(); }
  const char *name() const override { return "openscad"; }

  void Shutdown();
  // Private temp directory holding per-job files; empty until the first spawn.
  const std::string &work_dir() const { return work_dir_; }

 private:
  struct Job {
    uint64_t id = 0;
    std::string source;
    Callback done;
  };
  struct Running {
    Job job;
    int pid = -1;
    std::string scadPath;
    std::string stlPath;
    std::string logPath;
    std::chrono::steady_clock::time_point started;
  };

  bool EnsureWorkDir(std::string *error);
  bool Spawn(Job job, CompileResult *failure);
  CompileResult Collect(Running *run, int status);
  void LogEvent(const char *event, uint64_t run_id, const std::string &details = "");

  OpenScadCompilerOptions options_;
  uint64_t next_id_;
  std::string work_dir_;
  std::deque<Job> queued_;
  std::vector<Running> running_;
};

}  // namespace bricked

#endif  // BRICKED_OPENSCAD_COMPILER_H_
