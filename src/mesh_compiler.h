#ifndef BRICKED_MESH_COMPILER_H_
#define BRICKED_MESH_COMPILER_H_

#include <cstddef>
#include <cstdint>
#include <functional>
#include <string>
#include <vector>

namespace bricked {

struct CompileResult {
  uint64_t jobId = 0;
  bool ok = false;
  // Binary STL on success.
  std::vector<uint8_t> bytes;
  // Compiler diagnostic on failure.
  std::string error;
  uint32_t durationMs = 0;
};

// Turns solid-modeling source text into mesh bytes. Compiles may run
// concurrently, but completion callbacks only ever run on the thread that
// calls Poll(), so callers need no locking of their own.
//
// Callbacks of jobs still pending when the compiler is destroyed are dropped
// without being invoked.
class MeshCompiler {
 public:
  using Callback = std::function<void(const CompileResult &)>;

  virtual ~MeshCompiler() = default;

  // Queues `source`; returns the job id later reported in CompileResult.
  virtual uint64_t Submit(const std::string &source, Callback done) = 0;
  // Starts queued work and delivers finished results. Returns the number of
  // callbacks invoked.
  virtual size_t Poll() = 0;
  // Jobs submitted but not yet delivered.
  virtual size_t pending() const = 0;
  virtual const char *name() const = 0;
};

// Polls until `compiler` has nothing pending or `timeout_ms` elapses.
bool DrainMeshCompiler(MeshCompiler *compiler, int timeout_ms, std::string *error);

}  // namespace bricked

#endif  // BRICKED_MESH_COMPILER_H_
