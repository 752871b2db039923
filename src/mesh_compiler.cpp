#include "mesh_compiler.h"

#include <chrono>
#include <thread>

namespace bricked {

bool DrainMeshCompiler(MeshCompiler *compiler, int timeout_ms, std::string *error) {
  if (!compiler) {
    if (error) *error = "Mesh compiler is null.";
    return false;
  }
  const auto deadline = std::chrono::steady_clock::now() + std::chrono::milliseconds(timeout_ms);
  while (compiler->pending() > 0) {
    if (compiler->Poll() > 0) continue;
    if (std::chrono::steady_clock::now() >= deadline) {
      if (error) {
        *error = std::string("Timed out waiting for ") + compiler->name() + " compiler (" +
                 std::to_string(compiler->pending()) + " pending).";
      }
      return false;
    }
    std::this_thread::sleep_for(std::chrono::milliseconds(2));
  }
  return true;
}

}  // namespace bricked
