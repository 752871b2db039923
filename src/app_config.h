#ifndef BRICKED_APP_CONFIG_H_
#define BRICKED_APP_CONFIG_H_

#include <cstddef>
#include <cstdint>
#include <string>

#include "geometry_params.h"
#include "placement.h"

namespace bricked {

enum class CompilerBackend : uint8_t {
  Manifold = 0,
  OpenScad = 1,
};

const char *CompilerBackendName(CompilerBackend backend);

struct AppConfig {
  std::string descriptionPath = "build.bricks";
  CompilerBackend compiler = CompilerBackend::Manifold;
  std::string openscadExecutable = "openscad";
  size_t compileWorkers = 2;
  GeometryParameters geometry;
  SnapSettings snap;
  int windowWidth = 1200;
  int windowHeight = 800;
  float fovDegrees = 50.0f;
  bool showHelp = false;
};

// Fills `config` from argv. Out-of-range numbers are errors, not clamps.
bool ParseAppConfig(int argc, char **argv, AppConfig *config, std::string *error);

std::string AppConfigUsage(const char *program);

}  // namespace bricked

#endif  // BRICKED_APP_CONFIG_H_
