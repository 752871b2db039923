#include "app_config.h"

#include <cerrno>
#include <cmath>
#include <cstdio>
#include <cstdlib>
#include <cstring>

namespace bricked {

namespace {

bool starts_with(const char *s, const char *prefix, const char **rest) {
  const size_t n = std::strlen(prefix);
  if (std::strncmp(s, prefix, n) != 0) return false;
  *rest = s + n;
  return true;
}

bool parse_double(const char *flag, const char *text, double lo, double hi, double *out, std::string *error) {
  errno = 0;
  char *end = nullptr;
  const double v = std::strtod(text, &end);
  if (end == text || *end != '\0' || errno != 0 || !std::isfinite(v)) {
    if (error) *error = std::string(flag) + " expects a number, got '" + text + "'.";
    return false;
  }
  if (v < lo || v > hi) {
    char buf[160];
    std::snprintf(buf, sizeof(buf), "%s must be within [%g, %g], got %g.", flag, lo, hi, v);
    if (error) *error = buf;
    return false;
  }
  *out = v;
  return true;
}

bool parse_int(const char *flag, const char *text, long lo, long hi, long *out, std::string *error) {
  errno = 0;
  char *end = nullptr;
  const long v = std::strtol(text, &end, 10);
  if (end == text || *end != '\0' || errno != 0) {
    if (error) *error = std::string(flag) + " expects an integer, got '" + text + "'.";
    return false;
  }
  if (v < lo || v > hi) {
    if (error) {
      *error = std::string(flag) + " must be within [" + std::to_string(lo) + ", " + std::to_string(hi) +
               "], got " + std::to_string(v) + ".";
    }
    return false;
  }
  *out = v;
  return true;
}

}  // namespace

const char *CompilerBackendName(CompilerBackend backend) {
  return backend == CompilerBackend::OpenScad ? "openscad" : "manifold";
}

bool ParseAppConfig(int argc, char **argv, AppConfig *config, std::string *error) {
  if (!config) {
    if (error) *error = "ParseAppConfig received invalid inputs.";
    return false;
  }
  AppConfig out = *config;
  bool have_path = false;
  for (int i = 1; i < argc; ++i) {
    const char *arg = argv[i];
    const char *v = nullptr;
    long n = 0;
    if (std::strcmp(arg, "--help") == 0 || std::strcmp(arg, "-h") == 0) {
      out.showHelp = true;
    } else if (starts_with(arg, "--compiler=", &v)) {
      if (std::strcmp(v, "manifold") == 0) {
        out.compiler = CompilerBackend::Manifold;
      } else if (std::strcmp(v, "openscad") == 0) {
        out.compiler = CompilerBackend::OpenScad;
      } else {
        if (error) *error = std::string("--compiler must be 'manifold' or 'openscad', got '") + v + "'.";
        return false;
      }
    } else if (starts_with(arg, "--openscad=", &v)) {
      if (*v == '\0') {
        if (error) *error = "--openscad expects an executable path.";
        return false;
      }
      out.openscadExecutable = v;
    } else if (starts_with(arg, "--fn=", &v)) {
      if (!parse_int("--fn", v, 0, kMaxCircularSegments, &n, error)) return false;
      if (n != 0 && n < kMinCircularSegments) {
        if (error) {
          *error = "--fn must be 0 or within [" + std::to_string(kMinCircularSegments) + ", " +
                   std::to_string(kMaxCircularSegments) + "].";
        }
        return false;
      }
      out.geometry.circularSegments = (int)n;
    } else if (starts_with(arg, "--stud-d=", &v)) {
      if (!parse_double("--stud-d", v, kMinStudDiameter, kMaxStudDiameter, &out.geometry.studDiameter, error)) {
        return false;
      }
    } else if (starts_with(arg, "--stud-h=", &v)) {
      if (!parse_double("--stud-h", v, kMinStudHeight, kMaxStudHeight, &out.geometry.studHeight, error)) {
        return false;
      }
    } else if (starts_with(arg, "--gap=", &v)) {
      if (!parse_double("--gap", v, kMinWallGap, kMaxWallGap, &out.geometry.wallGap, error)) return false;
    } else if (starts_with(arg, "--workers=", &v)) {
      if (!parse_int("--workers", v, 0, 64, &n, error)) return false;
      out.compileWorkers = (size_t)n;
    } else if (starts_with(arg, "--width=", &v)) {
      if (!parse_int("--width", v, 320, 16384, &n, error)) return false;
      out.windowWidth = (int)n;
    } else if (starts_with(arg, "--height=", &v)) {
      if (!parse_int("--height", v, 240, 16384, &n, error)) return false;
      out.windowHeight = (int)n;
    } else if (std::strcmp(arg, "--no-snap") == 0) {
      out.snap.enabled = false;
    } else if (std::strcmp(arg, "--no-grid-snap") == 0) {
      out.snap.toGrid = false;
    } else if (std::strcmp(arg, "--no-level-snap") == 0) {
      out.snap.toLevels = false;
    } else if (arg[0] == '-' && arg[1] != '\0') {
      if (error) *error = std::string("Unknown option '") + arg + "'.";
      return false;
    } else {
      if (have_path) {
        if (error) *error = std::string("Unexpected extra argument '") + arg + "'.";
        return false;
      }
      out.descriptionPath = arg;
      have_path = true;
    }
  }
  *config = out;
  return true;
}

std::string AppConfigUsage(const char *program) {
  std::string usage = "usage: ";
  usage += program ? program : "bricked";
  usage +=
      " [options] [description.bricks]\n"
      "\n"
      "  --compiler=manifold|openscad  geometry backend (default manifold)\n"
      "  --openscad=PATH               OpenSCAD executable (default openscad)\n"
      "  --workers=N                   concurrent compile jobs (default 2, 0 = inline)\n"
      "  --fn=N                        stud segments, 0 = derive from radius (default 48)\n"
      "  --stud-d=MM                   stud diameter (default 4.8)\n"
      "  --stud-h=MM                   stud height (default 1.8)\n"
      "  --gap=MM                      wall gap per footprint side (default 0.02)\n"
      "  --no-snap                     start with snapping off\n"
      "  --no-grid-snap                snap X/Z to 1 mm instead of the stud pitch\n"
      "  --no-level-snap               snap Y to 1 mm instead of the plate height\n"
      "  --width=PX --height=PX        window size (default 1200x800)\n"
      "  --help                        show this text\n";
  return usage;
}

}  // namespace bricked
