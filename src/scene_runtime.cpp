#include "scene_runtime.h"

#include <cstdio>
#include <ctime>

namespace bricked_runtime {

std::string MakeExportFilename(const char *extension) {
  std::time_t now = std::time(nullptr);
  std::tm tmv = {};
  localtime_r(&now, &tmv);
  char buf[64];
  std::snprintf(buf, sizeof(buf), "bricked-export-%04d%02d%02d-%02d%02d%02d.%s",
                tmv.tm_year + 1900, tmv.tm_mon + 1, tmv.tm_mday,
                tmv.tm_hour, tmv.tm_min, tmv.tm_sec, extension ? extension : "stl");
  return std::string(buf);
}

}  // namespace bricked_runtime
