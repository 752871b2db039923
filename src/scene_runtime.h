#ifndef BRICKED_SCENE_RUNTIME_H_
#define BRICKED_SCENE_RUNTIME_H_

#include <string>

namespace bricked_runtime {

// "bricked-export-YYYYMMDD-HHMMSS.<extension>" in local time.
std::string MakeExportFilename(const char *extension);

}  // namespace bricked_runtime

#endif  // BRICKED_SCENE_RUNTIME_H_
