#include "part.h"

#include <chrono>
#include <cstdio>
#include <utility>

namespace bricked {

std::string MakePartId() {
  static uint64_t counter = 0;
  const auto ms = std::chrono::duration_cast<std::chrono::milliseconds>(
      std::chrono::system_clock::now().time_since_epoch()).count();
  char buf[64];
  std::snprintf(buf, sizeof(buf), "%lld-%llx", (long long)ms, (unsigned long long)++counter);
  return std::string(buf);
}

PartList::PartList(std::vector<Part> parts) : parts_(std::move(parts)), version_(1) {}

void PartList::Replace(std::vector<Part> parts) {
  parts_ = std::move(parts);
  ++version_;
}

bool PartList::SetTransform(size_t index, const bricked_app::Vec3 &position,
                            const bricked_app::Vec3 &rotation_deg) {
  if (index >= parts_.size()) return false;
  parts_[index].position = position;
  parts_[index].rotationDeg = rotation_deg;
  ++version_;
  return true;
}

bool PartList::SetColor(size_t index, const bricked_app::Rgb &color) {
  if (index >= parts_.size()) return false;
  parts_[index].color = color;
  ++version_;
  return true;
}

}  // namespace bricked
