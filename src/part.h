#ifndef BRICKED_PART_H_
#define BRICKED_PART_H_

#include <cstddef>
#include <cstdint>
#include <string>
#include <vector>

#include "app_state.h"
#include "part_catalog.h"

namespace bricked {

struct Part {
  std::string id;
  const PartKind *kind = nullptr;
  bricked_app::Vec3 position = {0.0f, 0.0f, 0.0f};
  bricked_app::Vec3 rotationDeg = {0.0f, 0.0f, 0.0f};
  bricked_app::Rgb color = {0.8f, 0.1f, 0.1f};
};

// Process-unique identifier of the form "<unix_ms>-<counter hex>".
std::string MakePartId();

// Ordered part sequence. Order is both declaration order and build-step order.
// Every mutation bumps version().
class PartList {
 public:
  PartList() = default;
  explicit PartList(std::vector<Part> parts);

  void Replace(std::vector<Part> parts);
  bool SetTransform(size_t index, const bricked_app::Vec3 &position,
                    const bricked_app::Vec3 &rotation_deg);
  bool SetColor(size_t index, const bricked_app::Rgb &color);

  const std::vector<Part> &parts() const { return parts_; }
  const Part &operator[](size_t index) const { return parts_[index]; }
  size_t size() const { return parts_.size(); }
  bool empty() const { return parts_.empty(); }
  uint64_t version() const { return version_; }

 private:
  std::vector<Part> parts_;
  uint64_t version_ = 0;
};

}  // namespace bricked

#endif  // BRICKED_PART_H_
