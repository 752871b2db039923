#ifndef BRICKED_PART_CATALOG_H_
#define BRICKED_PART_CATALOG_H_

#include <cstddef>
#include <cstdint>
#include <string_view>

namespace bricked {

// Scene units are millimetres. Floor plane is X/Z, Y is vertical.
extern const double kStudPitch;
extern const double kBrickHeight;
extern const double kPlateHeight;

enum class PartCategory : uint8_t {
  Brick = 0,
  Plate = 1,
  Tile = 2,
  Slope = 3,
};

struct PartKind {
  const char *id;
  uint32_t studsX;
  uint32_t studsY;
  PartCategory category;
};

// Looks up a catalog entry by identifier. Returns nullptr for unknown kinds.
const PartKind *FindPartKind(std::string_view id);

const PartKind *PartCatalogBegin();
size_t PartCatalogSize();

double PartBodyHeight(const PartKind &kind);
bool PartHasStuds(const PartKind &kind);
const char *PartCategoryName(PartCategory category);

}  // namespace bricked

#endif  // BRICKED_PART_CATALOG_H_
