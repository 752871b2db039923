#include "part_catalog.h"

namespace bricked {

const double kStudPitch = 8.0;
const double kBrickHeight = 9.6;
const double kPlateHeight = 9.6 / 3.0;

namespace {

constexpr PartKind kCatalog[] = {
    {"1x1", 1, 1, PartCategory::Brick},
    {"1x2", 1, 2, PartCategory::Brick},
    {"1x3", 1, 3, PartCategory::Brick},
    {"1x4", 1, 4, PartCategory::Brick},
    {"1x5", 1, 5, PartCategory::Brick},
    {"1x6", 1, 6, PartCategory::Brick},
    {"1x8", 1, 8, PartCategory::Brick},
    {"1x10", 1, 10, PartCategory::Brick},
    {"1x12", 1, 12, PartCategory::Brick},
    {"2x2", 2, 2, PartCategory::Brick},
    {"2x3", 2, 3, PartCategory::Brick},
    {"2x4", 2, 4, PartCategory::Brick},
    {"2x6", 2, 6, PartCategory::Brick},
    {"2x8", 2, 8, PartCategory::Brick},
    {"2x10", 2, 10, PartCategory::Brick},
    {"2x12", 2, 12, PartCategory::Brick},
    {"3x3", 3, 3, PartCategory::Brick},
    {"3x4", 3, 4, PartCategory::Brick},
    {"3x6", 3, 6, PartCategory::Brick},
    {"4x4", 4, 4, PartCategory::Brick},
    {"4x6", 4, 6, PartCategory::Brick},
    {"4x8", 4, 8, PartCategory::Brick},

    {"plate_1x1", 1, 1, PartCategory::Plate},
    {"plate_1x2", 1, 2, PartCategory::Plate},
    {"plate_1x3", 1, 3, PartCategory::Plate},
    {"plate_1x4", 1, 4, PartCategory::Plate},
    {"plate_1x6", 1, 6, PartCategory::Plate},
    {"plate_1x8", 1, 8, PartCategory::Plate},
    {"plate_2x2", 2, 2, PartCategory::Plate},
    {"plate_2x3", 2, 3, PartCategory::Plate},
    {"plate_2x4", 2, 4, PartCategory::Plate},
    {"plate_2x6", 2, 6, PartCategory::Plate},
    {"plate_2x8", 2, 8, PartCategory::Plate},
    {"plate_2x10", 2, 10, PartCategory::Plate},
    {"plate_3x3", 3, 3, PartCategory::Plate},
    {"plate_4x4", 4, 4, PartCategory::Plate},

    {"tile_1x1", 1, 1, PartCategory::Tile},
    {"tile_1x2", 1, 2, PartCategory::Tile},
    {"tile_1x3", 1, 3, PartCategory::Tile},
    {"tile_1x4", 1, 4, PartCategory::Tile},
    {"tile_1x6", 1, 6, PartCategory::Tile},
    {"tile_2x2", 2, 2, PartCategory::Tile},
    {"tile_2x3", 2, 3, PartCategory::Tile},
    {"tile_2x4", 2, 4, PartCategory::Tile},
    {"tile_2x6", 2, 6, PartCategory::Tile},

    {"slope_45_1x2", 1, 2, PartCategory::Slope},
    {"slope_45_2x2", 2, 2, PartCategory::Slope},
    {"slope_45_2x3", 2, 3, PartCategory::Slope},
    {"slope_45_2x4", 2, 4, PartCategory::Slope},
    {"slope_45_3x2", 3, 2, PartCategory::Slope},
    {"slope_45_3x3", 3, 3, PartCategory::Slope},
};

}  // namespace

const PartKind *FindPartKind(std::string_view id) {
  for (const PartKind &kind : kCatalog) {
    if (id == kind.id) return &kind;
  }
  return nullptr;
}

const PartKind *PartCatalogBegin() { return kCatalog; }

size_t PartCatalogSize() { return sizeof(kCatalog) / sizeof(kCatalog[0]); }

double PartBodyHeight(const PartKind &kind) {
  switch (kind.category) {
    case PartCategory::Plate:
    case PartCategory::Tile:
      return kPlateHeight;
    case PartCategory::Brick:
    case PartCategory::Slope:
    default:
      return kBrickHeight;
  }
}

bool PartHasStuds(const PartKind &kind) { return kind.category != PartCategory::Tile; }

const char *PartCategoryName(PartCategory category) {
  switch (category) {
    case PartCategory::Brick: return "brick";
    case PartCategory::Plate: return "plate";
    case PartCategory::Tile: return "tile";
    case PartCategory::Slope: return "slope";
    default: return "unknown";
  }
}

}  // namespace bricked
