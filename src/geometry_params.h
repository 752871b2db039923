#ifndef BRICKED_GEOMETRY_PARAMS_H_
#define BRICKED_GEOMETRY_PARAMS_H_

#include <cstdint>
#include <string>

#include "part_catalog.h"

namespace bricked {

// Per-compile geometry knobs. Equality is field-wise; two equal parameter sets
// always produce the same mesh for a given kind.
struct GeometryParameters {
  // $fn for studs. 0 derives the count from the stud radius.
  int circularSegments = 48;
  double studDiameter = 4.8;
  double studHeight = 1.8;
  // Subtracted from each footprint dimension so neighbours never share faces.
  double wallGap = 0.02;
};

bool operator==(const GeometryParameters &a, const GeometryParameters &b);
bool operator!=(const GeometryParameters &a, const GeometryParameters &b);

// Interactive editing limits.
extern const int kMinCircularSegments;
extern const int kMaxCircularSegments;
extern const double kMinStudDiameter;
extern const double kMaxStudDiameter;
extern const double kMinStudHeight;
extern const double kMaxStudHeight;
extern const double kMinWallGap;
extern const double kMaxWallGap;

// Tolerance used when circularSegments is 0, in scene units.
extern const double kStudSagittaTolerance;

GeometryParameters ClampGeometryParameters(const GeometryParameters &params);

enum class GeometryField : uint8_t {
  CircularSegments = 0,
  StudDiameter = 1,
  StudHeight = 2,
  WallGap = 3,
};

const char *GeometryFieldName(GeometryField field);

// Moves one field by `steps` increments and clamps the result. Increments are
// 8 segments, 0.1 for stud diameter and height, 0.01 for the gap. Automatic
// segments (0) step from the default count.
GeometryParameters StepGeometryParameter(const GeometryParameters &params, GeometryField field, int steps);

// "fn=48 stud_d=4.8 stud_h=1.8 gap=0.02"
std::string FormatGeometryParameters(const GeometryParameters &params);

// Segment count actually emitted for a stud of `radius`.
int StudCircularSegments(const GeometryParameters &params, double radius);

using GeomKey = std::string;

// Deterministic cache key: "<kind>|fn=<n>|stud_d=<v>|stud_h=<v>|gap=<v>",
// doubles printed with round-trip precision.
GeomKey MakeGeomKey(const PartKind &kind, const GeometryParameters &params);

}  // namespace bricked

#endif  // BRICKED_GEOMETRY_PARAMS_H_
