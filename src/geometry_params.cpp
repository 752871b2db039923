#include "geometry_params.h"

#include <algorithm>
#include <cmath>
#include <cstdio>

namespace bricked {

const int kMinCircularSegments = 12;
const int kMaxCircularSegments = 128;
const double kMinStudDiameter = 3.5;
const double kMaxStudDiameter = 6.0;
const double kMinStudHeight = 0.8;
const double kMaxStudHeight = 3.0;
const double kMinWallGap = 0.0;
const double kMaxWallGap = 0.2;

const double kStudSagittaTolerance = 0.01;

namespace {

constexpr double kPi = 3.14159265358979323846;
constexpr int kMinAutoSegments = 4;
constexpr int kMaxAutoSegments = 8192;

int round_up_to_multiple_of_four(int n) {
  if (n <= 0) return 0;
  return ((n + 3) / 4) * 4;
}

int circular_segments_for_radius_and_tolerance(double radius, double tolerance) {
  radius = std::abs(radius);
  if (!std::isfinite(radius) || radius <= 1e-12) return kMinAutoSegments;
  if (!std::isfinite(tolerance) || tolerance <= 0.0) tolerance = kStudSagittaTolerance;
  tolerance = std::max(tolerance, 1e-9);
  if (tolerance >= radius) return kMinAutoSegments;

  // Sagitta error bound for a circle approximated by n segments:
  // sagitta = r * (1 - cos(pi / n)) <= tolerance
  const double cos_arg = std::clamp(1.0 - tolerance / radius, -1.0, 1.0);
  const double theta = std::acos(cos_arg);
  if (!std::isfinite(theta) || theta <= 1e-9) return kMaxAutoSegments;

  int n = (int)std::ceil(kPi / theta);
  n = std::clamp(n, kMinAutoSegments, kMaxAutoSegments);
  return round_up_to_multiple_of_four(n);
}

double finite_or(double v, double fallback) { return std::isfinite(v) ? v : fallback; }

// Snaps to the 1/scale lattice before stepping so repeated presses do not drift.
double step_on_lattice(double v, double scale, int steps) {
  return (std::round(v * scale) + steps) / scale;
}

}  // namespace

bool operator==(const GeometryParameters &a, const GeometryParameters &b) {
  return a.circularSegments == b.circularSegments &&
         a.studDiameter == b.studDiameter &&
         a.studHeight == b.studHeight &&
         a.wallGap == b.wallGap;
}

bool operator!=(const GeometryParameters &a, const GeometryParameters &b) { return !(a == b); }

GeometryParameters ClampGeometryParameters(const GeometryParameters &params) {
  const GeometryParameters defaults;
  GeometryParameters out;
  out.circularSegments = params.circularSegments == 0
                             ? 0
                             : std::clamp(params.circularSegments, kMinCircularSegments, kMaxCircularSegments);
  out.studDiameter = std::clamp(finite_or(params.studDiameter, defaults.studDiameter),
                                kMinStudDiameter, kMaxStudDiameter);
  out.studHeight = std::clamp(finite_or(params.studHeight, defaults.studHeight),
                              kMinStudHeight, kMaxStudHeight);
  out.wallGap = std::clamp(finite_or(params.wallGap, defaults.wallGap), kMinWallGap, kMaxWallGap);
  return out;
}

int StudCircularSegments(const GeometryParameters &params, double radius) {
  if (params.circularSegments > 0) return std::max(3, params.circularSegments);
  return circular_segments_for_radius_and_tolerance(radius, kStudSagittaTolerance);
}

GeomKey MakeGeomKey(const PartKind &kind, const GeometryParameters &params) {
  char buf[256];
  std::snprintf(buf, sizeof(buf), "%s|fn=%d|stud_d=%.17g|stud_h=%.17g|gap=%.17g",
                kind.id, params.circularSegments, params.studDiameter,
                params.studHeight, params.wallGap);
  return GeomKey(buf);
}

const char *GeometryFieldName(GeometryField field) {
  switch (field) {
    case GeometryField::CircularSegments: return "fn";
    case GeometryField::StudDiameter: return "stud_d";
    case GeometryField::StudHeight: return "stud_h";
    case GeometryField::WallGap: return "gap";
  }
  return "fn";
}

GeometryParameters StepGeometryParameter(const GeometryParameters &params, GeometryField field, int steps) {
  const GeometryParameters defaults;
  GeometryParameters out = ClampGeometryParameters(params);
  switch (field) {
    case GeometryField::CircularSegments: {
      const int fn = out.circularSegments > 0 ? out.circularSegments : defaults.circularSegments;
      out.circularSegments = fn + steps * 8;
      break;
    }
    case GeometryField::StudDiameter:
      out.studDiameter = step_on_lattice(out.studDiameter, 10.0, steps);
      break;
    case GeometryField::StudHeight:
      out.studHeight = step_on_lattice(out.studHeight, 10.0, steps);
      break;
    case GeometryField::WallGap:
      out.wallGap = step_on_lattice(out.wallGap, 100.0, steps);
      break;
  }
  return ClampGeometryParameters(out);
}

std::string FormatGeometryParameters(const GeometryParameters &params) {
  char buf[128];
  std::snprintf(buf, sizeof(buf), "fn=%d stud_d=%.2g stud_h=%.2g gap=%.2g",
                params.circularSegments, params.studDiameter, params.studHeight, params.wallGap);
  return std::string(buf);
}

}  // namespace bricked
