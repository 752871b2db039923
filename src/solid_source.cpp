#include "solid_source.h"

#include <cstdio>

namespace bricked {

namespace {

void appendf(std::string *out, const char *fmt, double a, double b, double c) {
  char buf[160];
  std::snprintf(buf, sizeof(buf), fmt, a, b, c);
  out->append(buf);
}

void append_stud(std::string *out, double x, double y, double z, double d, double h, int fn) {
  char buf[192];
  std::snprintf(buf, sizeof(buf),
                "  translate([%.6g, %.6g, %.6g]) cylinder(d=%.6g, h=%.6g, $fn=%d, center=false);\n",
                x, y, z, d, h, fn);
  out->append(buf);
}

// Faces are wound clockwise seen from outside, as OpenSCAD expects.
void append_wedge(std::string *out, double w, double d, double h) {
  char buf[320];
  std::snprintf(buf, sizeof(buf),
                "  polyhedron(points=[[0, 0, 0], [%.6g, 0, 0], [%.6g, %.6g, 0], [0, %.6g, 0], "
                "[0, 0, %.6g], [%.6g, 0, %.6g]], "
                "faces=[[0, 1, 2, 3], [4, 5, 1, 0], [1, 5, 2], [0, 3, 4], [4, 3, 2, 5]]);\n",
                w, w, d, d, h, w, h);
  out->append(buf);
}

}  // namespace

std::string BuildPartSolidSource(const PartKind &kind, const GeometryParameters &params) {
  const double w = kind.studsX * kStudPitch - params.wallGap;
  const double d = kind.studsY * kStudPitch - params.wallGap;
  const double h = PartBodyHeight(kind);
  const double stud_r = params.studDiameter * 0.5;
  const int fn = StudCircularSegments(params, stud_r);

  std::string out;
  out.reserve(512 + (size_t)kind.studsX * kind.studsY * 96);
  out.append("// bricked part ");
  out.append(kind.id);
  out.append(" (");
  out.append(PartCategoryName(kind.category));
  out.append(")\n");
  char line[64];
  std::snprintf(line, sizeof(line), "$fn = %d;\n", fn);
  out.append(line);
  out.append("union() {\n");

  if (kind.category == PartCategory::Slope) {
    append_wedge(&out, w, d, h);
  } else {
    appendf(&out, "  cube([%.6g, %.6g, %.6g], center=false);\n", w, d, h);
  }

  if (PartHasStuds(kind)) {
    const double half = kStudPitch * 0.5;
    for (uint32_t ix = 0; ix < kind.studsX; ++ix) {
      for (uint32_t iy = 0; iy < kind.studsY; ++iy) {
        append_stud(&out, half + ix * kStudPitch, half + iy * kStudPitch, h,
                    params.studDiameter, params.studHeight, fn);
      }
    }
  }
  out.append("}\n");
  return out;
}

}  // namespace bricked
