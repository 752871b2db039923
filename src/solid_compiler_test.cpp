// solid_compiler_test.cpp
//
// The in-process solid compiler against hand-written sources and against
// every source the part generator emits.

#include <cmath>
#include <iostream>
#include <string>
#include <vector>

#include "geometry_params.h"
#include "manifold/manifold.h"
#include "mesh_compiler.h"
#include "part_catalog.h"
#include "part_mesh.h"
#include "solid_compiler.h"
#include "solid_source.h"

namespace {

static int g_pass = 0;
static int g_fail = 0;

bool require(bool cond, const char *label) {
  if (cond) {
    std::cout << "  PASS: " << label << "\n";
    ++g_pass;
  } else {
    std::cout << "  FAIL: " << label << "\n";
    ++g_fail;
  }
  return cond;
}

bool near(double a, double b, double eps = 1e-4) { return std::fabs(a - b) < eps; }

void test_primitives() {
  std::cout << "\n[solid_compiler_test] primitives\n";
  manifold::Manifold m;
  std::string err;
  if (require(bricked::EvaluateSolidSource("cube([2, 3, 4]);", &m, &err), "cube evaluates")) {
    const manifold::Box box = m.BoundingBox();
    require(near(box.max.x, 2.0) && near(box.max.y, 3.0) && near(box.max.z, 4.0) && near(box.min.x, 0.0),
            "cube sits on the origin corner");
  }
  if (require(bricked::EvaluateSolidSource("translate([1, 0, 0]) cube(2, center=true);", &m, &err),
              "centered cube evaluates")) {
    const manifold::Box box = m.BoundingBox();
    require(near(box.min.x, 0.0) && near(box.max.x, 2.0) && near(box.min.z, -1.0), "translate applied");
  }
  const std::string union_src =
      "$fn = 16;\n"
      "union() {\n"
      "  cube([4, 4, 1]);\n"
      "  translate([2, 2, 1]) cylinder(d=2, h=3, center=false);\n"
      "}\n";
  if (require(bricked::EvaluateSolidSource(union_src, &m, &err), "union with cylinder evaluates")) {
    const manifold::Box box = m.BoundingBox();
    require(near(box.max.z, 4.0), "cylinder stacks on the cube");
    require(m.Genus() == 0, "union is one closed solid");
  }
  const std::string wedge =
      "polyhedron(points=[[0,0,0],[4,0,0],[4,4,0],[0,4,0],[0,0,4],[4,0,4]],\n"
      "           faces=[[0,1,2,3],[4,5,1,0],[1,5,2],[0,3,4],[4,3,2,5]]);\n";
  if (require(bricked::EvaluateSolidSource(wedge, &m, &err), "wedge polyhedron evaluates")) {
    require(!m.IsEmpty() && m.Status() == manifold::Manifold::Error::NoError, "wedge is valid");
  }
}

void test_errors() {
  std::cout << "\n[solid_compiler_test] errors\n";
  manifold::Manifold m;
  std::string err;
  require(!bricked::EvaluateSolidSource("cube([1, 1, 1]);\nsphere(3);", &m, &err), "unsupported module fails");
  require(err.rfind("phase=parse line=2", 0) == 0, "error names phase and line");
  require(!bricked::EvaluateSolidSource("cube([1, 1, 1]", &m, &err), "missing paren fails");
  require(!bricked::EvaluateSolidSource("// nothing here\n", &m, &err) &&
              err.rfind("phase=evaluate", 0) == 0,
          "empty source is an evaluate error");
  require(!bricked::EvaluateSolidSource("cube([0, 1, 1]);", &m, &err), "degenerate cube fails");
  require(!bricked::EvaluateSolidSource("x = 3;", &m, &err), "plain assignment is unsupported");
}

void test_catalog_sources() {
  std::cout << "\n[solid_compiler_test] catalog sources\n";
  const bricked::GeometryParameters params;
  size_t ok = 0;
  const bricked::PartKind *begin = bricked::PartCatalogBegin();
  for (size_t i = 0; i < bricked::PartCatalogSize(); ++i) {
    const bricked::PartKind &kind = begin[i];
    std::vector<uint8_t> bytes;
    std::string err;
    bricked::PartMesh mesh;
    if (bricked::CompileSolidSourceToStl(bricked::BuildPartSolidSource(kind, params), &bytes, &err) &&
        bricked::BuildPartMeshFromStl(bytes, &mesh, &err)) {
      ++ok;
    } else {
      std::cout << "  kind " << kind.id << ": " << err << "\n";
    }
  }
  require(ok == bricked::PartCatalogSize(), "every catalog kind compiles");

  std::vector<uint8_t> bytes;
  std::string err;
  bricked::PartMesh brick;
  const bricked::PartKind *kind = bricked::FindPartKind("2x4");
  if (require(bricked::CompileSolidSourceToStl(bricked::BuildPartSolidSource(*kind, params), &bytes, &err) &&
                  bricked::BuildPartMeshFromStl(bytes, &brick, &err),
              "2x4 brick compiles")) {
    // Scene frame: footprint on X/Z, height on Y.
    require(near(brick.bmax.x - brick.bmin.x, 16.0 - params.wallGap, 1e-3), "2 studs along X");
    require(near(brick.bmax.z - brick.bmin.z, 32.0 - params.wallGap, 1e-3), "4 studs along Z");
    require(near(brick.bmax.y - brick.bmin.y, 9.6 + params.studHeight, 1e-3), "height includes studs");
  }
  bricked::PartMesh tile;
  kind = bricked::FindPartKind("tile_2x2");
  if (require(bricked::CompileSolidSourceToStl(bricked::BuildPartSolidSource(*kind, params), &bytes, &err) &&
                  bricked::BuildPartMeshFromStl(bytes, &tile, &err),
              "tile compiles")) {
    require(near(tile.bmax.y - tile.bmin.y, 9.6 / 3.0, 1e-3), "tile has no studs");
  }
}

size_t count_studs(const char *kind_id) {
  const bricked::PartKind *kind = bricked::FindPartKind(kind_id);
  if (!kind) return (size_t)-1;
  const std::string source = bricked::BuildPartSolidSource(*kind, bricked::GeometryParameters{});
  size_t n = 0;
  for (size_t at = source.find("cylinder("); at != std::string::npos; at = source.find("cylinder(", at + 1)) ++n;
  return n;
}

void test_stud_layout() {
  std::cout << "\n[solid_compiler_test] stud layout\n";
  require(count_studs("2x4") == 8, "brick 2x4 has a stud per cell");
  require(count_studs("plate_1x1") == 1, "plate 1x1 has one stud");
  require(count_studs("slope_45_2x2") == 4, "slope 2x2 has a stud per cell");
  require(count_studs("slope_45_3x3") == 9, "slope 3x3 has a stud per cell");
  require(count_studs("tile_2x2") == 0, "tiles have no studs");

  const std::string slope = bricked::BuildPartSolidSource(*bricked::FindPartKind("slope_45_2x2"),
                                                          bricked::GeometryParameters{});
  require(slope.find("translate([12, 12, 9.6])") != std::string::npos, "slope studs sit at body height");
}

void test_compiler_queue() {
  std::cout << "\n[solid_compiler_test] compiler queue\n";
  bricked::ManifoldMeshCompiler compiler(2);
  int delivered = 0;
  int good = 0;
  compiler.Submit("cube([1, 1, 1]);", [&](const bricked::CompileResult &r) {
    ++delivered;
    if (r.ok && !r.bytes.empty()) ++good;
  });
  compiler.Submit("sphere(1);", [&](const bricked::CompileResult &r) {
    ++delivered;
    if (!r.ok && !r.error.empty()) ++good;
  });
  compiler.Submit("cube([2, 2, 2]);", [&](const bricked::CompileResult &r) {
    ++delivered;
    if (r.ok) ++good;
  });
  require(delivered == 0, "no callback before Poll");
  std::string err;
  require(bricked::DrainMeshCompiler(&compiler, 30 * 1000, &err), "drain finishes");
  require(delivered == 3 && good == 3, "every job delivered with the expected outcome");
  require(compiler.pending() == 0, "nothing pending afterwards");
}

}  // namespace

int main() {
  std::cout << "[solid_compiler_test] starting\n";
  test_primitives();
  test_errors();
  test_catalog_sources();
  test_stud_layout();
  test_compiler_queue();
  std::cout << "\n[solid_compiler_test] " << g_pass << " passed, " << g_fail << " failed\n";
  if (g_fail == 0) {
    std::cout << "[solid_compiler_test] PASS\n";
    return 0;
  }
  std::cout << "[solid_compiler_test] FAIL\n";
  return 1;
}
