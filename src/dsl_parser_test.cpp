// dsl_parser_test.cpp
//
// Build description parsing: grid and millimetre placement, rotation and
// colour fields, comments, and the skip-on-unknown-kind rule.

#include <cmath>
#include <iostream>
#include <string>
#include <vector>

#include "dsl_parser.h"
#include "part_catalog.h"

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

bool near(float a, float b) { return std::fabs(a - b) < 1e-4f; }

void test_grid_placement() {
  std::cout << "\n[dsl_parser_test] grid placement\n";
  const std::vector<bricked::Part> parts = bricked::ParseBuildDescription(
      "place(\"2x4\", xStud=1, yStud=2, zLevel=3, rotY=90, color=[0.1, 0.2, 0.9]);");
  if (!require(parts.size() == 1, "one part parsed")) return;
  const bricked::Part &p = parts[0];
  require(p.kind == bricked::FindPartKind("2x4"), "kind resolved from catalog");
  require(near(p.position.x, 8.0f), "xStud maps to X * pitch");
  require(near(p.position.z, 16.0f), "yStud maps to Z * pitch");
  require(near(p.position.y, 3.0f * 9.6f), "zLevel maps to Y * brick height");
  require(near(p.rotationDeg.y, 90.0f) && near(p.rotationDeg.x, 0.0f), "rotY is a yaw");
  require(near(p.color.b, 0.9f) && near(p.color.r, 0.1f), "color parsed");
  require(!p.id.empty(), "part id assigned");
}

void test_mm_wins_over_grid() {
  std::cout << "\n[dsl_parser_test] millimetre placement\n";
  const std::vector<bricked::Part> parts = bricked::ParseBuildDescription(
      "place(\"1x1\", xStud=5, yStud=5, zLevel=5, xMm=10.5, yMm=9.6, zMm=-3, rot=[0, 15, 30]);");
  if (!require(parts.size() == 1, "one part parsed")) return;
  const bricked::Part &p = parts[0];
  require(near(p.position.x, 10.5f) && near(p.position.y, 9.6f) && near(p.position.z, -3.0f),
          "explicit mm triple wins");
  require(near(p.rotationDeg.y, 15.0f) && near(p.rotationDeg.z, 30.0f), "rot vector parsed");

  const std::vector<bricked::Part> partial = bricked::ParseBuildDescription(
      "place(\"1x1\", xMm=10, yMm=4);");
  if (!require(partial.size() == 1, "partial mm triple still parses")) return;
  require(near(partial[0].position.x, 0.0f) && near(partial[0].position.y, 0.0f),
          "incomplete triple falls back to origin");
}

void test_defaults_and_skips() {
  std::cout << "\n[dsl_parser_test] defaults and skips\n";
  const std::string text =
      "// a comment with place(\"2x2\") inside\n"
      "/* place(\"2x2\");\n   place(\"2x2\"); */\n"
      "place(\"nope_9x9\", xStud=0, yStud=0, zLevel=0);\n"
      "place(\"plate_2x4\");\n"
      "place(\"slope_45_2x2\", color=[2, -1, 0.5]);\n";
  const std::vector<bricked::Part> parts = bricked::ParseBuildDescription(text);
  if (!require(parts.size() == 2, "comments removed and unknown kind skipped")) return;
  require(parts[0].kind == bricked::FindPartKind("plate_2x4"), "order preserved");
  require(near(parts[0].color.r, 0.8f) && near(parts[0].color.g, 0.1f), "default red");
  require(near(parts[0].position.x, 0.0f) && near(parts[0].position.y, 0.0f), "default origin");
  require(near(parts[1].color.r, 1.0f) && near(parts[1].color.g, 0.0f), "color channels clamped");
  require(parts[0].id != parts[1].id, "ids are unique");
}

void test_equivalent_encodings() {
  std::cout << "\n[dsl_parser_test] equivalent encodings\n";
  const std::string text =
      "place(\"2x4\", xStud=2, yStud=0, zLevel=0);\n"
      "place(\"2x4\", xMm=16, yMm=0, zMm=0);\n"
      "place(\"1x2\", xStud=0, yStud=1, zLevel=1, rotY=90);\n";
  const std::vector<bricked::Part> parts = bricked::ParseBuildDescription(text);
  if (!require(parts.size() == 3, "three parts parsed")) return;
  require(near(parts[0].position.x, 16.0f) && near(parts[0].position.y, 0.0f) && near(parts[0].position.z, 0.0f),
          "grid units give (16, 0, 0)");
  require(near(parts[0].position.x, parts[1].position.x) && near(parts[0].position.z, parts[1].position.z),
          "grid and millimetre encodings agree");

  const std::vector<bricked::Part> again = bricked::ParseBuildDescription(text);
  bool same = again.size() == parts.size();
  for (size_t i = 0; same && i < parts.size(); ++i) {
    same = again[i].kind == parts[i].kind && near(again[i].position.x, parts[i].position.x) &&
           near(again[i].position.y, parts[i].position.y) && near(again[i].position.z, parts[i].position.z) &&
           near(again[i].rotationDeg.y, parts[i].rotationDeg.y);
  }
  require(same, "parsing twice gives the same parts in the same order");
  require(again[0].id != parts[0].id, "each parse issues fresh ids");
}

void test_empty() {
  std::cout << "\n[dsl_parser_test] empty input\n";
  require(bricked::ParseBuildDescription("").empty(), "empty text gives no parts");
  require(bricked::ParseBuildDescription("cube([1,2,3]);").empty(), "foreign statements ignored");
  require(bricked::StripDescriptionComments("a // b\nc") == "a \nc", "line comment stripped to newline");
}

}  // namespace

int main() {
  std::cout << "[dsl_parser_test] starting\n";
  test_grid_placement();
  test_mm_wins_over_grid();
  test_defaults_and_skips();
  test_equivalent_encodings();
  test_empty();
  std::cout << "\n[dsl_parser_test] " << g_pass << " passed, " << g_fail << " failed\n";
  if (g_fail == 0) {
    std::cout << "[dsl_parser_test] PASS\n";
    return 0;
  }
  std::cout << "[dsl_parser_test] FAIL\n";
  return 1;
}
