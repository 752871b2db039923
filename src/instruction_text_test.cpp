// instruction_text_test.cpp

#include <iostream>
#include <string>
#include <vector>

#include "instruction_text.h"
#include "part.h"
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

bricked::Part make_part(const char *kind, bricked_app::Rgb color) {
  bricked::Part part;
  part.id = bricked::MakePartId();
  part.kind = bricked::FindPartKind(kind);
  part.color = color;
  return part;
}

void test_names() {
  std::cout << "\n[instruction_text_test] names\n";
  require(std::string(bricked::ColorName({0.9f, 0.85f, 0.1f})) == "yellow", "yellow");
  require(std::string(bricked::ColorName({0.8f, 0.1f, 0.1f})) == "red", "red");
  require(std::string(bricked::ColorName({0.1f, 0.8f, 0.2f})) == "green", "green");
  require(std::string(bricked::ColorName({0.1f, 0.3f, 0.9f})) == "blue", "blue");
  require(std::string(bricked::ColorName({0.9f, 0.9f, 0.9f})) == "light gray", "light gray");
  require(std::string(bricked::ColorName({0.1f, 0.1f, 0.1f})) == "dark gray", "dark gray");
  require(std::string(bricked::ColorName({0.7f, 0.2f, 0.7f})) == "purple", "purple");
  require(std::string(bricked::ColorName({0.9f, 0.5f, 0.1f})) == "orange", "orange");
  require(std::string(bricked::ColorName({0.5f, 0.5f, 0.5f})) == "colored", "fallback");

  require(bricked::KindDisplayName(*bricked::FindPartKind("2x4")) == "brick 2\xC3\x97" "4", "brick name");
  require(bricked::KindDisplayName(*bricked::FindPartKind("plate_2x4")) == "plate 2\xC3\x97" "4", "plate name");
  require(bricked::KindDisplayName(*bricked::FindPartKind("tile_1x1")) == "tile 1\xC3\x97" "1", "tile name");
  require(bricked::KindDisplayName(*bricked::FindPartKind("slope_45_2x2")) == "slope 45 2x2", "slope name");
}

void test_instruction_line() {
  std::cout << "\n[instruction_text_test] instruction line\n";
  bricked::PartList empty;
  require(bricked::InstructionLine(empty, 0) == "Add parts to the description to generate a build guide.",
          "empty list prompt");

  bricked::PartList parts({make_part("2x4", {0.1f, 0.3f, 0.9f}), make_part("plate_2x2", {0.9f, 0.85f, 0.1f})});
  require(bricked::InstructionLine(parts, 0) == "Press Enter to reveal step 1.", "cursor 0 prompt");
  require(bricked::InstructionLine(parts, 1) == "Place the blue brick 2\xC3\x97" "4 where highlighted.",
          "step 1 names the first part");
  require(bricked::InstructionLine(parts, 7) == "Place the yellow plate 2\xC3\x97" "2 where highlighted.",
          "cursor past the end names the last part");
}

void test_hex() {
  std::cout << "\n[instruction_text_test] hex colours\n";
  require(bricked::RgbToHex({1.0f, 0.0f, 0.5f}) == "#ff0080", "rgb to hex");
  bricked_app::Rgb rgb = {0.0f, 0.0f, 0.0f};
  std::string err;
  require(bricked::HexToRgb("#0f0", &rgb, &err) && rgb.g == 1.0f && rgb.r == 0.0f, "short form");
  require(bricked::HexToRgb("3366CC", &rgb, &err) && bricked::RgbToHex(rgb) == "#3366cc", "long form without #");
  require(!bricked::HexToRgb("#12345", &rgb, &err) && !err.empty(), "bad length rejected");
  require(!bricked::HexToRgb("#zz0000", &rgb, &err), "bad digit rejected");
}

}  // namespace

int main() {
  std::cout << "[instruction_text_test] starting\n";
  test_names();
  test_instruction_line();
  test_hex();
  std::cout << "\n[instruction_text_test] " << g_pass << " passed, " << g_fail << " failed\n";
  if (g_fail == 0) {
    std::cout << "[instruction_text_test] PASS\n";
    return 0;
  }
  std::cout << "[instruction_text_test] FAIL\n";
  return 1;
}
