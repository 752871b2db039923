#ifndef BRICKED_INSTRUCTION_TEXT_H_
#define BRICKED_INSTRUCTION_TEXT_H_

#include <cstddef>
#include <string>

#include "app_state.h"
#include "part.h"

namespace bricked {

// Coarse human colour name: yellow, red, green, blue, light gray, dark gray,
// purple, orange, or "colored" when nothing matches.
const char *ColorName(const bricked_app::Rgb &rgb);

// "brick 2×4", "plate 2×4", "tile 1×1", "slope 45 2x2".
std::string KindDisplayName(const PartKind &kind);

// Build-guide sentence for the step whose cursor is `step_cursor`.
std::string InstructionLine(const PartList &parts, size_t step_cursor);

// "#rrggbb", channels rounded to nearest and clamped.
std::string RgbToHex(const bricked_app::Rgb &rgb);
// Accepts "#rgb" and "#rrggbb", with or without the leading '#'.
bool HexToRgb(const std::string &hex, bricked_app::Rgb *out, std::string *error);

}  // namespace bricked

#endif  // BRICKED_INSTRUCTION_TEXT_H_
