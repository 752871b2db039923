#include "instruction_text.h"

#include <algorithm>
#include <cctype>
#include <cmath>
#include <cstdio>
#include <cstring>

namespace bricked {

namespace {

constexpr char kTimes[] = "\xC3\x97";

std::string replace_first_x(std::string s) {
  const size_t x = s.find('x');
  if (x != std::string::npos) s.replace(x, 1, kTimes);
  return s;
}

int hex_digit(char c) {
  if (c >= '0' && c <= '9') return c - '0';
  c = (char)std::tolower((unsigned char)c);
  if (c >= 'a' && c <= 'f') return 10 + (c - 'a');
  return -1;
}

}  // namespace

const char *ColorName(const bricked_app::Rgb &rgb) {
  const float r = rgb.r, g = rgb.g, b = rgb.b;
  if (r > 0.7f && g > 0.7f && b < 0.35f) return "yellow";
  if (r > 0.75f && g < 0.35f && b < 0.35f) return "red";
  if (g > 0.65f && r < 0.45f && b < 0.55f) return "green";
  if (b > 0.7f && r < 0.45f && g < 0.6f) return "blue";
  if (r > 0.6f && g > 0.6f && b > 0.6f) return "light gray";
  if (r < 0.35f && g < 0.35f && b < 0.35f) return "dark gray";
  if (r > 0.6f && b > 0.6f && g < 0.5f) return "purple";
  if (r > 0.7f && g > 0.4f && b < 0.3f) return "orange";
  return "colored";
}

std::string KindDisplayName(const PartKind &kind) {
  const std::string id = kind.id;
  switch (kind.category) {
    case PartCategory::Plate: return "plate " + replace_first_x(id.substr(std::strlen("plate_")));
    case PartCategory::Tile: return "tile " + replace_first_x(id.substr(std::strlen("tile_")));
    case PartCategory::Slope: {
      std::string out = id;
      std::replace(out.begin(), out.end(), '_', ' ');
      return out;
    }
    case PartCategory::Brick:
    default: return "brick " + replace_first_x(id);
  }
}

std::string InstructionLine(const PartList &parts, size_t step_cursor) {
  if (parts.empty()) return "Add parts to the description to generate a build guide.";
  const size_t visible = std::min(step_cursor, parts.size());
  if (visible == 0) return "Press Enter to reveal step 1.";
  const Part &part = parts[visible - 1];
  if (!part.kind) return "Press Enter to continue.";
  return std::string("Place the ") + ColorName(part.color) + " " + KindDisplayName(*part.kind) +
         " where highlighted.";
}

std::string RgbToHex(const bricked_app::Rgb &rgb) {
  auto to = [](float v) {
    const long n = std::lround((double)v * 255.0);
    return (int)std::clamp(n, 0L, 255L);
  };
  char buf[8];
  std::snprintf(buf, sizeof(buf), "#%02x%02x%02x", to(rgb.r), to(rgb.g), to(rgb.b));
  return std::string(buf);
}

bool HexToRgb(const std::string &hex, bricked_app::Rgb *out, std::string *error) {
  std::string h = (!hex.empty() && hex[0] == '#') ? hex.substr(1) : hex;
  if (h.size() == 3) h = {h[0], h[0], h[1], h[1], h[2], h[2]};
  if (h.size() != 6) {
    if (error) *error = "Colour must be #rgb or #rrggbb: " + hex;
    return false;
  }
  int channel[3];
  for (int i = 0; i < 3; ++i) {
    const int hi = hex_digit(h[i * 2]);
    const int lo = hex_digit(h[i * 2 + 1]);
    if (hi < 0 || lo < 0) {
      if (error) *error = "Colour has a non-hex digit: " + hex;
      return false;
    }
    channel[i] = hi * 16 + lo;
  }
  if (out) *out = {channel[0] / 255.0f, channel[1] / 255.0f, channel[2] / 255.0f};
  return true;
}

}  // namespace bricked
