#include "dsl_parser.h"

#include <algorithm>
#include <cctype>
#include <cstdlib>
#include <optional>
#include <string_view>

namespace bricked {

namespace {

constexpr bricked_app::Rgb kDefaultColor = {0.8f, 0.1f, 0.1f};

bool is_ident_char(char c) {
  return std::isalnum((unsigned char)c) != 0 || c == '_' || c == '$';
}

bool is_space(char c) { return std::isspace((unsigned char)c) != 0; }

size_t skip_space(std::string_view s, size_t off) {
  while (off < s.size() && is_space(s[off])) ++off;
  return off;
}

bool iequals_at(std::string_view s, size_t off, std::string_view word) {
  if (off + word.size() > s.size()) return false;
  for (size_t i = 0; i < word.size(); ++i) {
    if (std::tolower((unsigned char)s[off + i]) != std::tolower((unsigned char)word[i])) return false;
  }
  return true;
}

std::string_view trim(std::string_view s) {
  size_t b = 0;
  size_t e = s.size();
  while (b < e && is_space(s[b])) ++b;
  while (e > b && is_space(s[e - 1])) --e;
  return s.substr(b, e - b);
}

// Number grammar: [-+]?\d*\.?\d+
bool scan_number(std::string_view s, size_t *off, double *out) {
  size_t p = *off;
  const size_t start = p;
  if (p < s.size() && (s[p] == '-' || s[p] == '+')) ++p;
  size_t int_digits = 0;
  while (p < s.size() && std::isdigit((unsigned char)s[p])) {
    ++p;
    ++int_digits;
  }
  size_t frac_digits = 0;
  if (p + 1 < s.size() && s[p] == '.' && std::isdigit((unsigned char)s[p + 1])) {
    ++p;
    while (p < s.size() && std::isdigit((unsigned char)s[p])) {
      ++p;
      ++frac_digits;
    }
  }
  if (int_digits == 0 && frac_digits == 0) return false;
  const std::string text(s.substr(start, p - start));
  *out = std::strtod(text.c_str(), nullptr);
  *off = p;
  return true;
}

// Finds `name` as a whole identifier followed by `=`; returns the offset just
// after the `=` and any whitespace. Later occurrences are tried when an
// earlier one does not continue with a usable value.
template <typename ValueScanner>
bool find_field(std::string_view args, std::string_view name, ValueScanner scan) {
  size_t off = 0;
  while (off + name.size() <= args.size()) {
    if (!iequals_at(args, off, name) ||
        (off > 0 && is_ident_char(args[off - 1]))) {
      ++off;
      continue;
    }
    size_t p = off + name.size();
    if (p < args.size() && is_ident_char(args[p])) {
      ++off;
      continue;
    }
    p = skip_space(args, p);
    if (p < args.size() && args[p] == '=') {
      p = skip_space(args, p + 1);
      if (scan(p)) return true;
    }
    ++off;
  }
  return false;
}

std::optional<double> field_number(std::string_view args, std::string_view name) {
  double value = 0.0;
  const bool found = find_field(args, name, [&](size_t p) {
    return scan_number(args, &p, &value);
  });
  if (!found) return std::nullopt;
  return value;
}

std::optional<bricked_app::Vec3> field_vec3(std::string_view args, std::string_view name) {
  double v[3] = {0.0, 0.0, 0.0};
  const bool found = find_field(args, name, [&](size_t p) {
    if (p >= args.size() || args[p] != '[') return false;
    ++p;
    for (int i = 0; i < 3; ++i) {
      p = skip_space(args, p);
      if (!scan_number(args, &p, &v[i])) return false;
      p = skip_space(args, p);
      const char want = (i < 2) ? ',' : ']';
      if (p >= args.size() || args[p] != want) return false;
      ++p;
    }
    return true;
  });
  if (!found) return std::nullopt;
  return bricked_app::Vec3{(float)v[0], (float)v[1], (float)v[2]};
}

struct Statement {
  std::string_view kind;
  std::string_view args;
};

// Matches `place ( "<kind>" , <args> )` at `off`, where <args> ends at the
// first closing parenthesis. `brick` is accepted for older descriptions and
// the quotes around <kind> are optional.
bool match_statement(std::string_view src, size_t off, Statement *out, size_t *end) {
  size_t p = off;
  if (iequals_at(src, p, "place")) {
    p += 5;
  } else if (iequals_at(src, p, "brick")) {
    p += 5;
  } else {
    return false;
  }
  if (p < src.size() && is_ident_char(src[p])) return false;
  p = skip_space(src, p);
  if (p >= src.size() || src[p] != '(') return false;
  p = skip_space(src, p + 1);

  size_t kind_begin = p;
  size_t kind_end = p;
  if (p < src.size() && src[p] == '"') {
    kind_begin = p + 1;
    kind_end = kind_begin;
    while (kind_end < src.size() && src[kind_end] != '"' && src[kind_end] != '\n') ++kind_end;
    if (kind_end >= src.size() || src[kind_end] != '"') return false;
    p = kind_end + 1;
  } else {
    while (kind_end < src.size() && is_ident_char(src[kind_end])) ++kind_end;
    if (kind_end == kind_begin) return false;
    p = kind_end;
  }

  p = skip_space(src, p);
  size_t args_begin = p;
  size_t args_end = p;
  if (p < src.size() && src[p] == ',') {
    args_begin = p + 1;
    args_end = src.find(')', args_begin);
    if (args_end == std::string_view::npos) return false;
    p = args_end + 1;
  } else if (p < src.size() && src[p] == ')') {
    p += 1;
  } else {
    return false;
  }

  out->kind = trim(src.substr(kind_begin, kind_end - kind_begin));
  out->args = src.substr(args_begin, args_end - args_begin);
  *end = p;
  return true;
}

Part build_part(const PartKind *kind, std::string_view args) {
  Part part;
  part.id = MakePartId();
  part.kind = kind;

  const std::optional<double> x_mm = field_number(args, "xMm");
  const std::optional<double> y_mm = field_number(args, "yMm");
  const std::optional<double> z_mm = field_number(args, "zMm");
  const std::optional<double> x_stud = field_number(args, "xStud");
  const std::optional<double> y_stud = field_number(args, "yStud");
  const std::optional<double> z_level = field_number(args, "zLevel");

  if (x_mm && y_mm && z_mm) {
    part.position = {(float)*x_mm, (float)*y_mm, (float)*z_mm};
  } else if (x_stud && y_stud && z_level) {
    part.position = {(float)(*x_stud * kStudPitch),
                     (float)(*z_level * kBrickHeight),
                     (float)(*y_stud * kStudPitch)};
  }

  if (const std::optional<bricked_app::Vec3> rot = field_vec3(args, "rot")) {
    part.rotationDeg = *rot;
  } else if (const std::optional<double> yaw = field_number(args, "rotY")) {
    part.rotationDeg = {0.0f, (float)*yaw, 0.0f};
  }

  if (const std::optional<bricked_app::Vec3> col = field_vec3(args, "color")) {
    part.color = {bricked_app::clampf(col->x, 0.0f, 1.0f),
                  bricked_app::clampf(col->y, 0.0f, 1.0f),
                  bricked_app::clampf(col->z, 0.0f, 1.0f)};
  } else {
    part.color = kDefaultColor;
  }
  return part;
}

}  // namespace

std::string StripDescriptionComments(const std::string &src) {
  std::string no_block;
  no_block.reserve(src.size());
  size_t off = 0;
  while (off < src.size()) {
    const size_t open = src.find("/*", off);
    if (open == std::string::npos) break;
    const size_t close = src.find("*/", open + 2);
    if (close == std::string::npos) break;
    no_block.append(src, off, open - off);
    off = close + 2;
  }
  no_block.append(src, off, std::string::npos);

  std::string out;
  out.reserve(no_block.size());
  off = 0;
  while (off < no_block.size()) {
    const size_t slash = no_block.find("//", off);
    if (slash == std::string::npos) {
      out.append(no_block, off, std::string::npos);
      break;
    }
    out.append(no_block, off, slash - off);
    const size_t eol = no_block.find('\n', slash);
    if (eol == std::string::npos) break;
    off = eol;
  }
  return out;
}

std::vector<Part> ParseBuildDescription(const std::string &text) {
  const std::string src = StripDescriptionComments(text);
  const std::string_view view(src);
  std::vector<Part> parts;

  size_t off = 0;
  while (off < view.size()) {
    if (off > 0 && is_ident_char(view[off - 1])) {
      ++off;
      continue;
    }
    Statement stmt;
    size_t end = 0;
    if (!match_statement(view, off, &stmt, &end)) {
      ++off;
      continue;
    }
    off = end;
    const PartKind *kind = FindPartKind(stmt.kind);
    if (!kind) continue;
    parts.push_back(build_part(kind, stmt.args));
  }
  return parts;
}

}  // namespace bricked
