#include "stl_codec.h"

#include <cctype>
#include <cmath>
#include <cstdio>
#include <cstdlib>
#include <cstring>
#include <string_view>

namespace bricked {

namespace {

constexpr size_t kBinaryHeaderSize = 80;
constexpr size_t kBinaryFacetSize = 50;
constexpr char kHeaderText[] = "bricked binary stl";

bool set_err(std::string *error, const std::string &msg) {
  if (error) *error = msg;
  return false;
}

template <typename T>
void append_pod(std::vector<uint8_t> *out, const T &v) {
  const size_t at = out->size();
  out->resize(at + sizeof(T));
  std::memcpy(out->data() + at, &v, sizeof(T));
}

struct Vec3f {
  float x;
  float y;
  float z;
};

Vec3f fetch_vertex(const manifold::MeshGL &mesh, uint32_t idx) {
  const size_t b = (size_t)idx * mesh.numProp;
  return {mesh.vertProperties[b + 0], mesh.vertProperties[b + 1], mesh.vertProperties[b + 2]};
}

Vec3f facet_normal(const Vec3f &a, const Vec3f &b, const Vec3f &c) {
  const Vec3f u = {b.x - a.x, b.y - a.y, b.z - a.z};
  const Vec3f v = {c.x - a.x, c.y - a.y, c.z - a.z};
  Vec3f n = {u.y * v.z - u.z * v.y, u.z * v.x - u.x * v.z, u.x * v.y - u.y * v.x};
  const float len = std::sqrt(n.x * n.x + n.y * n.y + n.z * n.z);
  if (len <= 0.0f) return {0.0f, 0.0f, 0.0f};
  n.x /= len;
  n.y /= len;
  n.z /= len;
  return n;
}

void push_vertex(manifold::MeshGL *mesh, float x, float y, float z) {
  const uint32_t idx = (uint32_t)(mesh->vertProperties.size() / 3);
  mesh->vertProperties.push_back(x);
  mesh->vertProperties.push_back(y);
  mesh->vertProperties.push_back(z);
  mesh->triVerts.push_back(idx);
}

bool decode_binary(const uint8_t *bytes, size_t size, manifold::MeshGL *out, std::string *error) {
  uint32_t count = 0;
  std::memcpy(&count, bytes + kBinaryHeaderSize, sizeof(count));
  if (kBinaryHeaderSize + 4 + (size_t)count * kBinaryFacetSize > size) {
    return set_err(error, "STL decode failed: binary facet table is truncated.");
  }
  out->vertProperties.reserve((size_t)count * 9);
  out->triVerts.reserve((size_t)count * 3);
  const uint8_t *p = bytes + kBinaryHeaderSize + 4;
  for (uint32_t i = 0; i < count; ++i) {
    float f[12];
    std::memcpy(f, p, sizeof(f));
    for (int v = 0; v < 3; ++v) {
      const float x = f[3 + v * 3 + 0];
      const float y = f[3 + v * 3 + 1];
      const float z = f[3 + v * 3 + 2];
      if (!std::isfinite(x) || !std::isfinite(y) || !std::isfinite(z)) {
        return set_err(error, "STL decode failed: non-finite vertex in facet " + std::to_string(i) + ".");
      }
      push_vertex(out, x, y, z);
    }
    p += kBinaryFacetSize;
  }
  return true;
}

bool next_token(std::string_view s, size_t *off, std::string_view *tok) {
  size_t p = *off;
  while (p < s.size() && std::isspace((unsigned char)s[p])) ++p;
  if (p >= s.size()) return false;
  const size_t b = p;
  while (p < s.size() && !std::isspace((unsigned char)s[p])) ++p;
  *tok = s.substr(b, p - b);
  *off = p;
  return true;
}

bool decode_ascii(const uint8_t *bytes, size_t size, manifold::MeshGL *out, std::string *error) {
  const std::string_view s((const char *)bytes, size);
  size_t off = 0;
  std::string_view tok;
  size_t corner = 0;
  while (next_token(s, &off, &tok)) {
    if (tok != "vertex") continue;
    float xyz[3];
    for (int k = 0; k < 3; ++k) {
      std::string_view num;
      if (!next_token(s, &off, &num)) return set_err(error, "STL decode failed: truncated ASCII vertex.");
      const std::string text(num);
      char *end = nullptr;
      xyz[k] = std::strtof(text.c_str(), &end);
      if (end == text.c_str() || !std::isfinite(xyz[k])) {
        return set_err(error, "STL decode failed: invalid ASCII vertex coordinate '" + text + "'.");
      }
    }
    push_vertex(out, xyz[0], xyz[1], xyz[2]);
    ++corner;
  }
  if (corner % 3 != 0) return set_err(error, "STL decode failed: ASCII facet with fewer than three vertices.");
  return true;
}

}  // namespace

bool EncodeBinaryStl(const manifold::MeshGL &mesh, std::vector<uint8_t> *out, std::string *error) {
  if (!out) return set_err(error, "STL encode failed: null output buffer.");
  out->clear();
  const uint32_t tri_count = (uint32_t)mesh.NumTri();
  if (tri_count == 0 || mesh.numProp < 3) return set_err(error, "STL encode failed: mesh is empty.");

  out->reserve(kBinaryHeaderSize + 4 + (size_t)tri_count * kBinaryFacetSize);
  uint8_t header[kBinaryHeaderSize] = {};
  std::memcpy(header, kHeaderText, sizeof(kHeaderText) - 1);
  out->insert(out->end(), header, header + kBinaryHeaderSize);
  append_pod(out, tri_count);

  for (uint32_t tri = 0; tri < tri_count; ++tri) {
    const Vec3f v0 = fetch_vertex(mesh, mesh.triVerts[tri * 3 + 0]);
    const Vec3f v1 = fetch_vertex(mesh, mesh.triVerts[tri * 3 + 1]);
    const Vec3f v2 = fetch_vertex(mesh, mesh.triVerts[tri * 3 + 2]);
    const Vec3f n = facet_normal(v0, v1, v2);
    append_pod(out, n);
    append_pod(out, v0);
    append_pod(out, v1);
    append_pod(out, v2);
    const uint16_t attr = 0;
    append_pod(out, attr);
  }
  return true;
}

bool WriteBinaryStlFile(const char *path, const manifold::MeshGL &mesh, std::string *error) {
  if (!path || path[0] == '\0') return set_err(error, "Output path is empty.");
  std::vector<uint8_t> bytes;
  if (!EncodeBinaryStl(mesh, &bytes, error)) return false;
  std::FILE *f = std::fopen(path, "wb");
  if (!f) return set_err(error, std::string("STL export failed: cannot open ") + path);
  const size_t written = std::fwrite(bytes.data(), 1, bytes.size(), f);
  const bool closed = std::fclose(f) == 0;
  if (written != bytes.size() || !closed) return set_err(error, std::string("STL export failed: write error on ") + path);
  return true;
}

bool DecodeStl(const uint8_t *bytes, size_t size, manifold::MeshGL *out, std::string *error) {
  if (!out) return set_err(error, "STL decode failed: null output mesh.");
  *out = manifold::MeshGL();
  out->numProp = 3;
  if (!bytes || size == 0) return set_err(error, "STL decode failed: empty input.");

  // Binary files may also start with "solid", so the size check comes first.
  if (size >= kBinaryHeaderSize + 4) {
    uint32_t count = 0;
    std::memcpy(&count, bytes + kBinaryHeaderSize, sizeof(count));
    if (kBinaryHeaderSize + 4 + (size_t)count * kBinaryFacetSize == size) {
      if (!decode_binary(bytes, size, out, error)) return false;
      if (out->NumTri() == 0) return set_err(error, "STL decode failed: mesh has no facets.");
      return true;
    }
  }
  if (size >= 5 && std::memcmp(bytes, "solid", 5) == 0) {
    if (!decode_ascii(bytes, size, out, error)) return false;
    if (out->NumTri() == 0) return set_err(error, "STL decode failed: mesh has no facets.");
    return true;
  }
  return set_err(error, "STL decode failed: input is neither binary nor ASCII STL.");
}

}  // namespace bricked
