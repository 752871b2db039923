#include "part_mesh.h"

#include <algorithm>
#include <cmath>
#include <limits>

#include "log.h"
#include "part_catalog.h"
#include "stl_codec.h"

namespace bricked {

namespace {

bool set_err(std::string *error, const std::string &msg) {
  if (error) *error = msg;
  return false;
}

bool compute_bounds(const manifold::MeshGL &mesh, bricked_app::Vec3 *out_min, bricked_app::Vec3 *out_max) {
  if (mesh.numProp < 3 || mesh.vertProperties.empty()) return false;
  const size_t count = mesh.vertProperties.size() / mesh.numProp;
  float minx = std::numeric_limits<float>::infinity();
  float miny = std::numeric_limits<float>::infinity();
  float minz = std::numeric_limits<float>::infinity();
  float maxx = -std::numeric_limits<float>::infinity();
  float maxy = -std::numeric_limits<float>::infinity();
  float maxz = -std::numeric_limits<float>::infinity();
  for (size_t i = 0; i < count; ++i) {
    const size_t b = i * mesh.numProp;
    const float x = mesh.vertProperties[b + 0];
    const float y = mesh.vertProperties[b + 1];
    const float z = mesh.vertProperties[b + 2];
    if (!std::isfinite(x) || !std::isfinite(y) || !std::isfinite(z)) continue;
    minx = std::min(minx, x);
    miny = std::min(miny, y);
    minz = std::min(minz, z);
    maxx = std::max(maxx, x);
    maxy = std::max(maxy, y);
    maxz = std::max(maxz, z);
  }
  if (!std::isfinite(minx) || !std::isfinite(maxx)) return false;
  *out_min = {minx, miny, minz};
  *out_max = {maxx, maxy, maxz};
  return true;
}

// Area-weighted vertex normals; unshared vertices end up with facet normals.
void fill_normals(manifold::MeshGL *mesh) {
  const size_t count = mesh->vertProperties.size() / kPartMeshNumProp;
  std::vector<bricked_app::Vec3> acc(count, {0.0f, 0.0f, 0.0f});
  const size_t tris = mesh->triVerts.size() / 3;
  for (size_t t = 0; t < tris; ++t) {
    uint32_t idx[3];
    bricked_app::Vec3 p[3];
    for (int k = 0; k < 3; ++k) {
      idx[k] = mesh->triVerts[t * 3 + k];
      const size_t b = (size_t)idx[k] * kPartMeshNumProp;
      p[k] = {mesh->vertProperties[b + 0], mesh->vertProperties[b + 1], mesh->vertProperties[b + 2]};
    }
    const bricked_app::Vec3 n = bricked_app::cross(bricked_app::sub(p[1], p[0]), bricked_app::sub(p[2], p[0]));
    for (int k = 0; k < 3; ++k) acc[idx[k]] = bricked_app::add(acc[idx[k]], n);
  }
  for (size_t i = 0; i < count; ++i) {
    const bricked_app::Vec3 n = bricked_app::normalize(acc[i]);
    float *v = &mesh->vertProperties[i * kPartMeshNumProp];
    v[3] = n.x;
    v[4] = n.y;
    v[5] = n.z;
  }
}

bool finish(manifold::MeshGL positions, bool z_up, PartMesh *out, std::string *error) {
  if (!out) return set_err(error, "Part mesh output is null.");
  if (positions.numProp < 3 || positions.NumTri() == 0) return set_err(error, "Part mesh is empty.");
  const size_t count = positions.vertProperties.size() / positions.numProp;
  for (uint32_t v : positions.triVerts) {
    if (v >= count) return set_err(error, "Part mesh triangle index out of range.");
  }

  manifold::MeshGL mesh;
  mesh.numProp = kPartMeshNumProp;
  mesh.vertProperties.resize(count * kPartMeshNumProp, 0.0f);
  for (size_t i = 0; i < count; ++i) {
    const float *src = &positions.vertProperties[i * positions.numProp];
    float *dst = &mesh.vertProperties[i * kPartMeshNumProp];
    dst[0] = src[0];
    dst[1] = z_up ? src[2] : src[1];
    dst[2] = z_up ? -src[1] : src[2];
  }
  mesh.triVerts = std::move(positions.triVerts);
  fill_normals(&mesh);

  PartMesh part;
  part.mesh = std::move(mesh);
  if (!compute_bounds(part.mesh, &part.bmin, &part.bmax)) return set_err(error, "Part mesh has no finite vertices.");
  *out = std::move(part);
  return true;
}

}  // namespace

bool BuildPartMeshFromStl(const std::vector<uint8_t> &bytes, PartMesh *out, std::string *error) {
  manifold::MeshGL positions;
  if (!DecodeStl(bytes.data(), bytes.size(), &positions, error)) return false;
  return finish(std::move(positions), true, out, error);
}

bool BuildPartMesh(const manifold::MeshGL &positions, PartMesh *out, std::string *error) {
  return finish(positions, false, out, error);
}

PartMesh MakePlaceholderMesh() {
  const manifold::MeshGL box = manifold::Manifold::Cube(
      manifold::vec3(kStudPitch, kBrickHeight, kStudPitch), true).GetMeshGL();
  // Unshared corners keep the box faces flat-shaded.
  manifold::MeshGL soup;
  soup.numProp = 3;
  soup.vertProperties.reserve(box.triVerts.size() * 3);
  soup.triVerts.reserve(box.triVerts.size());
  for (uint32_t v : box.triVerts) {
    const size_t b = (size_t)v * box.numProp;
    soup.triVerts.push_back((uint32_t)(soup.vertProperties.size() / 3));
    soup.vertProperties.push_back(box.vertProperties[b + 0]);
    soup.vertProperties.push_back(box.vertProperties[b + 1]);
    soup.vertProperties.push_back(box.vertProperties[b + 2]);
  }
  PartMesh out;
  std::string error;
  if (!BuildPartMesh(soup, &out, &error)) log_event("PLACEHOLDER_MESH_FAILED", 0, error);
  return out;
}

}  // namespace bricked
