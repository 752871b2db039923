#ifndef BRICKED_PART_MESH_H_
#define BRICKED_PART_MESH_H_

#include <cstddef>
#include <cstdint>
#include <string>
#include <vector>

#include "app_state.h"
#include "manifold/manifold.h"

namespace bricked {

// Render-ready mesh in the scene frame (Y up). vertProperties carry
// position followed by vertex normal, so numProp is 6.
struct PartMesh {
  manifold::MeshGL mesh;
  bricked_app::Vec3 bmin = {0.0f, 0.0f, 0.0f};
  bricked_app::Vec3 bmax = {0.0f, 0.0f, 0.0f};
};

constexpr int kPartMeshNumProp = 6;

// Decodes compiler output (binary or ASCII STL, Z up) into a PartMesh,
// rotating it into the scene frame with (x, y, z) -> (x, z, -y).
bool BuildPartMeshFromStl(const std::vector<uint8_t> &bytes, PartMesh *out, std::string *error);

// Converts a position-only mesh already in the scene frame.
bool BuildPartMesh(const manifold::MeshGL &positions, PartMesh *out, std::string *error);

// Box of one stud pitch by one brick height, centred on the origin.
PartMesh MakePlaceholderMesh();

inline bricked_app::Vec3 part_mesh_vertex(const PartMesh &m, uint32_t idx) {
  const size_t b = (size_t)idx * m.mesh.numProp;
  return {m.mesh.vertProperties[b + 0], m.mesh.vertProperties[b + 1], m.mesh.vertProperties[b + 2]};
}

}  // namespace bricked

#endif  // BRICKED_PART_MESH_H_
