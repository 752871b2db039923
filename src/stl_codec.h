#ifndef BRICKED_STL_CODEC_H_
#define BRICKED_STL_CODEC_H_

#include <cstddef>
#include <cstdint>
#include <string>
#include <vector>

#include "manifold/manifold.h"

namespace bricked {

// Writes positions (first three properties) of `mesh` as binary STL with
// per-facet normals.
bool EncodeBinaryStl(const manifold::MeshGL &mesh, std::vector<uint8_t> *out, std::string *error);

bool WriteBinaryStlFile(const char *path, const manifold::MeshGL &mesh, std::string *error);

// Accepts binary and ASCII STL. The result is an unindexed triangle soup
// (numProp = 3, three fresh vertices per facet), which keeps facet normals
// sharp once vertex normals are derived.
bool DecodeStl(const uint8_t *bytes, size_t size, manifold::MeshGL *out, std::string *error);

}  // namespace bricked

#endif  // BRICKED_STL_CODEC_H_
