// stl_codec_test.cpp

#include <cmath>
#include <cstring>
#include <iostream>
#include <string>
#include <vector>

#include "manifold/manifold.h"
#include "stl_codec.h"

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

void test_binary() {
  std::cout << "\n[stl_codec_test] binary\n";
  const manifold::MeshGL cube = manifold::Manifold::Cube(manifold::vec3(2.0, 3.0, 4.0)).GetMeshGL();
  std::vector<uint8_t> bytes;
  std::string err;
  if (!require(bricked::EncodeBinaryStl(cube, &bytes, &err), "encode cube")) return;
  require(bytes.size() == 84 + 50 * cube.NumTri(), "size is header + count + facets");
  uint32_t count = 0;
  std::memcpy(&count, bytes.data() + 80, sizeof(count));
  require(count == cube.NumTri(), "facet count in header");

  manifold::MeshGL decoded;
  if (!require(bricked::DecodeStl(bytes.data(), bytes.size(), &decoded, &err), "decode binary")) return;
  require(decoded.NumTri() == cube.NumTri(), "triangle count survives");
  require(decoded.NumVert() == 3 * decoded.NumTri(), "decoded mesh is an unindexed soup");
  float max_z = 0.0f;
  for (size_t i = 0; i < decoded.NumVert(); ++i) max_z = std::fmax(max_z, decoded.vertProperties[i * 3 + 2]);
  require(std::fabs(max_z - 4.0f) < 1e-5f, "coordinates survive");
}

void test_ascii() {
  std::cout << "\n[stl_codec_test] ascii\n";
  const std::string text =
      "solid t\n"
      "  facet normal 0 0 1\n"
      "    outer loop\n"
      "      vertex 0 0 0\n"
      "      vertex 1 0 0\n"
      "      vertex 0 1 0\n"
      "    endloop\n"
      "  endfacet\n"
      "endsolid t\n";
  manifold::MeshGL decoded;
  std::string err;
  require(bricked::DecodeStl((const uint8_t *)text.data(), text.size(), &decoded, &err), "decode ascii");
  require(decoded.NumTri() == 1, "one facet");
  require(decoded.numProp == 3, "positions only");
}

void test_rejects() {
  std::cout << "\n[stl_codec_test] rejects\n";
  manifold::MeshGL decoded;
  std::string err;
  const std::string junk = "not an stl at all";
  require(!bricked::DecodeStl((const uint8_t *)junk.data(), junk.size(), &decoded, &err) && !err.empty(),
          "junk rejected with a message");
  require(!bricked::DecodeStl(nullptr, 0, &decoded, &err), "empty input rejected");
  const std::string empty_solid = "solid x\nendsolid x\n";
  require(!bricked::DecodeStl((const uint8_t *)empty_solid.data(), empty_solid.size(), &decoded, &err),
          "facetless ascii rejected");
  manifold::MeshGL empty;
  std::vector<uint8_t> bytes;
  require(!bricked::EncodeBinaryStl(empty, &bytes, &err), "empty mesh not encoded");
}

}  // namespace

int main() {
  std::cout << "[stl_codec_test] starting\n";
  test_binary();
  test_ascii();
  test_rejects();
  std::cout << "\n[stl_codec_test] " << g_pass << " passed, " << g_fail << " failed\n";
  if (g_fail == 0) {
    std::cout << "[stl_codec_test] PASS\n";
    return 0;
  }
  std::cout << "[stl_codec_test] FAIL\n";
  return 1;
}
