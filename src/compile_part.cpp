// compile_part.cpp
//
// Compiles one catalog part kind to a binary STL through the same compiler
// path the viewer uses and reports the result as a JSON line on stdout.
// Compiler events go to stderr.
//
// Usage:  build/compile_part [--source] [--compiler=manifold|openscad] <kind> [out.stl]
//
// --source prints the generated solid source instead of compiling.
//
// Exit codes:
//   0  part compiled; stdout contains a "pass" JSON line
//   1  compile failed; stdout contains a "fail" JSON line
//   2  usage error

#include <cstdio>
#include <cstring>
#include <memory>
#include <string>
#include <vector>

#include "geometry_params.h"
#include "mesh_compiler.h"
#include "openscad_compiler.h"
#include "part_catalog.h"
#include "part_mesh.h"
#include "solid_compiler.h"
#include "solid_source.h"

namespace {

void json_str(const char *s) {
  for (const char *p = s; *p != '\0'; ++p) {
    const unsigned char c = (unsigned char)*p;
    if      (c == '"')  std::fputs("\\\"", stdout);
    else if (c == '\\') std::fputs("\\\\", stdout);
    else if (c == '\n') std::fputs("\\n",  stdout);
    else if (c == '\r') std::fputs("\\r",  stdout);
    else if (c == '\t') std::fputs("\\t",  stdout);
    else if (c < 0x20)  std::fprintf(stdout, "\\u%04x", c);
    else                std::fputc(c, stdout);
  }
}

int fail(const char *kind, const std::string &error) {
  std::fprintf(stdout, "{\"result\":\"fail\",\"kind\":\"");
  json_str(kind);
  std::fprintf(stdout, "\",\"error\":\"");
  json_str(error.c_str());
  std::fprintf(stdout, "\"}\n");
  return 1;
}

bool write_bytes(const char *path, const std::vector<uint8_t> &bytes, std::string *error) {
  FILE *f = std::fopen(path, "wb");
  if (!f) {
    if (error) *error = std::string("Cannot open '") + path + "' for writing.";
    return false;
  }
  const size_t n = std::fwrite(bytes.data(), 1, bytes.size(), f);
  const bool ok = n == bytes.size() && std::fclose(f) == 0;
  if (!ok && error) *error = std::string("Short write to '") + path + "'.";
  return ok;
}

}  // namespace

int main(int argc, char **argv) {
  bool print_source = false;
  bool use_openscad = false;
  const char *kind_id = nullptr;
  const char *out_path = nullptr;
  for (int i = 1; i < argc; ++i) {
    if (std::strcmp(argv[i], "--source") == 0) {
      print_source = true;
    } else if (std::strcmp(argv[i], "--compiler=openscad") == 0) {
      use_openscad = true;
    } else if (std::strcmp(argv[i], "--compiler=manifold") == 0) {
      use_openscad = false;
    } else if (!kind_id) {
      kind_id = argv[i];
    } else if (!out_path) {
      out_path = argv[i];
    } else {
      kind_id = nullptr;
      break;
    }
  }
  if (!kind_id) {
    std::fprintf(stderr, "usage: compile_part [--source] [--compiler=manifold|openscad] <kind> [out.stl]\n");
    return 2;
  }

  const bricked::PartKind *kind = bricked::FindPartKind(kind_id);
  if (!kind) return fail(kind_id, "unknown part kind");

  const bricked::GeometryParameters params;
  const std::string source = bricked::BuildPartSolidSource(*kind, params);
  if (print_source) {
    std::fputs(source.c_str(), stdout);
    return 0;
  }

  std::unique_ptr<bricked::MeshCompiler> compiler;
  if (use_openscad) {
    compiler = std::make_unique<bricked::OpenScadMeshCompiler>();
  } else {
    compiler = std::make_unique<bricked::ManifoldMeshCompiler>(0);
  }

  bricked::CompileResult result;
  bool delivered = false;
  compiler->Submit(source, [&](const bricked::CompileResult &r) {
    result = r;
    delivered = true;
  });
  std::string error;
  if (!bricked::DrainMeshCompiler(compiler.get(), 120 * 1000, &error)) return fail(kind_id, error);
  if (!delivered) return fail(kind_id, "compiler delivered no result");
  if (!result.ok) return fail(kind_id, result.error);

  bricked::PartMesh mesh;
  if (!bricked::BuildPartMeshFromStl(result.bytes, &mesh, &error)) return fail(kind_id, error);
  if (out_path && !write_bytes(out_path, result.bytes, &error)) return fail(kind_id, error);

  std::fprintf(stdout, "{\"result\":\"pass\",\"kind\":\"");
  json_str(kind_id);
  std::fprintf(stdout, "\",\"compiler\":\"%s\",\"tris\":%zu,\"bytes\":%zu,\"duration_ms\":%lld}\n",
               compiler->name(), mesh.mesh.NumTri(), result.bytes.size(), (long long)result.durationMs);
  return 0;
}
