// scene_model_test.cpp
//
// Scene model: placeholders first, in-place swap when meshes arrive, stale
// results after a rebuild, visibility by step cursor, and emphasis.

#include <cmath>
#include <deque>
#include <iostream>
#include <string>
#include <vector>

#include "geometry_cache.h"
#include "manifold/manifold.h"
#include "mesh_compiler.h"
#include "part.h"
#include "part_catalog.h"
#include "scene_model.h"
#include "selection_state.h"
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

// Holds jobs until Poll(), then answers each with a small cube.
class HeldCompiler : public bricked::MeshCompiler {
 public:
  uint64_t Submit(const std::string &, Callback done) override {
    jobs_.push_back({next_id_, std::move(done)});
    return next_id_++;
  }

  size_t Poll() override {
    std::deque<Job> ready;
    ready.swap(jobs_);
    for (Job &job : ready) {
      bricked::CompileResult result;
      result.jobId = job.id;
      const manifold::MeshGL cube = manifold::Manifold::Cube(manifold::vec3(8.0, 8.0, 9.6)).GetMeshGL();
      result.ok = bricked::EncodeBinaryStl(cube, &result.bytes, &result.error);
      job.done(result);
    }
    return ready.size();
  }

  size_t pending() const override { return jobs_.size(); }
  const char *name() const override { return "held"; }

 private:
  struct Job {
    uint64_t id;
    Callback done;
  };
  std::deque<Job> jobs_;
  uint64_t next_id_ = 1;
};

bricked::Part make_part(const char *kind, float x) {
  bricked::Part part;
  part.id = bricked::MakePartId();
  part.kind = bricked::FindPartKind(kind);
  part.position = {x, 0.0f, 0.0f};
  return part;
}

size_t count_emphasized(const bricked::SceneModel &scene) {
  size_t n = 0;
  for (const bricked::SceneEntry &e : scene.entries()) {
    if (e.emphasis != bricked::Emphasis::None) ++n;
  }
  return n;
}

void test_placeholders_then_swap() {
  std::cout << "\n[scene_model_test] placeholders then swap\n";
  HeldCompiler compiler;
  bricked::GeometryCache cache(&compiler);
  bricked::SceneModel scene(&cache);
  bricked::PartList parts({make_part("2x4", 0.0f), make_part("2x4", 16.0f), make_part("1x1", 32.0f)});
  const bricked::GeometryParameters params;

  require(scene.Sync(parts, params, 0, {}), "first sync rebuilds");
  require(scene.size() == 3, "one entry per part");
  bool all_placeholders = true;
  for (const bricked::SceneEntry &e : scene.entries()) {
    all_placeholders = all_placeholders && e.placeholder && e.mesh == &scene.placeholder_mesh();
  }
  require(all_placeholders, "entries start as placeholders");
  require(scene.progress().kindsTotal == 2 && compiler.pending() == 2, "one compile per distinct kind");
  require(scene.visible_count() == 0, "cursor 0 shows nothing");
  require(scene.StatusLine() == "building (placeholders)...", "status while nothing settled");
  require(!scene.Sync(parts, params, 0, {}), "unchanged inputs do not rebuild");

  const uint64_t gen = scene.generation();
  compiler.Poll();
  require(scene.generation() == gen, "mesh arrival does not rebuild");
  bool all_real = true;
  for (const bricked::SceneEntry &e : scene.entries()) all_real = all_real && !e.placeholder && e.mesh;
  require(all_real, "every entry swapped to its real mesh");
  require(scene[0].mesh == scene[1].mesh, "entries of one kind share a mesh");

  scene.Sync(parts, params, 2, {});
  require(scene.visible_count() == 2 && scene[1].visible && !scene[2].visible, "cursor 2 shows the first two");
  require(scene.StatusLine() == "ready (2/3 visible)", "ready status counts visible entries");
  require(std::fabs(scene[1].position.x - 16.0f) < 1e-6f, "entry carries the part transform");
}

void test_in_place_updates() {
  std::cout << "\n[scene_model_test] in-place updates\n";
  HeldCompiler compiler;
  bricked::GeometryCache cache(&compiler);
  bricked::SceneModel scene(&cache);
  bricked::PartList parts({make_part("plate_2x2", 0.0f), make_part("tile_1x1", 8.0f)});
  const bricked::GeometryParameters params;
  scene.Sync(parts, params, 2, {});
  compiler.Poll();
  const uint64_t gen = scene.generation();

  parts.SetTransform(0, {24.0f, 3.2f, 8.0f}, {0.0f, 90.0f, 0.0f});
  parts.SetColor(1, {0.1f, 0.2f, 0.9f});
  require(!scene.Sync(parts, params, 2, {}), "transform and colour edits stay in place");
  require(scene.generation() == gen, "generation unchanged");
  require(std::fabs(scene[0].position.x - 24.0f) < 1e-6f && std::fabs(scene[0].rotationDeg.y - 90.0f) < 1e-6f,
          "transform refreshed");
  require(std::fabs(scene[1].color.b - 0.9f) < 1e-6f, "colour refreshed");

  scene.SetTransientTransform(0, {40.0f, 0.0f, 0.0f}, {0.0f, 0.0f, 0.0f});
  scene.Sync(parts, params, 2, {});
  require(std::fabs(scene[0].position.x - 40.0f) < 1e-6f && scene.transient_index() == 0,
          "transient transform survives a sync");
  scene.ClearTransientTransform();
  scene.Sync(parts, params, 2, {});
  require(std::fabs(scene[0].position.x - 24.0f) < 1e-6f, "cleared transient restores the part");

  bricked::GeometryParameters taller = params;
  taller.studHeight = 2.2;
  require(scene.Sync(parts, taller, 2, {}), "parameter change rebuilds");
  require(scene[0].placeholder, "rebuild with new parameters shows placeholders again");
  require(scene.Sync(parts, params, 2, {}), "switching back rebuilds");
  require(!scene[0].placeholder && !scene[1].placeholder, "cached meshes settle without waiting");
}

void test_stale_results() {
  std::cout << "\n[scene_model_test] stale results\n";
  HeldCompiler compiler;
  bricked::GeometryCache cache(&compiler);
  bricked::SceneModel scene(&cache);
  const bricked::GeometryParameters params;

  bricked::PartList parts({make_part("1x1", 0.0f)});
  scene.Sync(parts, params, 1, {});
  parts.Replace({make_part("2x2", 0.0f)});
  require(scene.Sync(parts, params, 1, {}), "kind change rebuilds");
  compiler.Poll();
  require(scene.size() == 1 && scene[0].kind == bricked::FindPartKind("2x2"), "entry belongs to the new list");
  require(!scene[0].placeholder, "current kind settled");
  require(scene.progress().kindsReady == 1 && scene.progress().kindsTotal == 1,
          "result from the old generation not counted");
}

void test_emphasis() {
  std::cout << "\n[scene_model_test] emphasis\n";
  bricked::GeometryCache cache(nullptr);
  bricked::SceneModel scene(&cache);
  bricked::PartList parts({make_part("1x1", 0.0f), make_part("1x2", 8.0f), make_part("1x3", 16.0f)});
  const bricked::GeometryParameters params;

  bricked::SelectionState sel;
  sel.autoHighlight = 2;
  scene.Sync(parts, params, 3, sel);
  require(scene[2].emphasis == bricked::Emphasis::Auto && count_emphasized(scene) == 1, "auto highlight");

  sel.selected = 0;
  scene.Sync(parts, params, 3, sel);
  require(scene[0].emphasis == bricked::Emphasis::Selected && count_emphasized(scene) == 1,
          "manual selection wins and is exclusive");

  scene.Sync(parts, params, 2, {});
  require(count_emphasized(scene) == 0, "nothing emphasised without selection or highlight");
  require(scene.progress().kindsFailed == 3, "without a compiler every kind fails");
  require(scene.StatusLine() == "ready (2/3 visible)", "failed kinds still count as settled");
}

}  // namespace

int main() {
  std::cout << "[scene_model_test] starting\n";
  test_placeholders_then_swap();
  test_in_place_updates();
  test_stale_results();
  test_emphasis();
  std::cout << "\n[scene_model_test] " << g_pass << " passed, " << g_fail << " failed\n";
  if (g_fail == 0) {
    std::cout << "[scene_model_test] PASS\n";
    return 0;
  }
  std::cout << "[scene_model_test] FAIL\n";
  return 1;
}
