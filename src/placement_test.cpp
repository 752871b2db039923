// placement_test.cpp
//
// Snapping rules and the select / drag / commit cycle on a compiled 1x1
// brick, driven through a BuildSession with an inline manifold compiler.

#include <cmath>
#include <iostream>
#include <string>

#include "app_state.h"
#include "build_session.h"
#include "mesh_compiler.h"
#include "part.h"
#include "part_catalog.h"
#include "placement.h"
#include "scene_model.h"
#include "solid_compiler.h"

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

bool near(float a, float b) { return std::fabs(a - b) < 1e-3f; }

// Straight down through the top centre of entry 0, shifted by `dx` along X.
bool ray_down_through_entry(const bricked_scene::BuildSession &session, float dx, bricked_app::Ray *ray) {
  bricked_app::Vec3 mn;
  bricked_app::Vec3 mx;
  if (!bricked_scene::ComputeEntryBounds(session.scene()[0], &mn, &mx)) return false;
  ray->origin = {0.5f * (mn.x + mx.x) + dx, mx.y + 100.0f, 0.5f * (mn.z + mx.z)};
  ray->dir = {0.0f, -1.0f, 0.0f};
  return true;
}

void test_snap_rules() {
  std::cout << "\n[placement_test] snap rules\n";
  bricked::SnapSettings snap;
  bricked::PartTransform t;
  t.position = {13.0f, 9.4f, 3.0f};
  t.rotationDeg = {0.0f, 44.0f, 46.0f};
  const bricked::PartTransform s = bricked::SnapTransform(t, snap);
  require(near(s.position.x, 16.0f) && near(s.position.z, 0.0f), "horizontal axes snap to stud pitch");
  require(near(s.position.y, 9.6f), "vertical snaps to plate height");
  require(near(s.rotationDeg.y, 0.0f) && near(s.rotationDeg.z, 90.0f), "rotation snaps to quarter turns");

  const bricked::PartTransform again = bricked::SnapTransform(s, snap);
  require(near(again.position.x, s.position.x) && near(again.position.y, s.position.y) &&
              near(again.rotationDeg.z, s.rotationDeg.z),
          "snapping is idempotent");

  t.position = {13.4f, 3.0f, 0.0f};
  require(near(bricked::SnapTransform(t, snap).position.y, 3.2f), "one plate up");
  snap.toGrid = false;
  snap.toLevels = false;
  const bricked::PartTransform loose = bricked::SnapTransform(t, snap);
  require(near(loose.position.x, 13.0f) && near(loose.position.y, 3.0f), "grid off rounds to whole units");
  require(bricked::SnapValue(-4.0, 8.0) == 0.0, "negative half step rounds up");
  require(bricked::SnapValue(4.0, 8.0) == 8.0, "positive half step rounds up");
  require(bricked::SnapValue(-45.0, 90.0) == 0.0, "negative half turn rounds up");
  require(bricked::SnapValue(-1.6, 3.2) == 0.0, "negative half level rounds up");
  require(bricked::SnapValue(-5.0, 8.0) == -8.0, "past the half rounds down");
  require(bricked::SnapValue(5.0, 0.0) == 5.0, "non-positive step leaves the value");
}

void test_drag_cycle() {
  std::cout << "\n[placement_test] drag cycle\n";
  bricked::ManifoldMeshCompiler compiler(0);
  bricked_scene::BuildSession session(&compiler);
  session.LoadDescriptionText("place(\"1x1\");\n");
  session.steps().JumpToEnd();
  std::string err;
  if (!require(bricked::DrainMeshCompiler(&compiler, 60000, &err), "1x1 compiles")) return;
  session.SyncScene();
  if (!require(session.scene().size() == 1 && !session.scene()[0].placeholder, "real mesh in scene")) return;

  bricked::PlacementEngine &placement = session.placement();
  bricked_app::Ray down;
  bricked_app::Ray moved;
  ray_down_through_entry(session, 0.0f, &down);
  ray_down_through_entry(session, 5.0f, &moved);

  require(placement.Pick(down) == 0, "pick hits the brick");
  require(placement.state() == bricked::PlacementState::Selected, "state selected");
  require(session.selection().selected == 0 && session.selection().autoHighlight == -1,
          "manual selection suppresses auto highlight");
  require(placement.BeginDrag(down), "drag starts on the part");
  require(!placement.SetMode(bricked::HandleMode::Rotate), "mode locked while dragging");
  require(placement.DragTo(moved), "drag follows the pointer");
  require(near(session.scene()[0].position.x, 5.0f), "scene entry moves live");
  require(near(session.parts()[0].position.x, 0.0f), "part untouched while dragging");

  require(placement.EndDrag(false), "commit");
  require(near(session.parts()[0].position.x, 8.0f), "commit snaps to the next stud");
  require(placement.state() == bricked::PlacementState::Selected, "still selected after commit");
  session.SyncScene();
  require(near(session.scene()[0].position.x, 8.0f), "scene follows the committed part");

  ray_down_through_entry(session, 0.0f, &down);
  ray_down_through_entry(session, 5.0f, &moved);
  require(placement.BeginDrag(down) && placement.DragTo(moved), "second drag");
  require(placement.EndDrag(true), "commit with snapping bypassed");
  require(near(session.parts()[0].position.x, 13.0f), "unsnapped commit keeps the raw offset");

  session.SyncScene();
  ray_down_through_entry(session, 0.0f, &down);
  ray_down_through_entry(session, 5.0f, &moved);
  placement.BeginDrag(down);
  placement.DragTo(moved);
  placement.CancelDrag();
  session.SyncScene();
  require(near(session.parts()[0].position.x, 13.0f) && near(session.scene()[0].position.x, 13.0f),
          "cancelled drag leaves part and scene");

  placement.SetAxis(bricked::AxisConstraint::Y);
  placement.BeginDrag(down);
  placement.DragTo(moved);
  placement.EndDrag(true);
  require(near(session.parts()[0].position.x, 13.0f), "Y constraint ignores horizontal motion");
  placement.SetAxis(bricked::AxisConstraint::Free);

  placement.snap().toGrid = false;
  session.SyncScene();
  ray_down_through_entry(session, 0.0f, &down);
  ray_down_through_entry(session, 5.4f, &moved);
  require(placement.BeginDrag(down) && placement.DragTo(moved), "drag with grid snapping off");
  placement.EndDrag(false);
  require(near(session.parts()[0].position.x, 18.0f), "grid off snaps to whole units");
  placement.snap().toGrid = true;

  bricked_app::Ray miss = {{500.0f, 100.0f, 500.0f}, {0.0f, -1.0f, 0.0f}};
  require(placement.Pick(miss) == -1, "miss deselects");
  require(placement.state() == bricked::PlacementState::Idle, "state idle after miss");
}

void test_colour() {
  std::cout << "\n[placement_test] colour\n";
  bricked::PartList parts;
  bricked::SceneModel scene(nullptr);
  bricked::PlacementEngine placement(&parts, &scene);
  bricked::Part part;
  part.kind = bricked::FindPartKind("2x2");
  parts.Replace({part});

  std::string err;
  require(!placement.ApplyColorHex("#00ff00", &err) && err == "No part selected.", "needs a selection");
  require(placement.Select(0), "select by index");
  require(placement.selected_color_hex() == "#cc1a1a", "hex recorded on select");
  require(placement.ApplyColorHex("#00ff00", &err), "apply hex");
  require(near(parts[0].color.g, 1.0f) && near(parts[0].color.r, 0.0f), "part recoloured");
  require(placement.selected_color_hex() == "#00ff00", "hex follows the new colour");
  require(!placement.ApplyColorHex("#00ffzz", &err), "bad hex rejected");
  require(near(parts[0].color.g, 1.0f), "rejected hex leaves the colour");
  require(!placement.Select(3), "out-of-range select rejected");
}

}  // namespace

int main() {
  std::cout << "[placement_test] starting\n";
  test_snap_rules();
  test_drag_cycle();
  test_colour();
  std::cout << "\n[placement_test] " << g_pass << " passed, " << g_fail << " failed\n";
  if (g_fail == 0) {
    std::cout << "[placement_test] PASS\n";
    return 0;
  }
  std::cout << "[placement_test] FAIL\n";
  return 1;
}
