#include "placement.h"

#include <cmath>
#include <cstdio>

#include "instruction_text.h"
#include "log.h"
#include "picking.h"

namespace bricked {

namespace {

using bricked_app::Vec3;

constexpr Vec3 kAxisX = {1.0f, 0.0f, 0.0f};
constexpr Vec3 kAxisY = {0.0f, 1.0f, 0.0f};
constexpr Vec3 kAxisZ = {0.0f, 0.0f, 1.0f};

// Rotation axis for the rotate handle; free rotation spins about vertical.
Vec3 rotation_axis(AxisConstraint axis) {
  switch (axis) {
    case AxisConstraint::X: return kAxisX;
    case AxisConstraint::Z: return kAxisZ;
    case AxisConstraint::Y:
    case AxisConstraint::Free:
    default: return kAxisY;
  }
}

float *rotation_component(PartTransform *t, AxisConstraint axis) {
  switch (axis) {
    case AxisConstraint::X: return &t->rotationDeg.x;
    case AxisConstraint::Z: return &t->rotationDeg.z;
    case AxisConstraint::Y:
    case AxisConstraint::Free:
    default: return &t->rotationDeg.y;
  }
}

std::string format_transform(size_t index, const PartTransform &t) {
  char buf[192];
  std::snprintf(buf, sizeof(buf), "index=%zu pos=(%.3f,%.3f,%.3f) rot=(%.1f,%.1f,%.1f)", index,
                t.position.x, t.position.y, t.position.z,
                t.rotationDeg.x, t.rotationDeg.y, t.rotationDeg.z);
  return std::string(buf);
}

}  // namespace

double SnapValue(double v, double step) {
  if (!(step > 0.0) || !std::isfinite(v)) return v;
  return std::floor(v / step + 0.5) * step;
}

PartTransform SnapTransform(const PartTransform &t, const SnapSettings &snap) {
  const double pitch = snap.toGrid ? kStudPitch : 1.0;
  const double level = snap.toLevels ? kPlateHeight : 1.0;
  PartTransform out;
  out.position.x = (float)SnapValue(t.position.x, pitch);
  out.position.y = (float)SnapValue(t.position.y, level);
  out.position.z = (float)SnapValue(t.position.z, pitch);
  out.rotationDeg.x = (float)SnapValue(t.rotationDeg.x, kSnapRotationDeg);
  out.rotationDeg.y = (float)SnapValue(t.rotationDeg.y, kSnapRotationDeg);
  out.rotationDeg.z = (float)SnapValue(t.rotationDeg.z, kSnapRotationDeg);
  return out;
}

const char *PlacementStateName(PlacementState state) {
  switch (state) {
    case PlacementState::Idle: return "idle";
    case PlacementState::Selected: return "selected";
    case PlacementState::Dragging: return "dragging";
  }
  return "idle";
}

const char *HandleModeName(HandleMode mode) {
  return mode == HandleMode::Rotate ? "rotate" : "translate";
}

const char *AxisConstraintName(AxisConstraint axis) {
  switch (axis) {
    case AxisConstraint::X: return "x";
    case AxisConstraint::Y: return "y";
    case AxisConstraint::Z: return "z";
    case AxisConstraint::Free: return "free";
  }
  return "free";
}

PlacementEngine::PlacementEngine(PartList *parts, SceneModel *scene)
    : parts_(parts),
      scene_(scene),
      state_(PlacementState::Idle),
      mode_(HandleMode::Translate),
      axis_(AxisConstraint::Free),
      selected_(-1),
      grab_point_{0.0f, 0.0f, 0.0f},
      grab_normal_{0.0f, 1.0f, 0.0f} {}

int PlacementEngine::Pick(const bricked_app::Ray &ray) {
  if (state_ == PlacementState::Dragging) return selected_;
  const int hit = bricked_picking::PickSceneEntry(scene_->entries(), ray);
  if (hit < 0) {
    Deselect();
    return -1;
  }
  Select(hit);
  return selected_;
}

bool PlacementEngine::Select(int index) {
  if (state_ == PlacementState::Dragging) return false;
  if (index < 0 || (size_t)index >= parts_->size()) return false;
  selected_ = index;
  state_ = PlacementState::Selected;
  const Part &part = (*parts_)[(size_t)index];
  selected_hex_ = RgbToHex(part.color);
  log_event("PART_SELECTED", 0, "index=" + std::to_string(index) + " kind=" + (part.kind ? part.kind->id : "?"));
  return true;
}

void PlacementEngine::Deselect() {
  if (state_ == PlacementState::Dragging) scene_->ClearTransientTransform();
  const bool had = selected_ >= 0;
  state_ = PlacementState::Idle;
  selected_ = -1;
  selected_hex_.clear();
  if (had) log_event("PART_DESELECTED", 0);
}

void PlacementEngine::Reset() { Deselect(); }

bool PlacementEngine::BeginDrag(const bricked_app::Ray &ray) {
  if (state_ != PlacementState::Selected) return false;
  if (selected_ < 0 || (size_t)selected_ >= scene_->size() || (size_t)selected_ >= parts_->size()) return false;
  const SceneEntry &entry = (*scene_)[(size_t)selected_];
  double t = 0.0;
  if (!bricked_picking::RayHitsEntry(entry, ray, &t)) return false;

  const Part &part = (*parts_)[(size_t)selected_];
  drag_start_.position = part.position;
  drag_start_.rotationDeg = part.rotationDeg;
  drag_current_ = drag_start_;
  const Vec3 hit = bricked_app::add(ray.origin, bricked_app::mul(ray.dir, (float)t));

  if (mode_ == HandleMode::Rotate) {
    grab_normal_ = rotation_axis(axis_);
    if (!bricked_picking::RayHitsPlane(ray, drag_start_.position, grab_normal_, &grab_point_)) return false;
  } else if (axis_ == AxisConstraint::Y) {
    // Vertical plane through the grab point, facing the viewer.
    Vec3 n = {-ray.dir.x, 0.0f, -ray.dir.z};
    grab_normal_ = (std::fabs(n.x) + std::fabs(n.z) < 1e-6f) ? kAxisZ : bricked_app::normalize(n);
    grab_point_ = hit;
  } else {
    grab_normal_ = kAxisY;
    grab_point_ = hit;
  }

  scene_->SetTransientTransform((size_t)selected_, drag_current_.position, drag_current_.rotationDeg);
  state_ = PlacementState::Dragging;
  return true;
}

bool PlacementEngine::DragTranslate(const bricked_app::Ray &ray, PartTransform *out) const {
  Vec3 p;
  if (!bricked_picking::RayHitsPlane(ray, grab_point_, grab_normal_, &p)) return false;
  const Vec3 d = bricked_app::sub(p, grab_point_);
  *out = drag_start_;
  switch (axis_) {
    case AxisConstraint::X: out->position.x += d.x; break;
    case AxisConstraint::Y: out->position.y += d.y; break;
    case AxisConstraint::Z: out->position.z += d.z; break;
    case AxisConstraint::Free:
      out->position.x += d.x;
      out->position.z += d.z;
      break;
  }
  return true;
}

bool PlacementEngine::DragRotate(const bricked_app::Ray &ray, PartTransform *out) const {
  Vec3 p;
  if (!bricked_picking::RayHitsPlane(ray, drag_start_.position, grab_normal_, &p)) return false;
  const Vec3 u = bricked_app::sub(grab_point_, drag_start_.position);
  const Vec3 v = bricked_app::sub(p, drag_start_.position);
  const float s = bricked_app::dot(grab_normal_, bricked_app::cross(u, v));
  const float c = bricked_app::dot(u, v);
  if (std::fabs(s) < 1e-9f && std::fabs(c) < 1e-9f) return false;
  *out = drag_start_;
  *rotation_component(out, axis_) += bricked_app::rad_to_deg(std::atan2(s, c));
  return true;
}

bool PlacementEngine::DragTo(const bricked_app::Ray &ray) {
  if (state_ != PlacementState::Dragging) return false;
  PartTransform next;
  const bool ok = (mode_ == HandleMode::Rotate) ? DragRotate(ray, &next) : DragTranslate(ray, &next);
  if (!ok) return false;
  drag_current_ = next;
  scene_->SetTransientTransform((size_t)selected_, drag_current_.position, drag_current_.rotationDeg);
  return true;
}

bool PlacementEngine::EndDrag(bool disable_snap) {
  if (state_ != PlacementState::Dragging) return false;
  PartTransform final_t = drag_current_;
  const bool snapped = !disable_snap && snap_.enabled;
  if (snapped) final_t = SnapTransform(final_t, snap_);
  scene_->ClearTransientTransform();
  state_ = PlacementState::Selected;
  if (!parts_->SetTransform((size_t)selected_, final_t.position, final_t.rotationDeg)) return false;
  log_event("PART_COMMIT", parts_->version(),
            format_transform((size_t)selected_, final_t) + (snapped ? " snapped" : " free"));
  return true;
}

void PlacementEngine::CancelDrag() {
  if (state_ != PlacementState::Dragging) return;
  scene_->ClearTransientTransform();
  state_ = PlacementState::Selected;
}

bool PlacementEngine::SetMode(HandleMode mode) {
  if (state_ == PlacementState::Dragging) return false;
  mode_ = mode;
  return true;
}

bool PlacementEngine::SetAxis(AxisConstraint axis) {
  if (state_ == PlacementState::Dragging) return false;
  axis_ = axis;
  return true;
}

bool PlacementEngine::ApplyColor(const bricked_app::Rgb &rgb) {
  if (selected_ < 0) return false;
  const bricked_app::Rgb clamped = {bricked_app::clampf(rgb.r, 0.0f, 1.0f),
                                    bricked_app::clampf(rgb.g, 0.0f, 1.0f),
                                    bricked_app::clampf(rgb.b, 0.0f, 1.0f)};
  if (!parts_->SetColor((size_t)selected_, clamped)) return false;
  selected_hex_ = RgbToHex(clamped);
  return true;
}

bool PlacementEngine::ApplyColorHex(const std::string &hex, std::string *error) {
  if (selected_ < 0) {
    if (error) *error = "No part selected.";
    return false;
  }
  bricked_app::Rgb rgb;
  if (!HexToRgb(hex, &rgb, error)) return false;
  return ApplyColor(rgb);
}

}  // namespace bricked
