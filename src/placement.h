#ifndef BRICKED_PLACEMENT_H_
#define BRICKED_PLACEMENT_H_

#include <cstdint>
#include <string>

#include "app_state.h"
#include "part.h"
#include "scene_model.h"

namespace bricked {

struct SnapSettings {
  bool enabled = true;
  bool toGrid = true;
  bool toLevels = true;
};

struct PartTransform {
  bricked_app::Vec3 position = {0.0f, 0.0f, 0.0f};
  bricked_app::Vec3 rotationDeg = {0.0f, 0.0f, 0.0f};
};

constexpr double kSnapRotationDeg = 90.0;

// Nearest multiple of `step`; halves round up (toward +inf).
double SnapValue(double v, double step);

// Horizontal axes (X, Z) to the stud pitch or 1, vertical (Y) to the plate
// height or 1, rotations to 90 degrees. Ignores `snap.enabled`; the caller
// decides whether to snap at all.
PartTransform SnapTransform(const PartTransform &t, const SnapSettings &snap);

enum class PlacementState : uint8_t {
  Idle = 0,
  Selected = 1,
  Dragging = 2,
};

enum class HandleMode : uint8_t {
  Translate = 0,
  Rotate = 1,
};

enum class AxisConstraint : uint8_t {
  Free = 0,
  X = 1,
  Y = 2,
  Z = 3,
};

const char *PlacementStateName(PlacementState state);
const char *HandleModeName(HandleMode mode);
const char *AxisConstraintName(AxisConstraint axis);

// Selection and drag-to-transform over one PartList. While dragging only the
// scene entry moves; the Part is written once, on EndDrag().
class PlacementEngine {
 public:
  PlacementEngine(PartList *parts, SceneModel *scene);

  PlacementEngine(const PlacementEngine &) = delete;
  PlacementEngine &operator=(const PlacementEngine &) = delete;

  // Returns the selected index, or -1 after a miss.
  int Pick(const bricked_app::Ray &ray);
  bool Select(int index);
  void Deselect();

  bool BeginDrag(const bricked_app::Ray &ray);
  bool DragTo(const bricked_app::Ray &ray);
  bool EndDrag(bool disable_snap);
  // Drops the transient transform without touching the Part.
  void CancelDrag();

  bool SetMode(HandleMode mode);
  bool SetAxis(AxisConstraint axis);

  bool ApplyColor(const bricked_app::Rgb &rgb);
  bool ApplyColorHex(const std::string &hex, std::string *error);
  // "#rrggbb" of the selected part, recorded when it was picked.
  const std::string &selected_color_hex() const { return selected_hex_; }

  // Parts were replaced wholesale; any selection is gone.
  void Reset();

  PlacementState state() const { return state_; }
  HandleMode mode() const { return mode_; }
  AxisConstraint axis() const { return axis_; }
  int selected() const { return selected_; }
  SnapSettings &snap() { return snap_; }
  const SnapSettings &snap() const { return snap_; }

 private:
  bool DragTranslate(const bricked_app::Ray &ray, PartTransform *out) const;
  bool DragRotate(const bricked_app::Ray &ray, PartTransform *out) const;

  PartList *parts_;
  SceneModel *scene_;
  PlacementState state_;
  HandleMode mode_;
  AxisConstraint axis_;
  int selected_;
  std::string selected_hex_;
  SnapSettings snap_;

  PartTransform drag_start_;
  PartTransform drag_current_;
  bricked_app::Vec3 grab_point_;
  bricked_app::Vec3 grab_normal_;
};

}  // namespace bricked

#endif  // BRICKED_PLACEMENT_H_
