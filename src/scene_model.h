#ifndef BRICKED_SCENE_MODEL_H_
#define BRICKED_SCENE_MODEL_H_

#include <cstddef>
#include <cstdint>
#include <memory>
#include <string>
#include <vector>

#include "app_state.h"
#include "geometry_cache.h"
#include "geometry_params.h"
#include "part.h"
#include "selection_state.h"

namespace bricked {

enum class Emphasis : uint8_t {
  None = 0,
  Selected = 1,
  Auto = 2,
};

struct SceneEntry {
  const PartKind *kind = nullptr;
  const PartMesh *mesh = nullptr;
  bool placeholder = true;
  bricked_app::Vec3 position = {0.0f, 0.0f, 0.0f};
  bricked_app::Vec3 rotationDeg = {0.0f, 0.0f, 0.0f};
  bricked_app::Rgb color = {0.8f, 0.1f, 0.1f};
  bool visible = false;
  Emphasis emphasis = Emphasis::None;
};

struct SceneProgress {
  size_t kindsTotal = 0;
  size_t kindsReady = 0;
  size_t kindsFailed = 0;
};

// One renderable entry per Part. Sync() picks between a structural rebuild
// (ordered kind list or parameters changed) and an in-place refresh of
// transforms, colours, visibility and emphasis.
class SceneModel {
 public:
  explicit SceneModel(GeometryCache *cache);

  SceneModel(const SceneModel &) = delete;
  SceneModel &operator=(const SceneModel &) = delete;

  // Returns true when the call rebuilt the entries.
  bool Sync(const PartList &parts, const GeometryParameters &params,
            size_t step_cursor, const SelectionState &selection);

  // Overrides one entry's transform until cleared; the Part list is untouched.
  bool SetTransientTransform(size_t index, const bricked_app::Vec3 &position,
                             const bricked_app::Vec3 &rotation_deg);
  void ClearTransientTransform();
  int transient_index() const { return transient_index_; }

  const std::vector<SceneEntry> &entries() const { return entries_; }
  size_t size() const { return entries_.size(); }
  const SceneEntry &operator[](size_t index) const { return entries_[index]; }

  uint64_t generation() const { return generation_; }
  const SceneProgress &progress() const { return progress_; }
  size_t visible_count() const;
  std::string StatusLine() const;

  const PartMesh &placeholder_mesh() const { return placeholder_; }

 private:
  bool NeedsRebuild(const PartList &parts, const GeometryParameters &params) const;
  void Rebuild(const PartList &parts, const GeometryParameters &params);
  void ApplyState(const PartList &parts, size_t step_cursor, const SelectionState &selection);
  void OnKindSettled(uint64_t generation, const PartKind *kind, const MeshRequest &request);

  GeometryCache *cache_;
  PartMesh placeholder_;
  std::vector<SceneEntry> entries_;

  bool has_signature_;
  std::vector<const PartKind *> signature_kinds_;
  GeometryParameters signature_params_;

  uint64_t generation_;
  // Continuations hold a weak reference; expired or different means stale.
  std::shared_ptr<uint64_t> live_generation_;
  std::vector<MeshFuture> requests_;
  SceneProgress progress_;

  int transient_index_;
  bricked_app::Vec3 transient_position_;
  bricked_app::Vec3 transient_rotation_;
};

}  // namespace bricked

#endif  // BRICKED_SCENE_MODEL_H_
