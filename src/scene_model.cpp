#include "scene_model.h"

#include <algorithm>
#include <unordered_set>

#include "log.h"

namespace bricked {

SceneModel::SceneModel(GeometryCache *cache)
    : cache_(cache),
      placeholder_(MakePlaceholderMesh()),
      has_signature_(false),
      generation_(0),
      live_generation_(std::make_shared<uint64_t>(0)),
      transient_index_(-1),
      transient_position_{0.0f, 0.0f, 0.0f},
      transient_rotation_{0.0f, 0.0f, 0.0f} {}

bool SceneModel::NeedsRebuild(const PartList &parts, const GeometryParameters &params) const {
  if (!has_signature_) return true;
  if (params != signature_params_) return true;
  if (parts.size() != signature_kinds_.size()) return true;
  for (size_t i = 0; i < parts.size(); ++i) {
    if (parts[i].kind != signature_kinds_[i]) return true;
  }
  return false;
}

bool SceneModel::Sync(const PartList &parts, const GeometryParameters &params,
                      size_t step_cursor, const SelectionState &selection) {
  const bool rebuild = NeedsRebuild(parts, params);
  if (rebuild) Rebuild(parts, params);
  ApplyState(parts, step_cursor, selection);
  return rebuild;
}

void SceneModel::Rebuild(const PartList &parts, const GeometryParameters &params) {
  ++generation_;
  *live_generation_ = generation_;
  requests_.clear();
  transient_index_ = -1;

  has_signature_ = true;
  signature_params_ = params;
  signature_kinds_.clear();
  signature_kinds_.reserve(parts.size());

  entries_.clear();
  entries_.reserve(parts.size());
  std::vector<const PartKind *> kinds;
  std::unordered_set<const PartKind *> seen;
  for (const Part &part : parts.parts()) {
    SceneEntry entry;
    entry.kind = part.kind;
    entry.mesh = &placeholder_;
    entry.placeholder = true;
    entries_.push_back(entry);
    signature_kinds_.push_back(part.kind);
    if (part.kind && seen.insert(part.kind).second) kinds.push_back(part.kind);
  }

  progress_ = {};
  progress_.kindsTotal = kinds.size();
  log_event("SCENE_REBUILD", generation_,
            "parts=" + std::to_string(parts.size()) + " kinds=" + std::to_string(kinds.size()));

  if (!cache_) return;
  // Entries exist before any request, so a cache hit can settle immediately.
  const uint64_t gen = generation_;
  std::weak_ptr<uint64_t> live = live_generation_;
  for (const PartKind *kind : kinds) {
    MeshFuture request = cache_->Resolve(*kind, params);
    requests_.push_back(request);
    request->Then([this, live, gen, kind](const MeshRequest &settled) {
      std::shared_ptr<uint64_t> current = live.lock();
      if (!current) return;
      OnKindSettled(gen, kind, settled);
    });
  }
}

void SceneModel::OnKindSettled(uint64_t generation, const PartKind *kind, const MeshRequest &request) {
  if (generation != *live_generation_) {
    log_event("SCENE_STALE_RESULT", generation, request.key());
    return;
  }
  if (request.ready() && request.mesh()) {
    for (SceneEntry &entry : entries_) {
      if (entry.kind != kind) continue;
      entry.mesh = request.mesh();
      entry.placeholder = false;
    }
    ++progress_.kindsReady;
    log_event("SCENE_KIND_READY", generation, kind->id);
  } else {
    ++progress_.kindsFailed;
    log_event("SCENE_KIND_FAILED", generation, std::string(kind->id) + "\n" + request.error());
  }
}

void SceneModel::ApplyState(const PartList &parts, size_t step_cursor, const SelectionState &selection) {
  const size_t n = std::min(parts.size(), entries_.size());
  const size_t visible = std::min(step_cursor, n);
  const int emphasized = EmphasizedIndex(selection);
  const Emphasis mark = selection.selected >= 0 ? Emphasis::Selected : Emphasis::Auto;
  for (size_t i = 0; i < n; ++i) {
    SceneEntry &entry = entries_[i];
    const Part &part = parts[i];
    if ((int)i == transient_index_) {
      entry.position = transient_position_;
      entry.rotationDeg = transient_rotation_;
    } else {
      entry.position = part.position;
      entry.rotationDeg = part.rotationDeg;
    }
    entry.color = part.color;
    entry.visible = i < visible;
    entry.emphasis = ((int)i == emphasized) ? mark : Emphasis::None;
  }
}

bool SceneModel::SetTransientTransform(size_t index, const bricked_app::Vec3 &position,
                                       const bricked_app::Vec3 &rotation_deg) {
  if (index >= entries_.size()) return false;
  transient_index_ = (int)index;
  transient_position_ = position;
  transient_rotation_ = rotation_deg;
  entries_[index].position = position;
  entries_[index].rotationDeg = rotation_deg;
  return true;
}

void SceneModel::ClearTransientTransform() { transient_index_ = -1; }

size_t SceneModel::visible_count() const {
  size_t n = 0;
  for (const SceneEntry &entry : entries_) {
    if (entry.visible) ++n;
  }
  return n;
}

std::string SceneModel::StatusLine() const {
  const size_t settled = progress_.kindsReady + progress_.kindsFailed;
  const std::string total = std::to_string(progress_.kindsTotal);
  if (progress_.kindsTotal > 0 && settled == 0) return "building (placeholders)...";
  if (settled < progress_.kindsTotal) {
    if (progress_.kindsFailed > 0) return "compiling " + std::to_string(settled) + "/" + total + " kinds (some failed)";
    return "compiling " + std::to_string(settled) + "/" + total + " kinds...";
  }
  return "ready (" + std::to_string(visible_count()) + "/" + std::to_string(entries_.size()) + " visible)";
}

}  // namespace bricked
