#ifndef BRICKED_GEOMETRY_CACHE_H_
#define BRICKED_GEOMETRY_CACHE_H_

#include <cstddef>
#include <cstdint>
#include <functional>
#include <memory>
#include <string>
#include <unordered_map>
#include <utility>
#include <vector>

#include "geometry_params.h"
#include "mesh_compiler.h"
#include "part_catalog.h"
#include "part_mesh.h"

namespace bricked {

enum class MeshRequestState : uint8_t {
  Pending = 0,
  Ready = 1,
  Failed = 2,
};

// Eventual result of a GeometryCache lookup. Settles exactly once.
class MeshRequest {
 public:
  using Continuation = std::function<void(const MeshRequest &)>;

  explicit MeshRequest(GeomKey key) : key_(std::move(key)) {}

  const GeomKey &key() const { return key_; }
  MeshRequestState state() const { return state_; }
  bool pending() const { return state_ == MeshRequestState::Pending; }
  bool ready() const { return state_ == MeshRequestState::Ready; }
  bool failed() const { return state_ == MeshRequestState::Failed; }
  // Owned by the cache; valid for the cache's lifetime once ready().
  const PartMesh *mesh() const { return mesh_; }
  const std::string &error() const { return error_; }

  // Runs `fn` when the request settles, or right away if it already has.
  void Then(Continuation fn);

 private:
  friend class GeometryCache;
  void Fulfill(const PartMesh *mesh);
  void Reject(const std::string &error);
  void Settle();

  GeomKey key_;
  MeshRequestState state_ = MeshRequestState::Pending;
  const PartMesh *mesh_ = nullptr;
  std::string error_;
  std::vector<Continuation> waiters_;
};

using MeshFuture = std::shared_ptr<MeshRequest>;

// Content-addressed mesh cache keyed by (kind, parameters). Each key is
// compiled at most once while in flight; concurrent requests share the
// same MeshFuture. Successful meshes are kept for the cache's lifetime.
// A failed compile is not remembered, so the next request retries it.
class GeometryCache {
 public:
  explicit GeometryCache(MeshCompiler *compiler);

  GeometryCache(const GeometryCache &) = delete;
  GeometryCache &operator=(const GeometryCache &) = delete;

  MeshFuture Resolve(const PartKind &kind, const GeometryParameters &params);

  const PartMesh *Find(const GeomKey &key) const;
  size_t cached_count() const { return meshes_.size(); }
  size_t inflight_count() const { return inflight_.size(); }
  uint64_t compiles_started() const { return compiles_started_; }

 private:
  void OnCompiled(const GeomKey &key, const CompileResult &result);

  MeshCompiler *compiler_;
  std::unordered_map<GeomKey, std::unique_ptr<PartMesh>> meshes_;
  std::unordered_map<GeomKey, MeshFuture> inflight_;
  uint64_t compiles_started_;
};

}  // namespace bricked

#endif  // BRICKED_GEOMETRY_CACHE_H_
