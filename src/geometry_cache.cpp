#include "geometry_cache.h"

#include <utility>

#include "log.h"
#include "solid_source.h"

namespace bricked {

void MeshRequest::Then(Continuation fn) {
  if (!fn) return;
  if (state_ != MeshRequestState::Pending) {
    fn(*this);
    return;
  }
  waiters_.push_back(std::move(fn));
}

void MeshRequest::Fulfill(const PartMesh *mesh) {
  if (state_ != MeshRequestState::Pending) return;
  state_ = MeshRequestState::Ready;
  mesh_ = mesh;
  Settle();
}

void MeshRequest::Reject(const std::string &error) {
  if (state_ != MeshRequestState::Pending) return;
  state_ = MeshRequestState::Failed;
  error_ = error;
  Settle();
}

void MeshRequest::Settle() {
  std::vector<Continuation> waiters;
  waiters.swap(waiters_);
  for (Continuation &fn : waiters) fn(*this);
}

GeometryCache::GeometryCache(MeshCompiler *compiler)
    : compiler_(compiler), compiles_started_(0) {}

const PartMesh *GeometryCache::Find(const GeomKey &key) const {
  auto it = meshes_.find(key);
  return (it == meshes_.end()) ? nullptr : it->second.get();
}

MeshFuture GeometryCache::Resolve(const PartKind &kind, const GeometryParameters &params) {
  GeomKey key = MakeGeomKey(kind, params);
  if (const PartMesh *hit = Find(key)) {
    log_event("GEOM_CACHE_HIT", 0, key);
    MeshFuture done = std::make_shared<MeshRequest>(key);
    done->Fulfill(hit);
    return done;
  }
  auto inflight = inflight_.find(key);
  if (inflight != inflight_.end()) {
    log_event("GEOM_COMPILE_JOINED", 0, key);
    return inflight->second;
  }

  MeshFuture request = std::make_shared<MeshRequest>(key);
  if (!compiler_) {
    log_event("GEOM_COMPILE_FAILED", 0, key + " no compiler");
    request->Reject("No mesh compiler configured.");
    return request;
  }
  inflight_.emplace(key, request);
  ++compiles_started_;
  const std::string source = BuildPartSolidSource(kind, params);
  const uint64_t job = compiler_->Submit(source, [this, key](const CompileResult &result) {
    OnCompiled(key, result);
  });
  log_event("GEOM_COMPILE_STARTED", job, key);
  return request;
}

void GeometryCache::OnCompiled(const GeomKey &key, const CompileResult &result) {
  auto it = inflight_.find(key);
  if (it == inflight_.end()) return;
  // Drop the in-flight entry first so waiters that re-resolve see a clean slate.
  MeshFuture request = std::move(it->second);
  inflight_.erase(it);

  std::string error;
  if (!result.ok) {
    error = result.error.empty() ? std::string("Compiler reported failure without diagnostics.") : result.error;
  } else {
    auto mesh = std::make_unique<PartMesh>();
    if (BuildPartMeshFromStl(result.bytes, mesh.get(), &error)) {
      const PartMesh *stored = mesh.get();
      meshes_[key] = std::move(mesh);
      log_event("GEOM_COMPILE_DONE", result.jobId,
                key + " duration_ms=" + std::to_string(result.durationMs) +
                    " tris=" + std::to_string(stored->mesh.NumTri()));
      request->Fulfill(stored);
      return;
    }
  }
  log_event("GEOM_COMPILE_FAILED", result.jobId, key + "\n" + error);
  request->Reject(error);
}

}  // namespace bricked
