#include "build_session.h"

#include <sys/stat.h>

#include <cerrno>
#include <cstdio>
#include <cstring>
#include <exception>
#include <utility>

#include "dsl_parser.h"
#include "instruction_text.h"
#include "log.h"
#include "manifold/meshIO.h"
#include "stl_codec.h"

namespace bricked_scene {

namespace {

using bricked_app::Vec3;

long long file_mtime_ns(const char *path) {
    struct stat st;
    if (!path || stat(path, &st) != 0) return -1;
#if defined(__APPLE__)
    return (long long)st.st_mtimespec.tv_sec * 1000000000LL + (long long)st.st_mtimespec.tv_nsec;
#else
    return (long long)st.st_mtim.tv_sec * 1000000000LL + (long long)st.st_mtim.tv_nsec;
#endif
}

bool read_text_file(const char *path, std::string *out, std::string *err) {
    FILE *f = std::fopen(path, "rb");
    if (!f) {
        if (err) *err = std::string("Cannot open description '") + path + "': " + std::strerror(errno);
        return false;
    }
    std::string text;
    char buf[4096];
    size_t n = 0;
    while ((n = std::fread(buf, 1, sizeof(buf), f)) > 0) text.append(buf, n);
    const bool failed = std::ferror(f) != 0;
    std::fclose(f);
    if (failed) {
        if (err) *err = std::string("Failed reading description '") + path + "'.";
        return false;
    }
    *out = std::move(text);
    return true;
}

void grow_bounds(const Vec3 &p, Vec3 *mn, Vec3 *mx) {
    if (p.x < mn->x) mn->x = p.x;
    if (p.y < mn->y) mn->y = p.y;
    if (p.z < mn->z) mn->z = p.z;
    if (p.x > mx->x) mx->x = p.x;
    if (p.y > mx->y) mx->y = p.y;
    if (p.z > mx->z) mx->z = p.z;
}

}  // namespace

bool ComputeEntryBounds(const bricked::SceneEntry &entry, Vec3 *bmin, Vec3 *bmax) {
    if (!bmin || !bmax || !entry.mesh) return false;
    const bricked_app::Mat3 r = bricked_app::euler_xyz_deg(entry.rotationDeg);
    const Vec3 lo = entry.mesh->bmin;
    const Vec3 hi = entry.mesh->bmax;
    bool initialized = false;
    for (int corner = 0; corner < 8; ++corner) {
        const Vec3 local = {(corner & 1) ? hi.x : lo.x,
                            (corner & 2) ? hi.y : lo.y,
                            (corner & 4) ? hi.z : lo.z};
        const Vec3 world = bricked_app::add(bricked_app::mat3_mul(r, local), entry.position);
        if (!initialized) {
            *bmin = world;
            *bmax = world;
            initialized = true;
            continue;
        }
        grow_bounds(world, bmin, bmax);
    }
    return true;
}

bool ComputeSceneBounds(const std::vector<bricked::SceneEntry> &entries,
                        bool visible_only,
                        Vec3 *bmin,
                        Vec3 *bmax) {
    if (!bmin || !bmax) return false;
    bool initialized = false;
    for (const bricked::SceneEntry &entry : entries) {
        if (visible_only && !entry.visible) continue;
        Vec3 mn;
        Vec3 mx;
        if (!ComputeEntryBounds(entry, &mn, &mx)) continue;
        if (!initialized) {
            *bmin = mn;
            *bmax = mx;
            initialized = true;
            continue;
        }
        grow_bounds(mn, bmin, bmax);
        grow_bounds(mx, bmin, bmax);
    }
    return initialized;
}

bool AssembleBuildMesh(const std::vector<bricked::SceneEntry> &entries,
                       manifold::MeshGL *out,
                       std::string *err) {
    if (!out) {
        if (err) *err = "AssembleBuildMesh received invalid inputs.";
        return false;
    }
    manifold::MeshGL merged;
    merged.numProp = 3;
    for (const bricked::SceneEntry &entry : entries) {
        if (!entry.visible || entry.placeholder || !entry.mesh) continue;
        const bricked::PartMesh &part = *entry.mesh;
        const bricked_app::Mat3 r = bricked_app::euler_xyz_deg(entry.rotationDeg);
        const uint32_t base = (uint32_t)merged.NumVert();
        for (size_t v = 0; v < part.mesh.NumVert(); ++v) {
            const Vec3 world = bricked_app::add(
                bricked_app::mat3_mul(r, bricked::part_mesh_vertex(part, (uint32_t)v)), entry.position);
            // Back to Z up: (x, y, z) -> (x, -z, y).
            merged.vertProperties.push_back(world.x);
            merged.vertProperties.push_back(-world.z);
            merged.vertProperties.push_back(world.y);
        }
        for (uint32_t idx : part.mesh.triVerts) merged.triVerts.push_back(base + idx);
    }
    if (merged.NumTri() == 0) {
        if (err) *err = "No compiled visible parts to export.";
        return false;
    }
    *out = std::move(merged);
    return true;
}

BuildSession::BuildSession(bricked::MeshCompiler *compiler, const bricked::GeometryParameters &params)
    : compiler_(compiler),
      params_(bricked::ClampGeometryParameters(params)),
      cache_(compiler),
      scene_(&cache_),
      steps_(0),
      placement_(&parts_, &scene_),
      last_mtime_ns_(-1),
      loads_(0) {}

void BuildSession::ReplaceParts(std::vector<bricked::Part> parts) {
    placement_.Reset();
    parts_.Replace(std::move(parts));
    steps_.OnPartCountChanged(parts_.size());
    SyncScene();
}

size_t BuildSession::LoadDescriptionText(const std::string &text) {
    ReplaceParts(bricked::ParseBuildDescription(text));
    ++loads_;
    bricked::log_event("SESSION_LOADED", loads_,
                       "parts=" + std::to_string(parts_.size()) + " cursor=" + std::to_string(steps_.cursor()));
    return parts_.size();
}

bool BuildSession::LoadDescriptionFile(const std::string &path, std::string *err) {
    path_ = path;
    last_mtime_ns_ = -1;
    return ReloadIfChanged(err);
}

bool BuildSession::ReloadIfChanged(std::string *err) {
    if (err) err->clear();
    if (path_.empty()) {
        if (err) *err = "No description file is being watched.";
        return false;
    }
    const long long mt = file_mtime_ns(path_.c_str());
    if (mt < 0) {
        std::string local_err = "Cannot stat description '" + path_ + "'.";
        // The last good parts stay loaded.
        error_text_ = local_err;
        if (err) *err = local_err;
        return false;
    }
    if (mt == last_mtime_ns_) return true;
    const bool first = last_mtime_ns_ < 0;
    last_mtime_ns_ = mt;

    std::string text;
    std::string local_err;
    if (!read_text_file(path_.c_str(), &text, &local_err)) {
        error_text_ = local_err;
        if (err) *err = local_err;
        return false;
    }
    if (!first) bricked::log_event("SESSION_RELOAD", loads_ + 1, "path=" + path_);
    LoadDescriptionText(text);
    error_text_.clear();
    return true;
}

size_t BuildSession::Tick() {
    const size_t delivered = compiler_ ? compiler_->Poll() : 0;
    SyncScene();
    return delivered;
}

void BuildSession::SyncScene() {
    const bool rebuilt = scene_.Sync(parts_, params_, steps_.cursor(), selection());
    if (rebuilt && placement_.selected() >= 0) {
        placement_.Reset();
        scene_.Sync(parts_, params_, steps_.cursor(), selection());
    }
}

bool BuildSession::SetGeometryParameters(const bricked::GeometryParameters &params) {
    const bricked::GeometryParameters clamped = bricked::ClampGeometryParameters(params);
    if (clamped == params_) return false;
    params_ = clamped;
    SyncScene();
    return true;
}

bricked::SelectionState BuildSession::selection() const {
    bricked::SelectionState sel;
    sel.selected = placement_.selected();
    sel.autoHighlight = steps_.AutoHighlight(sel.selected);
    return sel;
}

std::string BuildSession::InstructionLine() const {
    return bricked::InstructionLine(parts_, steps_.cursor());
}

std::string BuildSession::StatusLine() const {
    if (!error_text_.empty()) return error_text_;
    return scene_.StatusLine();
}

bool BuildSession::Export(const std::string &path, ExportFormat format, std::string *err) const {
    if (err) err->clear();
    std::string local_err;
    manifold::MeshGL mesh;
    bool ok = !path.empty();
    if (!ok) local_err = "Output path is empty.";
    if (ok) ok = AssembleBuildMesh(scene_.entries(), &mesh, &local_err);
    if (ok && format == ExportFormat::Stl) ok = bricked::WriteBinaryStlFile(path.c_str(), mesh, &local_err);
    if (ok && format == ExportFormat::ThreeMf) {
        try {
            manifold::ExportMesh(path, mesh, manifold::ExportOptions{});
        } catch (const std::exception &e) {
            local_err = std::string("3MF export failed: ") + e.what();
            ok = false;
        }
    }
    if (!ok) {
        bricked::log_event("EXPORT_FAILED", scene_.generation(), local_err);
        if (err) *err = local_err;
        return false;
    }
    bricked::log_event("EXPORT_DONE", scene_.generation(),
                       "path=" + path + " tris=" + std::to_string(mesh.NumTri()));
    return true;
}

}  // namespace bricked_scene
