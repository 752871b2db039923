#ifndef BRICKED_BUILD_SESSION_H_
#define BRICKED_BUILD_SESSION_H_

#include <cstddef>
#include <cstdint>
#include <string>
#include <vector>

#include "app_state.h"
#include "geometry_cache.h"
#include "geometry_params.h"
#include "mesh_compiler.h"
#include "part.h"
#include "placement.h"
#include "scene_model.h"
#include "selection_state.h"
#include "step_controller.h"

namespace bricked_scene {

bool ComputeEntryBounds(const bricked::SceneEntry &entry,
                        bricked_app::Vec3 *bmin,
                        bricked_app::Vec3 *bmax);

bool ComputeSceneBounds(const std::vector<bricked::SceneEntry> &entries,
                        bool visible_only,
                        bricked_app::Vec3 *bmin,
                        bricked_app::Vec3 *bmax);

// Concatenates every visible entry that has its real mesh, placed in the
// world and rotated back to Z up. Placeholders are skipped.
bool AssembleBuildMesh(const std::vector<bricked::SceneEntry> &entries,
                       manifold::MeshGL *out,
                       std::string *err);

// Owns the part list and wires a description (text or a watched file)
// through parser, geometry cache, scene model, step controller and
// placement engine. Everything runs on the caller's thread; call Tick()
// once per frame.
//
// `compiler` must outlive the session and must not be polled by anyone else.
class BuildSession {
 public:
    explicit BuildSession(bricked::MeshCompiler *compiler,
                          const bricked::GeometryParameters &params = {});

    BuildSession(const BuildSession &) = delete;
    BuildSession &operator=(const BuildSession &) = delete;

    // Replaces the part list with the parse of `text`. Returns the part count.
    size_t LoadDescriptionText(const std::string &text);
    bool LoadDescriptionFile(const std::string &path, std::string *err);
    // Re-reads the watched file when its modification time moved.
    bool ReloadIfChanged(std::string *err);

    // Delivers finished compiles and refreshes the scene. Returns the number
    // of compile results delivered.
    size_t Tick();
    void SyncScene();

    // Clamps to the interactive ranges. Returns true when the effective
    // parameters changed (which rebuilds the scene).
    bool SetGeometryParameters(const bricked::GeometryParameters &params);

    bricked::SelectionState selection() const;
    std::string InstructionLine() const;
    std::string StatusLine() const;

    enum class ExportFormat { Stl, ThreeMf };

    // Writes the visible build (real meshes only) in the Z-up source frame.
    bool Export(const std::string &path, ExportFormat format, std::string *err) const;
    bool ExportStl(const std::string &path, std::string *err) const {
        return Export(path, ExportFormat::Stl, err);
    }
    bool Export3mf(const std::string &path, std::string *err) const {
        return Export(path, ExportFormat::ThreeMf, err);
    }

    const bricked::PartList &parts() const { return parts_; }
    const bricked::GeometryParameters &params() const { return params_; }
    const bricked::SceneModel &scene() const { return scene_; }
    const bricked::GeometryCache &cache() const { return cache_; }
    bricked::StepController &steps() { return steps_; }
    const bricked::StepController &steps() const { return steps_; }
    bricked::PlacementEngine &placement() { return placement_; }
    const bricked::PlacementEngine &placement() const { return placement_; }
    const std::string &path() const { return path_; }
    const std::string &error_text() const { return error_text_; }

 private:
    void ReplaceParts(std::vector<bricked::Part> parts);

    bricked::MeshCompiler *compiler_;
    bricked::PartList parts_;
    bricked::GeometryParameters params_;
    bricked::GeometryCache cache_;
    bricked::SceneModel scene_;
    bricked::StepController steps_;
    bricked::PlacementEngine placement_;

    std::string path_;
    long long last_mtime_ns_;
    std::string error_text_;
    uint64_t loads_;
};

}  // namespace bricked_scene

#endif  // BRICKED_BUILD_SESSION_H_
