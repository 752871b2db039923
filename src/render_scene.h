#ifndef BRICKED_RENDER_SCENE_H_
#define BRICKED_RENDER_SCENE_H_

#include "scene_model.h"

namespace bricked_render_scene {

constexpr float kPlaceholderOpacity = 0.35f;

// Stud-pitch floor grid on the Y = 0 plane.
void DrawGrid(int half_cells);

// Opaque entries, then translucent placeholders, then an outline around the
// emphasised entry. Expects lighting and depth test already configured.
void DrawScene(const bricked::SceneModel &scene);

}  // namespace bricked_render_scene

#endif  // BRICKED_RENDER_SCENE_H_
