#ifndef BRICKED_PICKING_H_
#define BRICKED_PICKING_H_

#include <vector>

#include "app_state.h"
#include "scene_model.h"

namespace bricked_picking {

struct PickContext {
    int viewport_width = 1;
    int viewport_height = 1;
    float fov_degrees = 50.0f;
    bricked_app::Vec3 eye = {0.0f, 0.0f, 0.0f};
    bricked_app::CameraBasis basis = {};
};

bricked_app::Vec3 CameraRayDirection(int mouse_x, int mouse_y, const PickContext &ctx);

bricked_app::Ray CameraRay(int mouse_x, int mouse_y, const PickContext &ctx);

void WindowMouseToPixel(int mouse_x, int mouse_y,
                        int window_w, int window_h,
                        int pixel_w, int pixel_h,
                        int *out_px, int *out_py);

// Ray against one entry: the ray is moved into the entry's local frame,
// tested against the mesh bounds, then against every triangle.
bool RayHitsEntry(const bricked::SceneEntry &entry, const bricked_app::Ray &ray, double *t_out);

// Nearest visible entry hit by `ray`, or -1.
int PickSceneEntry(const std::vector<bricked::SceneEntry> &entries,
                   const bricked_app::Ray &ray,
                   double *t_out = nullptr);

// Forward intersection with the plane through `point` with normal `normal`.
bool RayHitsPlane(const bricked_app::Ray &ray,
                  const bricked_app::Vec3 &point,
                  const bricked_app::Vec3 &normal,
                  bricked_app::Vec3 *out);

}  // namespace bricked_picking

#endif  // BRICKED_PICKING_H_
