#ifndef BRICKED_INTERACTION_STATE_H_
#define BRICKED_INTERACTION_STATE_H_

#include "app_state.h"

namespace bricked_interaction {

// Orbit camera around `target`, Y up.
struct ViewerCamera {
    bricked_app::Vec3 target = {0.0f, 0.0f, 0.0f};
    float yaw_deg = 45.0f;
    float pitch_deg = 30.0f;
    float distance = 160.0f;
    float fov_degrees = 50.0f;
};

constexpr float kMinCameraDistance = 0.25f;
constexpr float kMaxCameraDistance = 4000.0f;

bricked_app::Vec3 CameraPosition(const ViewerCamera &camera);
bricked_app::CameraBasis CameraBasisFor(const bricked_app::Vec3 &eye, const bricked_app::Vec3 &target);

void OrbitCamera(ViewerCamera *camera, int dx, int dy);
void PanCamera(ViewerCamera *camera, int dx, int dy, int viewport_height);
void ZoomCamera(ViewerCamera *camera, float scroll_steps);
void ResetCamera(ViewerCamera *camera);

// Centres on the box and backs off until it fits the field of view.
void FocusCameraOnBounds(ViewerCamera *camera,
                         const bricked_app::Vec3 &bmin,
                         const bricked_app::Vec3 &bmax);

}  // namespace bricked_interaction

#endif  // BRICKED_INTERACTION_STATE_H_
