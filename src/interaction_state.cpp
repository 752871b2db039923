#include "interaction_state.h"

#include <cmath>

namespace bricked_interaction {

using bricked_app::Vec3;
using bricked_app::CameraBasis;
using bricked_app::add;
using bricked_app::mul;
using bricked_app::sub;
using bricked_app::cross;
using bricked_app::dot;
using bricked_app::normalize;
using bricked_app::clampf;
using bricked_app::deg_to_rad;

Vec3 CameraPosition(const ViewerCamera &camera) {
    const float yaw = deg_to_rad(camera.yaw_deg);
    const float pitch = deg_to_rad(camera.pitch_deg);
    const float cp = std::cos(pitch);
    const Vec3 offset = {
        camera.distance * cp * std::sin(yaw),
        camera.distance * std::sin(pitch),
        camera.distance * cp * std::cos(yaw),
    };
    return add(camera.target, offset);
}

CameraBasis CameraBasisFor(const Vec3 &eye, const Vec3 &target) {
    CameraBasis basis = {{0.0f, 0.0f, 0.0f}, {0.0f, 0.0f, 0.0f}, {0.0f, 0.0f, 0.0f}};
    basis.forward = normalize(sub(target, eye));
    basis.right = normalize(cross(basis.forward, {0.0f, 1.0f, 0.0f}));
    if (dot(basis.right, basis.right) <= 1e-8f) {
        basis.right = {1.0f, 0.0f, 0.0f};
    }
    basis.up = normalize(cross(basis.right, basis.forward));
    return basis;
}

void OrbitCamera(ViewerCamera *camera, int dx, int dy) {
    if (!camera) return;
    camera->yaw_deg -= (float)dx * 0.35f;
    camera->pitch_deg = clampf(camera->pitch_deg + (float)dy * 0.35f, -89.0f, 89.0f);
}

void PanCamera(ViewerCamera *camera, int dx, int dy, int viewport_height) {
    if (!camera) return;
    const Vec3 eye = CameraPosition(*camera);
    const CameraBasis basis = CameraBasisFor(eye, camera->target);
    const float world_per_pixel =
        (2.0f * camera->distance * std::tan(deg_to_rad(camera->fov_degrees) * 0.5f)) /
        (float)(viewport_height > 0 ? viewport_height : 1);
    camera->target = add(camera->target, mul(basis.right, -(float)dx * world_per_pixel));
    camera->target = add(camera->target, mul(basis.up, (float)dy * world_per_pixel));
}

void ZoomCamera(ViewerCamera *camera, float scroll_steps) {
    if (!camera) return;
    camera->distance *= std::pow(0.9f, scroll_steps);
    camera->distance = clampf(camera->distance, kMinCameraDistance, kMaxCameraDistance);
}

void ResetCamera(ViewerCamera *camera) {
    if (!camera) return;
    const float fov = camera->fov_degrees;
    *camera = ViewerCamera{};
    camera->fov_degrees = fov;
}

void FocusCameraOnBounds(ViewerCamera *camera, const Vec3 &bmin, const Vec3 &bmax) {
    if (!camera) return;
    const Vec3 center = mul(add(bmin, bmax), 0.5f);
    const Vec3 diag = sub(bmax, bmin);
    float radius = 0.5f * std::sqrt(dot(diag, diag));
    if (radius < 1e-3f) radius = 1e-3f;
    const float half_fov = deg_to_rad(camera->fov_degrees) * 0.5f;
    const float fit_distance = radius / std::tan(half_fov) * 1.35f;
    camera->target = center;
    camera->distance = clampf(fit_distance, kMinCameraDistance, kMaxCameraDistance);
}

}  // namespace bricked_interaction
