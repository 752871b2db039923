#ifndef BRICKED_APP_STATE_H_
#define BRICKED_APP_STATE_H_

#include <cmath>

namespace bricked_app {

struct Vec3 {
  float x;
  float y;
  float z;
};

struct Rgb {
  float r;
  float g;
  float b;
};

struct CameraBasis {
  Vec3 forward;
  Vec3 right;
  Vec3 up;
};

// Row-major 3x3 rotation.
struct Mat3 {
  float m[9];
};

struct Ray {
  Vec3 origin;
  Vec3 dir;
};

constexpr float kPi = 3.1415926535f;

inline Vec3 add(const Vec3 &a, const Vec3 &b) { return {a.x + b.x, a.y + b.y, a.z + b.z}; }
inline Vec3 mul(const Vec3 &v, float s) { return {v.x * s, v.y * s, v.z * s}; }
inline Vec3 sub(const Vec3 &a, const Vec3 &b) { return {a.x - b.x, a.y - b.y, a.z - b.z}; }
inline Vec3 cross(const Vec3 &a, const Vec3 &b) {
  return {a.y * b.z - a.z * b.y,
          a.z * b.x - a.x * b.z,
          a.x * b.y - a.y * b.x};
}
inline Vec3 normalize(const Vec3 &v) {
  const float l = std::sqrt(v.x * v.x + v.y * v.y + v.z * v.z);
  if (l < 1e-8f) return {0.0f, 0.0f, 1.0f};
  return {v.x / l, v.y / l, v.z / l};
}
inline float dot(const Vec3 &a, const Vec3 &b) { return a.x * b.x + a.y * b.y + a.z * b.z; }
inline float clampf(float v, float lo, float hi) {
  if (v < lo) return lo;
  if (v > hi) return hi;
  return v;
}
inline float deg_to_rad(float deg) { return deg * kPi / 180.0f; }
inline float rad_to_deg(float rad) { return rad * 180.0f / kPi; }

// Intrinsic X-then-Y-then-Z Euler rotation (R = Rx * Ry * Rz), angles in degrees.
inline Mat3 euler_xyz_deg(const Vec3 &deg) {
  const float a = deg_to_rad(deg.x);
  const float b = deg_to_rad(deg.y);
  const float c = deg_to_rad(deg.z);
  const float ca = std::cos(a), sa = std::sin(a);
  const float cb = std::cos(b), sb = std::sin(b);
  const float cc = std::cos(c), sc = std::sin(c);
  Mat3 r = {{
      cb * cc,                 -cb * sc,                sb,
      ca * sc + sa * sb * cc,  ca * cc - sa * sb * sc,  -sa * cb,
      sa * sc - ca * sb * cc,  sa * cc + ca * sb * sc,  ca * cb,
  }};
  return r;
}
inline Vec3 mat3_mul(const Mat3 &r, const Vec3 &v) {
  return {r.m[0] * v.x + r.m[1] * v.y + r.m[2] * v.z,
          r.m[3] * v.x + r.m[4] * v.y + r.m[5] * v.z,
          r.m[6] * v.x + r.m[7] * v.y + r.m[8] * v.z};
}
inline Mat3 mat3_transpose(const Mat3 &r) {
  Mat3 t = {{r.m[0], r.m[3], r.m[6],
             r.m[1], r.m[4], r.m[7],
             r.m[2], r.m[5], r.m[8]}};
  return t;
}

}  // namespace bricked_app

#endif  // BRICKED_APP_STATE_H_
