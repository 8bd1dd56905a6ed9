#ifndef SCENELINK_EDITOR_MATH_TYPES_H
#define SCENELINK_EDITOR_MATH_TYPES_H

#include <math.h>

namespace scenelink {
namespace editor {

struct Vector2 {
  float x;
  float y;
  Vector2() : x(0), y(0) {}
  Vector2(float x_, float y_) : x(x_), y(y_) {}
};

struct Vector3 {
  float x;
  float y;
  float z;
  Vector3() : x(0), y(0), z(0) {}
  Vector3(float x_, float y_, float z_) : x(x_), y(y_), z(z_) {}

  Vector3 operator+(const Vector3& o) const { return Vector3(x + o.x, y + o.y, z + o.z); }
  Vector3 operator-(const Vector3& o) const { return Vector3(x - o.x, y - o.y, z - o.z); }
  Vector3 scaled(const Vector3& s) const { return Vector3(x * s.x, y * s.y, z * s.z); }

  static Vector3 one() { return Vector3(1, 1, 1); }
};

struct Vector4 {
  float x;
  float y;
  float z;
  float w;
  Vector4() : x(0), y(0), z(0), w(0) {}
  Vector4(float x_, float y_, float z_, float w_) : x(x_), y(y_), z(z_), w(w_) {}
};

struct Color {
  float r;
  float g;
  float b;
  float a;
  Color() : r(1), g(1), b(1), a(1) {}
  Color(float r_, float g_, float b_, float a_) : r(r_), g(g_), b(b_), a(a_) {}
};

/**
 * @brief Unit quaternion for transform rotations.
 *
 * Euler angles are in degrees and follow the editor's Z, then X, then Y
 * application order (q = qy * qx * qz).
 */
struct Quaternion {
  float x;
  float y;
  float z;
  float w;

  Quaternion() : x(0), y(0), z(0), w(1) {}
  Quaternion(float x_, float y_, float z_, float w_) : x(x_), y(y_), z(z_), w(w_) {}

  Quaternion operator*(const Quaternion& o) const {
    return Quaternion(w * o.x + x * o.w + y * o.z - z * o.y,
                      w * o.y - x * o.z + y * o.w + z * o.x,
                      w * o.z + x * o.y - y * o.x + z * o.w,
                      w * o.w - x * o.x - y * o.y - z * o.z);
  }

  Quaternion inverse() const { return Quaternion(-x, -y, -z, w); }

  Vector3 rotate(const Vector3& v) const {
    const Quaternion p(v.x, v.y, v.z, 0);
    const Quaternion r = (*this) * p * inverse();
    return Vector3(r.x, r.y, r.z);
  }

  static Quaternion fromEuler(const Vector3& degrees);
  Vector3 toEuler() const;
};

constexpr float kDegToRad = 3.14159265358979323846f / 180.0f;
constexpr float kRadToDeg = 180.0f / 3.14159265358979323846f;

inline Quaternion Quaternion::fromEuler(const Vector3& degrees) {
  const float hx = degrees.x * kDegToRad * 0.5f;
  const float hy = degrees.y * kDegToRad * 0.5f;
  const float hz = degrees.z * kDegToRad * 0.5f;
  const Quaternion qx(sinf(hx), 0, 0, cosf(hx));
  const Quaternion qy(0, sinf(hy), 0, cosf(hy));
  const Quaternion qz(0, 0, sinf(hz), cosf(hz));
  return qy * qx * qz;
}

namespace detail {
inline float wrapDegrees(float deg) {
  float out = fmodf(deg, 360.0f);
  if (out < 0) {
    out += 360.0f;
  }
  // Snap values that only differ from 360 by float noise.
  if (out > 359.9995f) {
    out = 0.0f;
  }
  return out;
}
}  // namespace detail

inline Vector3 Quaternion::toEuler() const {
  const float sin_x = 2.0f * (w * x - y * z);
  Vector3 out;
  if (fabsf(sin_x) < 0.9999f) {
    out.x = asinf(sin_x);
    out.y = atan2f(2.0f * (x * z + w * y), 1.0f - 2.0f * (x * x + y * y));
    out.z = atan2f(2.0f * (x * y + w * z), 1.0f - 2.0f * (x * x + z * z));
  } else {
    // Gimbal lock: fold the roll into yaw.
    out.x = sin_x > 0 ? 1.57079632679f : -1.57079632679f;
    out.y = atan2f(2.0f * (w * y - x * z), 1.0f - 2.0f * (y * y + z * z));
    out.z = 0.0f;
  }
  return Vector3(detail::wrapDegrees(out.x * kRadToDeg),
                 detail::wrapDegrees(out.y * kRadToDeg),
                 detail::wrapDegrees(out.z * kRadToDeg));
}

}  // namespace editor
}  // namespace scenelink

#endif  // SCENELINK_EDITOR_MATH_TYPES_H
