#pragma once
#include <cmath>

namespace raycore::math {

struct Vec3 {
  double x{0.0};
  double y{0.0};
  double z{0.0};

  Vec3() = default;
  Vec3(double x, double y, double z) : x(x), y(y), z(z) {}

  Vec3 &operator+=(const Vec3 &o) {
    x += o.x;
    y += o.y;
    z += o.z;
    return *this;
  }

  Vec3 &operator*=(double s) {
    x *= s;
    y *= s;
    z *= s;
    return *this;
  }
};

struct Vec2 {
  double x{0.0};
  double y{0.0};

  Vec2() = default;
  Vec2(double x, double y) : x(x), y(y) {}
};

inline const Vec3 Y_UNIT_VEC3{0.0, 1.0, 0.0};
inline const Vec3 Z_UNIT_VEC3{0.0, 0.0, 1.0};

inline Vec3 operator+(const Vec3 &a, const Vec3 &b) {
  return {a.x + b.x, a.y + b.y, a.z + b.z};
}
inline Vec3 operator-(const Vec3 &a, const Vec3 &b) {
  return {a.x - b.x, a.y - b.y, a.z - b.z};
}
inline Vec3 operator-(const Vec3 &a) { return {-a.x, -a.y, -a.z}; }
inline Vec3 operator*(const Vec3 &a, double s) {
  return {a.x * s, a.y * s, a.z * s};
}
inline Vec3 operator*(double s, const Vec3 &a) { return a * s; }
inline Vec3 operator/(const Vec3 &a, double s) {
  return {a.x / s, a.y / s, a.z / s};
}
// Component-wise product, used for colors
inline Vec3 operator*(const Vec3 &a, const Vec3 &b) {
  return {a.x * b.x, a.y * b.y, a.z * b.z};
}

inline bool operator==(const Vec3 &a, const Vec3 &b) {
  return a.x == b.x && a.y == b.y && a.z == b.z;
}

double dot(const Vec3 &a, const Vec3 &b);
Vec3 cross(const Vec3 &a, const Vec3 &b);
double norm(const Vec3 &v);
double norm2(const Vec3 &v);
Vec3 normalize(const Vec3 &v);

/// @brief Mirror v about the plane with normal n (n unit length)
Vec3 reflect(const Vec3 &v, const Vec3 &n);

/// @brief Snell's law in vector form
/// @param v Unit incident direction
/// @param n Unit normal on the incident side (dot(v, n) <= 0)
/// @param ni_over_nt Ratio of refractive indices n_i / n_t
/// @return Transmitted unit direction; undefined under total internal reflection
Vec3 refract(const Vec3 &v, const Vec3 &n, double ni_over_nt);

Vec3 exp(const Vec3 &v);

} // namespace raycore::math
