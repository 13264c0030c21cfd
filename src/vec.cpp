#include <raycore/math/vec.hpp>

namespace raycore::math {

double dot(const Vec3 &a, const Vec3 &b) {
  return a.x * b.x + a.y * b.y + a.z * b.z;
}

Vec3 cross(const Vec3 &a, const Vec3 &b) {
  return {a.y * b.z - a.z * b.y, a.z * b.x - a.x * b.z, a.x * b.y - a.y * b.x};
}

double norm(const Vec3 &v) {
  return std::sqrt(dot(v, v));
}

double norm2(const Vec3 &v) {
  return dot(v, v);
}

Vec3 normalize(const Vec3 &v) {
  const double n = norm(v);
  return (n > 0) ? (v * (1.0 / n)) : Vec3{0, 0, 0};
}

Vec3 reflect(const Vec3 &v, const Vec3 &n) {
  return v - n * (2.0 * dot(v, n));
}

Vec3 refract(const Vec3 &v, const Vec3 &n, double ni_over_nt) {
  const double dt = dot(v, n);
  const double k = 1.0 - ni_over_nt * ni_over_nt * (1.0 - dt * dt);
  return normalize((v - n * dt) * ni_over_nt - n * std::sqrt(k));
}

Vec3 exp(const Vec3 &v) {
  return {std::exp(v.x), std::exp(v.y), std::exp(v.z)};
}

}
