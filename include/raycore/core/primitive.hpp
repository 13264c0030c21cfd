#pragma once
#include <optional>
#include <raycore/core/hit.hpp>
#include <raycore/core/ray.hpp>
#include <raycore/math/vec.hpp>
#include <variant>

using namespace raycore::math;

namespace raycore::core {

/// @brief Sphere; a negative radius flips the normal inwards (hollow shells)
struct Sphere {
  Vec3 center{0, 0, 0};
  double radius{1.0};
};

/// @brief Sphere whose center moves linearly from center0 at time0 to center1 at time1
struct MovingSphere {
  Vec3 center0;
  Vec3 center1;
  double time0;
  double time1;
  double radius;

  /// @throws std::invalid_argument when time0 == time1
  MovingSphere(const Vec3 &c0, const Vec3 &c1, double t0, double t1, double r);

  Vec3 center_at(double time) const;
};

/// @brief Triangle; the outward normal follows (b - a) x (c - a)
struct Triangle {
  Vec3 a;
  Vec3 b;
  Vec3 c;

  Vec3 normal() const;
};

using Primitive = std::variant<Sphere, MovingSphere, Triangle>;

// Each routine reports the nearest root strictly inside (t_min, t_max).
// The returned record carries a default material; Scene fills in the
// material of the object that was hit.
std::optional<HitRecord> intersect(const Sphere &sphere, const Ray &ray, double t_min, double t_max);
std::optional<HitRecord> intersect(const MovingSphere &sphere, const Ray &ray, double t_min, double t_max);
std::optional<HitRecord> intersect(const Triangle &tri, const Ray &ray, double t_min, double t_max);
std::optional<HitRecord> intersect(const Primitive &shape, const Ray &ray, double t_min, double t_max);

} // namespace raycore::core
