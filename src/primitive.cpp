#include <cmath>
#include <raycore/core/primitive.hpp>
#include <raycore/log/logger.hpp>
#include <stdexcept>

namespace raycore::core {

namespace {

// Below this |det| the ray is treated as parallel to the triangle plane.
constexpr double PARALLEL_EPSILON = 1e-12;

bool in_range(double t, double t_min, double t_max) {
  return t > t_min && t < t_max;
}

std::optional<HitRecord> intersect_sphere(const Vec3 &center, double radius, const Ray &ray,
                                          double t_min, double t_max) {
  const Vec3 oc = ray.origin - center;
  const double b = dot(oc, ray.direction);
  const double c = dot(oc, oc) - radius * radius;

  // Origin outside and pointing away
  if (c > 0.0 && b > 0.0)
    return std::nullopt;

  const double discriminant = b * b - c;
  if (discriminant < 0.0)
    return std::nullopt;

  const double sq = std::sqrt(discriminant);
  double t = -b - sq;
  // Far root when the near one is out of range, e.g. a ray leaving glass from inside
  if (!in_range(t, t_min, t_max)) {
    t = -b + sq;
    if (!in_range(t, t_min, t_max))
      return std::nullopt;
  }

  HitRecord hit;
  hit.t = t;
  hit.position = ray.at(t);
  hit.normal = (hit.position - center) / radius;
  return hit;
}

} // namespace

MovingSphere::MovingSphere(const Vec3 &c0, const Vec3 &c1, double t0, double t1, double r)
    : center0(c0), center1(c1), time0(t0), time1(t1), radius(r) {
  if (t0 == t1) {
    RCLOG_ERROR("MovingSphere: time0 and time1 must differ, both are {}", t0);
    throw std::invalid_argument("MovingSphere requires time0 != time1");
  }
}

Vec3 MovingSphere::center_at(double time) const {
  return center0 + (center1 - center0) * ((time - time0) / (time1 - time0));
}

Vec3 Triangle::normal() const {
  return normalize(cross(b - a, c - a));
}

std::optional<HitRecord> intersect(const Sphere &sphere, const Ray &ray, double t_min, double t_max) {
  return intersect_sphere(sphere.center, sphere.radius, ray, t_min, t_max);
}

std::optional<HitRecord> intersect(const MovingSphere &sphere, const Ray &ray, double t_min, double t_max) {
  return intersect_sphere(sphere.center_at(ray.time), sphere.radius, ray, t_min, t_max);
}

// Möller-Trumbore
std::optional<HitRecord> intersect(const Triangle &tri, const Ray &ray, double t_min, double t_max) {
  const Vec3 edge1 = tri.b - tri.a;
  const Vec3 edge2 = tri.c - tri.a;
  const Vec3 h = cross(ray.direction, edge2);
  const double det = dot(edge1, h);
  if (std::abs(det) < PARALLEL_EPSILON)
    return std::nullopt;

  const double f = 1.0 / det;
  const Vec3 s = ray.origin - tri.a;
  const double u = f * dot(s, h);
  if (!(u >= 0.0 && u <= 1.0))
    return std::nullopt;

  const Vec3 q = cross(s, edge1);
  const double v = f * dot(ray.direction, q);
  if (!(v >= 0.0 && u + v <= 1.0))
    return std::nullopt;

  const double t = f * dot(edge2, q);
  if (!in_range(t, t_min, t_max))
    return std::nullopt;

  HitRecord hit;
  hit.t = t;
  hit.position = ray.at(t);
  hit.normal = normalize(cross(edge1, edge2));
  return hit;
}

std::optional<HitRecord> intersect(const Primitive &shape, const Ray &ray, double t_min, double t_max) {
  return std::visit([&](const auto &s) { return intersect(s, ray, t_min, t_max); }, shape);
}

} // namespace raycore::core
