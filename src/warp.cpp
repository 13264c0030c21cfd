#include <raycore/sample/warp.hpp>
#include <raycore/math/utils.hpp>
#include <cmath>

namespace raycore::sample {

Vec2 uniform_in_unit_disk(RandomStream &rng) {
  const Vec2 h = rng.next_2d();
  const double r = std::sqrt(h.x);
  const double theta = 2.0 * M_PI * h.y;
  return {r * std::sin(theta), r * std::cos(theta)};
}

Vec3 uniform_in_unit_sphere(RandomStream &rng) {
  const Vec3 h = rng.next_3d();
  const double z = 2.0 * h.x - 1.0;
  const double phi = 2.0 * M_PI * h.y;
  const double r = std::cbrt(h.z);
  const double s = std::sqrt(std::max(0.0, 1.0 - z * z));
  return Vec3{s * std::cos(phi), s * std::sin(phi), z} * r;
}

Vec3 cosine_weighted_hemisphere_direction(RandomStream &rng) {
  // r == 0 collapses the sample onto the origin
  return safe_unit(uniform_in_unit_sphere(rng), Z_UNIT_VEC3);
}

} // namespace raycore::sample
