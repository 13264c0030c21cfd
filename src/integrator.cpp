#include <raycore/core/integrator.hpp>
#include <raycore/core/scatter.hpp>
#include <raycore/math/utils.hpp>

namespace raycore::core {

Vec3 Background::radiance(const Ray &ray) const {
  const double t = 0.5 * (ray.direction.y + 1.0);
  return lerp(horizon, zenith, t);
}

Vec3 trace(const Ray &ray, const Scene &scene, RandomStream &rng, int max_depth,
           const Background &background) {
  Vec3 throughput{1.0, 1.0, 1.0};
  Ray current = ray;

  for (int depth = 0; depth < max_depth; ++depth) {
    const auto hit = closest_hit(scene, current);
    if (!hit)
      return throughput * background.radiance(current);

    const auto scattered = scatter(current, *hit, rng);
    if (!scattered)
      return Vec3{0, 0, 0};

    throughput = throughput * scattered->attenuation;
    current = scattered->scattered;
  }

  // Bounce limit
  return Vec3{0, 0, 0};
}

} // namespace raycore::core
