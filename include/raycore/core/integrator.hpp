#pragma once
#include <raycore/core/ray.hpp>
#include <raycore/core/scene.hpp>
#include <raycore/math/rng.hpp>
#include <raycore/math/vec.hpp>

using namespace raycore::math;

namespace raycore::core {

/// @brief Environment seen by rays that leave the scene.
/// Vertical gradient from horizon (dir.y = -1) to zenith (dir.y = +1).
struct Background {
  Vec3 horizon{1.0, 1.0, 1.0};
  Vec3 zenith{0.5, 0.7, 1.0};

  Vec3 radiance(const Ray &ray) const;
};

/// @brief Radiance estimate along one camera ray.
/// Follows closest hit -> scatter until the path leaves the scene, stops
/// scattering, or reaches max_depth bounces. The last two return black.
Vec3 trace(const Ray &ray, const Scene &scene, RandomStream &rng, int max_depth,
           const Background &background = Background{});

} // namespace raycore::core
