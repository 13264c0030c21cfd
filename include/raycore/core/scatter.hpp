#pragma once
#include <optional>
#include <raycore/core/hit.hpp>
#include <raycore/core/ray.hpp>
#include <raycore/math/rng.hpp>

using namespace raycore::math;

namespace raycore::core {

struct ScatterRecord {
  Vec3 attenuation{1.0, 1.0, 1.0};
  Ray scattered;
};

/// @brief Scatter an incoming ray at a surface hit.
///
/// Diffuse attenuation already contains the cosine term and the 1/pi of the
/// Lambertian BRDF; callers multiply it into the path throughput as-is.
/// Every material currently produces a scattered ray.
/// @param ray_in Incoming ray
/// @param hit Hit record produced by an intersection routine
/// @param rng Per-sample random stream, advanced by the draws taken here
std::optional<ScatterRecord> scatter(const Ray &ray_in, const HitRecord &hit, RandomStream &rng);

} // namespace raycore::core
