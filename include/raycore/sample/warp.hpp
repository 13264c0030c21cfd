#pragma once
#include <raycore/math/rng.hpp>
#include <raycore/math/vec.hpp>

using namespace raycore::math;

namespace raycore::sample {

/// @brief Uniform point in the unit disk, polar mapping r = sqrt(u1), theta = 2 pi u2
Vec2 uniform_in_unit_disk(RandomStream &rng);

/// @brief Uniform point inside the unit ball (not on its surface)
Vec3 uniform_in_unit_sphere(RandomStream &rng);

/// @brief Uniform unit vector. Added to a surface normal it yields a
/// cosine-weighted direction about that normal.
Vec3 cosine_weighted_hemisphere_direction(RandomStream &rng);

} // namespace raycore::sample
