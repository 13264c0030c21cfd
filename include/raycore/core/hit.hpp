#pragma once
#include <raycore/core/material.hpp>
#include <raycore/math/vec.hpp>

using namespace raycore::math;

namespace raycore::core {

// Offset applied along the normal to scattered ray origins.
inline constexpr double SURFACE_EPSILON = 1e-4;

struct HitRecord {
  Vec3 position{0, 0, 0};
  Vec3 normal{Z_UNIT_VEC3}; // outward, unit length
  double t{0.0};
  Material material{};
};

} // namespace raycore::core
