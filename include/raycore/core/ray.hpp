#pragma once
#include <raycore/math/vec.hpp>

using namespace raycore::math;

namespace raycore::core {

struct Ray {
  Vec3 origin{0, 0, 0};
  Vec3 direction{Z_UNIT_VEC3}; // always unit length
  double time{0.0};            // inside the camera shutter interval

  Ray() = default;
  Ray(const Vec3 &o, const Vec3 &d, double t = 0.0)
      : origin(o), direction(normalize(d)), time(t) {}

  Vec3 at(double t) const { return origin + direction * t; }
};

} // namespace raycore::core
