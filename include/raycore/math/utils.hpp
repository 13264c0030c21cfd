#pragma once
#include <cstddef>
#include <cmath>
#include <algorithm>
#include <raycore/math/vec.hpp>

namespace raycore::math
{
  double deg_to_rad(double degrees);

  Vec3 lerp(const Vec3 &a, const Vec3 &b, double t);

  Vec3 safe_unit(Vec3 v, Vec3 fallback, double eps = 1e-20);

  // sRGB transfer curve. Display-side helpers, the path tracer itself only
  // works with linear-light values.
  double linear_to_gamma(double linear);
  double gamma_to_linear(double encoded);
  Vec3 linear_to_gamma(const Vec3 &linear);
  Vec3 gamma_to_linear(const Vec3 &encoded);
}
