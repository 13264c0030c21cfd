#include <raycore/math/utils.hpp>

namespace raycore::math
{
  double deg_to_rad(double degrees)
  {
    return degrees * M_PI / 180.0;
  }

  Vec3 lerp(const Vec3 &a, const Vec3 &b, double t)
  {
    return a * (1.0 - t) + b * t;
  }

  Vec3 safe_unit(Vec3 v, Vec3 fallback, double eps)
  {
    double n2 = dot(v, v);
    if (n2 < eps)
    {
      double f2 = dot(fallback, fallback);
      if (f2 < eps)
        return Vec3(1, 0, 0); // last resort
      return fallback * (1.0 / std::sqrt(f2));
    }
    return v * (1.0 / std::sqrt(n2));
  }

  double linear_to_gamma(double linear)
  {
    const double c = std::max(linear, 0.0);
    if (c <= 0.0031308)
      return 12.92 * c;
    return 1.055 * std::pow(c, 1.0 / 2.4) - 0.055;
  }

  double gamma_to_linear(double encoded)
  {
    const double c = std::max(encoded, 0.0);
    if (c <= 0.04045)
      return c / 12.92;
    return std::pow((c + 0.055) / 1.055, 2.4);
  }

  Vec3 linear_to_gamma(const Vec3 &linear)
  {
    return {linear_to_gamma(linear.x), linear_to_gamma(linear.y), linear_to_gamma(linear.z)};
  }

  Vec3 gamma_to_linear(const Vec3 &encoded)
  {
    return {gamma_to_linear(encoded.x), gamma_to_linear(encoded.y), gamma_to_linear(encoded.z)};
  }
}
