#pragma once
#include <cstddef>
#include <raycore/core/ray.hpp>
#include <raycore/math/rng.hpp>
#include <raycore/math/vec.hpp>

using namespace raycore::math;

namespace raycore::core {

/// @brief External parameters of a thin-lens camera
struct CameraConfig {
  Vec3 eye{0, 0, 0};
  Vec3 look_at{0, 0, -1};
  Vec3 up{Y_UNIT_VEC3};
  double vfov_degrees{90.0};
  double aspect{1.0};
  double aperture{0.0};       ///< Lens diameter in multiples of one pixel footprint
  double focus_distance{1.0}; ///< Focal plane distance as a multiple of |eye - look_at|
  double time0{0.0};          ///< Shutter open
  double time1{0.0};          ///< Shutter close
  std::size_t image_width{512};
};

/// @brief Thin-lens camera, immutable once built
struct Camera {
  Vec3 eye;
  Vec3 u; ///< right
  Vec3 v; ///< up
  Vec3 n; ///< backwards, eye - look_at
  double width;       ///< viewport width in world units
  double height;      ///< viewport height in world units
  double lens_radius; ///< zero for a pinhole
  double plane_dist;
  double focus_dist;
  double time0;
  double time1;

  /// @throws std::invalid_argument on a degenerate view or non-positive fov, aspect or width
  explicit Camera(const CameraConfig &config);
  Camera(const Vec3 &eye, const Vec3 &look_at, const Vec3 &up, double vfov_degrees,
         double aspect, double aperture, double focus_distance, double time0,
         double time1, std::size_t image_width);

  bool is_pinhole() const { return lens_radius == 0.0; }

  /// @brief Ray through a normalized image position.
  /// (0, 0) is the bottom-left corner of the viewport, (1, 1) the top-right.
  /// Draws the lens sample (thin lens only) and then the shutter time.
  Ray generate_ray(const Vec2 &uv, RandomStream &rng) const;
};

} // namespace raycore::core
