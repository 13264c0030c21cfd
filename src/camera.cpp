#include <cmath>
#include <raycore/core/camera.hpp>
#include <raycore/log/logger.hpp>
#include <raycore/math/utils.hpp>
#include <raycore/sample/warp.hpp>
#include <stdexcept>

namespace raycore::core {

Camera::Camera(const CameraConfig &config)
    : Camera(config.eye, config.look_at, config.up, config.vfov_degrees, config.aspect,
             config.aperture, config.focus_distance, config.time0, config.time1,
             config.image_width) {}

Camera::Camera(const Vec3 &eye, const Vec3 &look_at, const Vec3 &up, double vfov_degrees,
               double aspect, double aperture, double focus_distance, double time0,
               double time1, std::size_t image_width)
    : eye(eye), time0(time0), time1(time1) {
  if (!(vfov_degrees > 0.0 && vfov_degrees < 180.0)) {
    RCLOG_ERROR("Camera: vertical fov must be in (0, 180) degrees, got {}", vfov_degrees);
    throw std::invalid_argument("Camera: invalid vertical field of view");
  }
  if (!(aspect > 0.0)) {
    RCLOG_ERROR("Camera: aspect ratio must be positive, got {}", aspect);
    throw std::invalid_argument("Camera: invalid aspect ratio");
  }
  if (image_width == 0) {
    RCLOG_ERROR("Camera: image width must be at least one pixel");
    throw std::invalid_argument("Camera: invalid image width");
  }

  plane_dist = norm(eye - look_at);
  if (!(plane_dist > 0.0)) {
    RCLOG_ERROR("Camera: eye and look_at coincide");
    throw std::invalid_argument("Camera: eye equals look_at");
  }

  n = normalize(eye - look_at);
  const Vec3 side = cross(up, n);
  if (norm(side) < 1e-12) {
    RCLOG_ERROR("Camera: up vector is parallel to the view direction");
    throw std::invalid_argument("Camera: degenerate up vector");
  }
  u = normalize(side);
  v = cross(n, u);

  height = 2.0 * plane_dist * std::tan(deg_to_rad(vfov_degrees) / 2.0);
  width = aspect * height;

  if (aperture < 0.0) {
    RCLOG_WARN("Camera: negative aperture {} treated as a pinhole", aperture);
    aperture = 0.0;
  }
  lens_radius = aperture / 2.0 * width / static_cast<double>(image_width);
  if (lens_radius > 0.0 && !(focus_distance > 0.0)) {
    RCLOG_WARN("Camera: focus distance ratio should be positive, got {}", focus_distance);
  }
  focus_dist = (lens_radius == 0.0) ? 1.0 : focus_distance;

  if (time1 < time0) {
    RCLOG_WARN("Camera: shutter closes ({}) before it opens ({})", time1, time0);
  }

  RCLOG_DEBUG("Camera: viewport {}x{}, lens radius {}, focus {}", width, height, lens_radius, focus_dist);
}

Ray Camera::generate_ray(const Vec2 &uv, RandomStream &rng) const {
  Vec3 offset{0, 0, 0};
  if (!is_pinhole()) {
    const Vec2 rd = sample::uniform_in_unit_disk(rng);
    offset = (u * rd.x + v * rd.y) * lens_radius;
  }
  const double time = time0 + rng.next_scalar() * (time1 - time0);

  // Image plane point relative to the eye
  const Vec3 p = u * ((uv.x - 0.5) * width) + v * ((uv.y - 0.5) * height) - n * plane_dist;
  if (is_pinhole())
    return Ray(eye, p, time);

  const Vec3 focal = p * focus_dist;
  return Ray(eye + offset, focal - offset, time);
}

} // namespace raycore::core
