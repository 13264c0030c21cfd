#include <cstdlib>
#include <exception>
#include <raycore/core/camera.hpp>
#include <raycore/core/material.hpp>
#include <raycore/core/primitive.hpp>
#include <raycore/core/render.hpp>
#include <raycore/core/scene.hpp>
#include <raycore/log/logger.hpp>
#include <raycore/math/utils.hpp>
#include <string>
#include <thread>

using namespace raycore::core;

namespace {

Scene build_demo_scene() {
  Scene scene;

  // Ground, two triangles wound counter-clockwise seen from above
  const Material ground = make_diffuse({0.8, 0.8, 0.0});
  scene.add(Triangle{{-50, -1, 50}, {50, -1, 50}, {50, -1, -50}}, ground);
  scene.add(Triangle{{-50, -1, 50}, {50, -1, -50}, {-50, -1, -50}}, ground);

  scene.add(Sphere{{0, 0, -2}, 1.0}, make_diffuse({0.5, 0.5, 0.5}));
  scene.add(Sphere{{2.1, 0, -2}, 1.0}, make_metal({0.8, 0.6, 0.2}, 0.0));

  // Hollow glass: outer shell plus an inverted inner surface
  scene.add(Sphere{{-2.1, 0, -2}, 1.0}, make_dielectric({0.0, 0.0, 0.0}, 1.5));
  scene.add(Sphere{{-2.1, 0, -2}, -0.9}, make_dielectric({0.0, 0.0, 0.0}, 1.5));

  scene.add(MovingSphere({0.0, -0.7, -0.9}, {0.0, -0.5, -0.9}, 0.0, 1.0, 0.2),
            make_dielectric({0.2, 0.8, 0.8}, 1.5));
  return scene;
}

} // namespace

int main(int argc, char **argv) {
  RenderConfig config(2024, 96, 64, 8);
  config.n_threads = std::thread::hardware_concurrency();
  config.max_depth = 8;
  if (argc > 1)
    config.samples_per_pixel = static_cast<std::size_t>(std::stoul(argv[1]));

  CameraConfig cam;
  cam.eye = {0, 0.5, 1.5};
  cam.look_at = {0, 0, -2};
  cam.vfov_degrees = 60.0;
  cam.aspect = static_cast<double>(config.width) / static_cast<double>(config.height);
  cam.aperture = 2.0;
  cam.focus_distance = 1.0;
  cam.time0 = 0.0;
  cam.time1 = 1.0;
  cam.image_width = config.width;

  try {
    const Camera camera(cam);
    const Scene scene = build_demo_scene();
    const Image image = render_parallel(camera, scene, config);
    const auto center = image.at(image.width / 2, image.height / 2);
    RCLOG_INFO("Center pixel radiance: ({:.4f}, {:.4f}, {:.4f})", center.x, center.y, center.z);
    const auto display = raycore::math::linear_to_gamma(center);
    RCLOG_INFO("Center pixel sRGB: ({:.4f}, {:.4f}, {:.4f})", display.x, display.y, display.z);
  } catch (const std::exception &e) {
    RCLOG_ERROR("demo render failed: {}", e.what());
    return EXIT_FAILURE;
  }
  return EXIT_SUCCESS;
}
