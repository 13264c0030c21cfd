#pragma once
#include <cstddef>
#include <cstdint>
#include <random>
#include <raycore/core/camera.hpp>
#include <raycore/core/integrator.hpp>
#include <raycore/core/scene.hpp>
#include <raycore/math/vec.hpp>
#include <vector>

using namespace raycore::math;

namespace raycore::core
{

  struct RenderConfig
  {
    std::uint64_t seed = std::random_device{}();
    std::size_t n_threads = 1; // 0 = hardware concurrency
    std::size_t width = 64;
    std::size_t height = 64;
    std::size_t samples_per_pixel = 16;
    int max_depth = 8;
    Background background{};

    RenderConfig() = default;
    RenderConfig(std::size_t w, std::size_t h, std::size_t spp);
    RenderConfig(std::uint64_t s, std::size_t w, std::size_t h, std::size_t spp);
  };

  /// @brief Linear-light accumulation buffer, row 0 at the top
  struct Image
  {
    std::size_t width;
    std::size_t height;
    std::vector<Vec3> pixels;

    Image(std::size_t w, std::size_t h);

    Vec3 &at(std::size_t x, std::size_t y);
    const Vec3 &at(std::size_t x, std::size_t y) const;
    Vec3 mean() const;
  };

  /// @brief Render every pixel on the calling thread
  Image render(const Camera &camera, const Scene &scene, const RenderConfig &config);

  /// @brief Render with rows split across worker threads.
  /// Pixels are seeded from their coordinates, so the result does not
  /// depend on the thread count.
  Image render_parallel(const Camera &camera, const Scene &scene, const RenderConfig &config);

  /// @brief Render rows [row_begin, row_end) into image
  void render_rows(const Camera &camera, const Scene &scene, const RenderConfig &config,
                   Image &image, std::size_t row_begin, std::size_t row_end);

} // namespace raycore::core
