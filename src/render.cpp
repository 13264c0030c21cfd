#include <atomic>
#include <cmath>
#include <exception>
#include <raycore/core/render.hpp>
#include <raycore/log/logger.hpp>
#include <raycore/math/rng.hpp>
#include <sstream>
#include <stdexcept>
#include <thread>
#include <vector>

namespace raycore::core {

using raycore::math::mix_seed;
using raycore::math::RandomStream;
using raycore::math::seed_for_pixel;

namespace {

// seed_for_pixel keeps pixels apart up to this resolution
constexpr std::size_t MAX_DISTINCT_SIDE = 4096;

void validate(const Camera &camera, const RenderConfig &config) {
  if (config.width == 0 || config.height == 0) {
    RCLOG_ERROR("render: image size must be non-zero, got {}x{}", config.width, config.height);
    throw std::invalid_argument("render: empty image");
  }
  if (config.samples_per_pixel == 0) {
    RCLOG_ERROR("render: samples_per_pixel must be at least 1");
    throw std::invalid_argument("render: zero samples per pixel");
  }
  if (config.width > MAX_DISTINCT_SIDE || config.height > MAX_DISTINCT_SIDE) {
    RCLOG_WARN("render: {}x{} exceeds {} pixels per side, distant pixels share seeds",
               config.width, config.height, MAX_DISTINCT_SIDE);
  }
  if (config.max_depth <= 0) {
    RCLOG_WARN("render: max_depth {} terminates every path immediately", config.max_depth);
  }
  const double image_aspect = static_cast<double>(config.width) / static_cast<double>(config.height);
  if (std::abs(image_aspect - camera.width / camera.height) > 1e-6) {
    RCLOG_WARN("render: image aspect {} differs from camera aspect {}", image_aspect,
               camera.width / camera.height);
  }
}

} // namespace

RenderConfig::RenderConfig(std::size_t w, std::size_t h, std::size_t spp)
    : width(w), height(h), samples_per_pixel(spp) {}

RenderConfig::RenderConfig(std::uint64_t s, std::size_t w, std::size_t h, std::size_t spp)
    : seed(s), width(w), height(h), samples_per_pixel(spp) {}

Image::Image(std::size_t w, std::size_t h) : width(w), height(h), pixels(w * h) {}

Vec3 &Image::at(std::size_t x, std::size_t y) {
  return pixels[y * width + x];
}

const Vec3 &Image::at(std::size_t x, std::size_t y) const {
  return pixels[y * width + x];
}

Vec3 Image::mean() const {
  Vec3 sum{0, 0, 0};
  if (pixels.empty())
    return sum;
  for (const Vec3 &p : pixels)
    sum += p;
  return sum / static_cast<double>(pixels.size());
}

void render_rows(const Camera &camera, const Scene &scene, const RenderConfig &config,
                 Image &image, std::size_t row_begin, std::size_t row_end) {
  const auto frame = static_cast<std::uint32_t>(mix_seed(config.seed, 0));
  const double inv_w = 1.0 / static_cast<double>(config.width);
  const double inv_h = 1.0 / static_cast<double>(config.height);
  const double inv_spp = 1.0 / static_cast<double>(config.samples_per_pixel);

  for (std::size_t y = row_begin; y < row_end; ++y) {
    for (std::size_t x = 0; x < config.width; ++x) {
      RandomStream rng(seed_for_pixel(static_cast<std::uint32_t>(x), static_cast<std::uint32_t>(y), frame));

      Vec3 color{0, 0, 0};
      for (std::size_t s = 0; s < config.samples_per_pixel; ++s) {
        const Vec2 jitter = rng.next_2d();
        const Vec2 uv{(static_cast<double>(x) + jitter.x) * inv_w,
                      1.0 - (static_cast<double>(y) + jitter.y) * inv_h};
        const Ray ray = camera.generate_ray(uv, rng);
        color += trace(ray, scene, rng, config.max_depth, config.background);
      }
      image.at(x, y) = color * inv_spp;
    }
  }
}

Image render(const Camera &camera, const Scene &scene, const RenderConfig &config) {
  validate(camera, config);
  Image image(config.width, config.height);
  render_rows(camera, scene, config, image, 0, config.height);
  return image;
}

Image render_parallel(const Camera &camera, const Scene &scene, const RenderConfig &config) {
  validate(camera, config);

  // Determine number of threads to use
  std::size_t n_threads = config.n_threads;
  if (n_threads == 0)
    n_threads = std::thread::hardware_concurrency();
  if (n_threads == 0)
    n_threads = 1;
  if (n_threads > config.height)
    n_threads = config.height;

  const std::size_t base = config.height / n_threads;
  const std::size_t rem = config.height % n_threads;

  RCLOG_INFO("Rendering {}x{} at {} spp with {} threads ({} objects)", config.width,
             config.height, config.samples_per_pixel, n_threads, scene.size());

  Image image(config.width, config.height);

  // Launch threads
  std::vector<std::thread> workers;
  workers.reserve(n_threads);

  std::atomic<bool> any_error{false};
  std::exception_ptr thread_exception = nullptr;

  std::size_t row = 0;
  for (std::size_t t = 0; t < n_threads; ++t) {
    const std::size_t my_rows = base + (t < rem ? 1u : 0u);
    const std::size_t row_begin = row;
    row += my_rows;

    workers.emplace_back([&, t, row_begin, my_rows]() {
      try {
        std::ostringstream oss;
        oss << std::this_thread::get_id();
        RCLOG_DEBUG("Thread {} (id {}) rendering rows [{}, {})", t, oss.str(), row_begin,
                    row_begin + my_rows);

        render_rows(camera, scene, config, image, row_begin, row_begin + my_rows);
      } catch (...) {
        if (!any_error.exchange(true))
          thread_exception = std::current_exception();
      }
    });
  }

  // Join threads
  for (auto &th : workers)
    th.join();
  if (any_error && thread_exception) {
    std::rethrow_exception(thread_exception);
  }

  const Vec3 mean = image.mean();
  RCLOG_INFO("Render finished. Mean radiance: ({:.4f}, {:.4f}, {:.4f})", mean.x, mean.y, mean.z);
  return image;
}

} // namespace raycore::core
