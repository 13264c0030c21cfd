#pragma once
#include <cstdint>
#include <raycore/math/vec.hpp>

namespace raycore::math {

/// @brief 32-bit multiply-xor-shift mixer over a pair of words
std::uint32_t base_hash(std::uint32_t x, std::uint32_t y);

/// @brief Splitmix derivation of an independent 64-bit seed per index
std::uint64_t mix_seed(std::uint64_t base, std::uint64_t index);

/// @brief Starting seed in [0, 1) for one pixel of one frame.
/// Within a frame the mapping is injective for x, y < 4096, so concurrently
/// evaluated pixels never replay each other's sequence. Larger coordinates
/// wrap modulo 4096.
float seed_for_pixel(std::uint32_t x, std::uint32_t y, std::uint32_t frame = 0);

// Hash-driven random stream. The whole state is one float seed; every draw
// advances it by 0.1 twice and hashes the bit patterns of the two advanced
// values. A stream must not be shared between threads; copy it or derive a
// new one with seed_for_pixel instead.
//
// Uniformity is only checked empirically (mean and chi-square over 1e5
// draws); there is no formal statistical guarantee.
struct RandomStream {
  float seed{0.0f};

  RandomStream() = default;
  explicit RandomStream(float seed) : seed(seed) {}

  double next_scalar();
  Vec2 next_2d();
  Vec3 next_3d();

private:
  std::uint32_t advance();
};

} // namespace raycore::math
