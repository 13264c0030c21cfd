#include <raycore/math/rng.hpp>
#include <algorithm>
#include <bit>

namespace raycore::math {

namespace {

constexpr std::uint32_t kHashMul = 1103515245u;
constexpr std::uint32_t kSpreadA = 48271u;
constexpr std::uint32_t kSpreadB = 16807u;
constexpr std::uint32_t kMask31 = 0x7fffffffu;
constexpr double kNorm31 = 2147483647.0;
constexpr float kSeedStep = 0.1f;

// Pixel seeds are 24-bit fractions k / 2^24, every one exactly representable
// as a float in [0, 1). Coordinates contribute 12 bits each.
constexpr std::uint32_t kPixelBits = 12u;
constexpr std::uint32_t kPixelMask = (1u << kPixelBits) - 1u;
constexpr std::uint32_t kMask24 = 0xffffffu;
constexpr float kInv24 = 1.0f / 16777216.0f;

// Largest double strictly below 1.
constexpr double kOneMinusEps = 0x1.fffffffffffffp-1;

double to_unit(std::uint32_t n) {
  return std::min(static_cast<double>(n & kMask31) / kNorm31, kOneMinusEps);
}

} // namespace

std::uint32_t base_hash(std::uint32_t x, std::uint32_t y) {
  const std::uint32_t px = kHashMul * ((x >> 1u) ^ y);
  const std::uint32_t py = kHashMul * ((y >> 1u) ^ x);
  const std::uint32_t h32 = kHashMul * (px ^ (py >> 3u));
  return h32 ^ (h32 >> 16u);
}

std::uint64_t mix_seed(std::uint64_t base, std::uint64_t index) {
  std::uint64_t z = base + 0x9E3779B97F4A7C15ULL * (index + 1);
  z = (z ^ (z >> 30)) * 0xBF58476D1CE4E5B9ULL;
  z = (z ^ (z >> 27)) * 0x94D049BB133111EBULL;
  return z ^ (z >> 31);
}

float seed_for_pixel(std::uint32_t x, std::uint32_t y, std::uint32_t frame) {
  std::uint32_t k = ((y & kPixelMask) << kPixelBits) | (x & kPixelMask);

  // Keyed permutation of the 24-bit pixel index: xor with a per-frame key,
  // odd multiplies and xor-shifts are all bijective modulo 2^24.
  k ^= base_hash(frame, ~frame) & kMask24;
  k = (k * 0x9E3779u) & kMask24;
  k ^= k >> 12u;
  k = (k * 0x2C1B3Du) & kMask24;
  k ^= k >> 11u;

  return static_cast<float>(k) * kInv24;
}

std::uint32_t RandomStream::advance() {
  seed += kSeedStep;
  const float a = seed;
  seed += kSeedStep;
  const float b = seed;
  return base_hash(std::bit_cast<std::uint32_t>(a), std::bit_cast<std::uint32_t>(b));
}

double RandomStream::next_scalar() {
  return to_unit(advance());
}

Vec2 RandomStream::next_2d() {
  const std::uint32_t n = advance();
  return {to_unit(n), to_unit(n * kSpreadA)};
}

Vec3 RandomStream::next_3d() {
  const std::uint32_t n = advance();
  return {to_unit(n), to_unit(n * kSpreadB), to_unit(n * kSpreadA)};
}

} // namespace raycore::math
