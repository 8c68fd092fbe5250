#pragma once
#include <cstddef>
#include <cstdint>
#include <functional>
#include <string_view>

// Self-contained xorshift32 seeded from an FNV-1a hash of a seed string.
// Output is bit-identical across platforms; never touches system entropy.
class SeededRandom {
public:
  explicit SeededRandom(std::string_view seed) noexcept : state_(hash(seed)) {}

  // Uniform in [0, 1].
  double next() noexcept {
    state_ ^= state_ << 13;
    state_ ^= state_ >> 17;
    state_ ^= state_ << 5;
    return static_cast<double>(state_) / 4294967295.0;
  }

  static std::uint32_t hash(std::string_view seed) noexcept {
    std::uint32_t h = 0x811c9dc5u;
    for (const char c : seed) {
      h ^= static_cast<std::uint8_t>(c);
      h *= 0x01000193u;
    }
    return h;
  }

private:
  std::uint32_t state_;
};

using RandomSource = std::function<double()>;

// floor(r * n) clamped into range; r == 1.0 wraps to 0.
inline std::size_t pick_index(double r, std::size_t n) noexcept {
  if (n == 0) {
    return 0;
  }
  return static_cast<std::size_t>(r * static_cast<double>(n)) % n;
}
