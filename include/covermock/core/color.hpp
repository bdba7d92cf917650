#pragma once

#include <cmath>
#include <cstdint>

namespace covermock::core {

/// Representative color of an image (RGB, 0-255 per channel).
struct Rgb {
  std::uint8_t r{0};
  std::uint8_t g{0};
  std::uint8_t b{0};

  friend constexpr bool operator==(const Rgb&, const Rgb&) = default;
};

/// Euclidean distance in RGB space.
[[nodiscard]] inline double color_distance(const Rgb& a, const Rgb& b) noexcept {
  const double dr = static_cast<double>(a.r) - b.r;
  const double dg = static_cast<double>(a.g) - b.g;
  const double db = static_cast<double>(a.b) - b.b;
  return std::sqrt(dr * dr + dg * dg + db * db);
}

}  // namespace covermock::core
