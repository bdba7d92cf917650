#pragma once

#include <cstdint>

namespace covermock::core {

/// Integer pixel coordinate on the template canvas.
struct Point {
  std::int32_t x{0};
  std::int32_t y{0};

  friend constexpr bool operator==(const Point&, const Point&) = default;
};

/// Destination face for the warped cover, corners in template pixel space.
/// Not required to be a parallelogram: the right edge may span a different
/// vertical range than the left edge.
struct QuadRegion {
  Point top_left;
  Point top_right;
  Point bottom_right;
  Point bottom_left;

  /// max - min over the corner x coordinates.
  [[nodiscard]] std::int32_t width_span() const noexcept;
  /// max - min over the corner y coordinates.
  [[nodiscard]] std::int32_t height_span() const noexcept;

  /// Collapsed to a vertical or horizontal line (or a point). Self-intersecting
  /// quads with extent in both directions are not degenerate.
  [[nodiscard]] bool is_degenerate() const noexcept {
    return width_span() == 0 || height_span() == 0;
  }

  friend constexpr bool operator==(const QuadRegion&, const QuadRegion&) = default;
};

/// Face calibrated for the shipped book templates.
[[nodiscard]] constexpr QuadRegion default_quad() noexcept {
  return QuadRegion{{614, 374}, {1200, 286}, {1200, 1860}, {614, 1730}};
}

}  // namespace covermock::core
