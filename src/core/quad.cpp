#include <covermock/core/quad.hpp>
#include <algorithm>

namespace covermock::core {

std::int32_t QuadRegion::width_span() const noexcept {
  const auto [lo, hi] = std::minmax({top_left.x, top_right.x, bottom_right.x, bottom_left.x});
  return hi - lo;
}

std::int32_t QuadRegion::height_span() const noexcept {
  const auto [lo, hi] = std::minmax({top_left.y, top_right.y, bottom_right.y, bottom_left.y});
  return hi - lo;
}

}  // namespace covermock::core
