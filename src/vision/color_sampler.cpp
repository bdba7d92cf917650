#include <covermock/vision/color_sampler.hpp>
#include <covermock/vision/color_convert_stage.hpp>
#include <covermock/vision/resize.hpp>
#include <unordered_map>
#include <vector>

namespace covermock::vision {

namespace cc = covermock::core;

namespace {

std::uint32_t pack(const cc::Rgb& c) noexcept {
  return (static_cast<std::uint32_t>(c.r) << 16) | (static_cast<std::uint32_t>(c.g) << 8) | c.b;
}

cc::Rgb mode_of(const std::vector<cc::Rgb>& pixels) {
  std::unordered_map<std::uint32_t, std::size_t> counts;
  counts.reserve(pixels.size());
  for (const auto& p : pixels) ++counts[pack(p)];

  cc::Rgb best = pixels.front();
  std::size_t best_count = 0;
  for (const auto& p : pixels) {
    const std::size_t n = counts[pack(p)];
    if (n > best_count) {
      best = p;
      best_count = n;
    }
  }
  return best;
}

}  // namespace

std::expected<cc::Rgb, cc::PipelineError> sample_dominant_color(const cc::Frame& cover,
                                                               const SamplerOptions& options) {
  if (!cover.valid() || options.grid == 0) {
    return std::unexpected(cc::PipelineError::InvalidImage);
  }

  auto rgb = convert_frame(cover, cc::PixelFormat::RGB8);
  if (!rgb) return std::unexpected(rgb.error());
  auto small = resize_frame(*rgb, options.grid, options.grid, Interpolation::Area);
  if (!small) return std::unexpected(small.error());

  const auto bytes = small->data();
  std::vector<cc::Rgb> all;
  std::vector<cc::Rgb> kept;
  all.reserve(bytes.size() / 3);
  kept.reserve(bytes.size() / 3);
  for (std::size_t i = 0; i + 2 < bytes.size(); i += 3) {
    const cc::Rgb px{std::to_integer<std::uint8_t>(bytes[i]),
                     std::to_integer<std::uint8_t>(bytes[i + 1]),
                     std::to_integer<std::uint8_t>(bytes[i + 2])};
    all.push_back(px);
    const std::uint32_t sum = static_cast<std::uint32_t>(px.r) + px.g + px.b;
    if (sum < options.brightness_threshold) kept.push_back(px);
  }

  return mode_of(kept.empty() ? all : kept);
}

}  // namespace covermock::vision
