#pragma once

#include <covermock/core/error.hpp>
#include <covermock/core/frame.hpp>
#include <covermock/core/pipeline_stage.hpp>
#include <covermock/core/quad.hpp>
#include <cstdint>
#include <expected>

namespace covermock::vision {

/// Tuning for the forward warp.
struct WarpOptions {
  /// Source ratios are stretched by this much on each side before mapping,
  /// so the warped cover reaches the quad edges without a transparent border.
  double edge_expand{0.02};
  /// Smallest splat radius (Chebyshev, pixels). Grown automatically when
  /// neighbouring source pixels land further apart than the splat can bridge.
  int min_splat_radius{1};
};

/// Maps a unit-square position to the quad by two-stage bilinear interpolation
/// (top and bottom edges along x, then between them along y), after edge expansion.
/// Coordinates are truncated toward zero.
[[nodiscard]] covermock::core::Point map_to_quad(double x_ratio,
                                                 double y_ratio,
                                                 const covermock::core::QuadRegion& quad,
                                                 double edge_expand) noexcept;

/// Splat radius used when warping a source_width x source_height cover into \p quad.
[[nodiscard]] int splat_radius_for(const covermock::core::QuadRegion& quad,
                                   std::uint32_t source_width,
                                   std::uint32_t source_height,
                                   const WarpOptions& options) noexcept;

/// Forward-warps \p cover into \p quad on a transparent RGBA8 canvas.
/// Every source pixel is visited once in row-major order and written opaque to its
/// splat neighbourhood; writes outside the canvas are skipped. A degenerate quad
/// yields a fully transparent canvas. InvalidImage for an invalid cover or empty canvas.
[[nodiscard]] std::expected<covermock::core::Frame, covermock::core::PipelineError>
warp_into_quad(const covermock::core::Frame& cover,
               const covermock::core::QuadRegion& quad,
               std::uint32_t canvas_width,
               std::uint32_t canvas_height,
               const WarpOptions& options = {});

/// Pipeline stage: cover -> warped RGBA8 canvas of template size.
class QuadWarpStage : public covermock::core::IPipelineStage {
 public:
  QuadWarpStage(covermock::core::QuadRegion quad,
                std::uint32_t canvas_width,
                std::uint32_t canvas_height,
                WarpOptions options = {});

  [[nodiscard]] std::expected<covermock::core::Frame,
                              covermock::core::PipelineError>
  process(const covermock::core::Frame& input) const override;

  [[nodiscard]] std::string_view name() const noexcept override { return "quad_warp"; }

 private:
  covermock::core::QuadRegion quad_;
  std::uint32_t canvas_width_;
  std::uint32_t canvas_height_;
  WarpOptions options_;
};

}  // namespace covermock::vision
