#include <covermock/vision/quad_warp_stage.hpp>
#include "frame_cv_utils.hpp"
#include <covermock/vision/color_convert_stage.hpp>
#include <opencv2/core.hpp>
#include <algorithm>
#include <cmath>
#include <cstdlib>

namespace covermock::vision {

namespace cc = covermock::core;

namespace {

double expand_ratio(double ratio, double edge_expand) noexcept {
  const double span = 1.0 - 2.0 * edge_expand;
  const double r = span > 0.0 ? (ratio - edge_expand) / span : 0.5;
  return std::clamp(r, 0.0, 1.0);
}

int chebyshev(const cc::Point& a, const cc::Point& b) noexcept {
  return std::max(std::abs(a.x - b.x), std::abs(a.y - b.y));
}

}  // namespace

cc::Point map_to_quad(double x_ratio,
                      double y_ratio,
                      const cc::QuadRegion& quad,
                      double edge_expand) noexcept {
  const double ex = expand_ratio(x_ratio, edge_expand);
  const double ey = expand_ratio(y_ratio, edge_expand);

  const double top_x = quad.top_left.x + ex * (quad.top_right.x - quad.top_left.x);
  const double top_y = quad.top_left.y + ex * (quad.top_right.y - quad.top_left.y);
  const double bottom_x = quad.bottom_left.x + ex * (quad.bottom_right.x - quad.bottom_left.x);
  const double bottom_y = quad.bottom_left.y + ex * (quad.bottom_right.y - quad.bottom_left.y);

  const double x = top_x + ey * (bottom_x - top_x);
  const double y = top_y + ey * (bottom_y - top_y);
  return cc::Point{static_cast<std::int32_t>(x), static_cast<std::int32_t>(y)};
}

int splat_radius_for(const cc::QuadRegion& quad,
                     std::uint32_t source_width,
                     std::uint32_t source_height,
                     const WarpOptions& options) noexcept {
  int radius = std::max(1, options.min_splat_radius);
  if (source_width == 0 || source_height == 0) return radius;

  const double span = std::max(1.0 - 2.0 * options.edge_expand, 1e-6);
  const double across = std::max(chebyshev(quad.top_left, quad.top_right),
                                 chebyshev(quad.bottom_left, quad.bottom_right));
  const double down = std::max(chebyshev(quad.top_left, quad.bottom_left),
                               chebyshev(quad.top_right, quad.bottom_right));
  const double spacing = std::max(across / (source_width * span), down / (source_height * span));

  // One extra pixel absorbs coordinate truncation and the face's shear.
  if (spacing > 1.0) {
    radius = std::max(radius, static_cast<int>(std::ceil(spacing / 2.0)) + 1);
  }
  return radius;
}

std::expected<cc::Frame, cc::PipelineError> warp_into_quad(const cc::Frame& cover,
                                                           const cc::QuadRegion& quad,
                                                           std::uint32_t canvas_width,
                                                           std::uint32_t canvas_height,
                                                           const WarpOptions& options) {
  if (canvas_width == 0 || canvas_height == 0) {
    return std::unexpected(cc::PipelineError::InvalidImage);
  }
  auto rgba = convert_frame(cover, cc::PixelFormat::RGBA8);
  if (!rgba) return std::unexpected(rgba.error());
  auto src = detail::frame_to_mat(*rgba);
  if (!src) return std::unexpected(cc::PipelineError::InvalidImage);

  const int cw = static_cast<int>(canvas_width);
  const int ch = static_cast<int>(canvas_height);
  cv::Mat canvas(ch, cw, CV_8UC4, cv::Scalar(0, 0, 0, 0));
  if (quad.is_degenerate()) {
    return detail::mat_to_frame(canvas, cc::PixelFormat::RGBA8);
  }

  const int sw = src->cols;
  const int sh = src->rows;
  const int radius = splat_radius_for(quad, cover.width(), cover.height(), options);

  for (int sy = 0; sy < sh; ++sy) {
    const auto* row = src->ptr<cv::Vec4b>(sy);
    const double y_ratio = static_cast<double>(sy) / sh;
    for (int sx = 0; sx < sw; ++sx) {
      const cc::Point dest =
          map_to_quad(static_cast<double>(sx) / sw, y_ratio, quad, options.edge_expand);
      if (dest.x < 0 || dest.x >= cw || dest.y < 0 || dest.y >= ch) continue;

      cv::Vec4b pixel = row[sx];
      pixel[3] = 255;

      const int y0 = std::max(0, dest.y - radius);
      const int y1 = std::min(ch - 1, dest.y + radius);
      const int x0 = std::max(0, dest.x - radius);
      const int x1 = std::min(cw - 1, dest.x + radius);
      for (int y = y0; y <= y1; ++y) {
        auto* out = canvas.ptr<cv::Vec4b>(y);
        for (int x = x0; x <= x1; ++x) out[x] = pixel;
      }
    }
  }

  return detail::mat_to_frame(canvas, cc::PixelFormat::RGBA8);
}

QuadWarpStage::QuadWarpStage(cc::QuadRegion quad,
                             std::uint32_t canvas_width,
                             std::uint32_t canvas_height,
                             WarpOptions options)
    : quad_(quad),
      canvas_width_(canvas_width),
      canvas_height_(canvas_height),
      options_(options) {}

std::expected<cc::Frame, cc::PipelineError> QuadWarpStage::process(const cc::Frame& input) const {
  return warp_into_quad(input, quad_, canvas_width_, canvas_height_, options_);
}

}  // namespace covermock::vision
