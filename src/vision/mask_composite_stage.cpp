#include <covermock/vision/mask_composite_stage.hpp>
#include "frame_cv_utils.hpp"
#include <covermock/vision/color_convert_stage.hpp>
#include <covermock/vision/resize.hpp>
#include <opencv2/core.hpp>
#include <cstdint>

namespace covermock::vision {

namespace cc = covermock::core;

namespace {

constexpr std::uint32_t kFullWeight = 255u * 255u;

std::uint8_t blend(std::uint32_t base, std::uint32_t top, std::uint32_t weight) noexcept {
  return static_cast<std::uint8_t>(
      (base * (kFullWeight - weight) + top * weight + kFullWeight / 2) / kFullWeight);
}

}  // namespace

std::expected<cc::Frame, cc::PipelineError> composite_through_mask(const cc::Frame& base,
                                                                   const cc::Frame& layer,
                                                                   const cc::Frame& mask) {
  if (base.format() != cc::PixelFormat::RGBA8 || layer.format() != cc::PixelFormat::RGBA8 ||
      mask.format() != cc::PixelFormat::Grayscale8) {
    return std::unexpected(cc::PipelineError::CompositingFailure);
  }
  auto base_mat = detail::frame_to_mat(base);
  auto layer_mat = detail::frame_to_mat(layer);
  auto mask_mat = detail::frame_to_mat(mask);
  if (!base_mat || !layer_mat || !mask_mat) {
    return std::unexpected(cc::PipelineError::CompositingFailure);
  }
  if (base_mat->size() != layer_mat->size() || base_mat->size() != mask_mat->size()) {
    return std::unexpected(cc::PipelineError::CompositingFailure);
  }

  cv::Mat out(base_mat->rows, base_mat->cols, CV_8UC4);
  for (int y = 0; y < out.rows; ++y) {
    const auto* b = base_mat->ptr<cv::Vec4b>(y);
    const auto* l = layer_mat->ptr<cv::Vec4b>(y);
    const auto* m = mask_mat->ptr<uchar>(y);
    auto* o = out.ptr<cv::Vec4b>(y);
    for (int x = 0; x < out.cols; ++x) {
      const std::uint32_t weight = static_cast<std::uint32_t>(m[x]) * l[x][3];
      if (weight == 0) {
        o[x] = b[x];
        continue;
      }
      for (int c = 0; c < 3; ++c) o[x][c] = blend(b[x][c], l[x][c], weight);
      o[x][3] = blend(b[x][3], 255, weight);
    }
  }
  return detail::mat_to_frame(out, cc::PixelFormat::RGBA8);
}

MaskCompositeStage::MaskCompositeStage(const cc::Frame& book_template,
                                       const cc::Frame& mask) {
  auto rgba = convert_frame(book_template, cc::PixelFormat::RGBA8);
  if (!rgba) return;

  auto gray = convert_frame(mask, cc::PixelFormat::Grayscale8);
  if (!gray) return;
  auto fitted = resize_frame(*gray, rgba->width(), rgba->height(), Interpolation::Lanczos);
  if (!fitted) return;

  template_rgba_ = std::move(*rgba);
  mask_ = std::move(*fitted);
}

std::expected<cc::Frame, cc::PipelineError> MaskCompositeStage::process(
    const cc::Frame& input) const {
  if (!is_ready()) {
    return std::unexpected(cc::PipelineError::CompositingFailure);
  }
  auto layer = convert_frame(input, cc::PixelFormat::RGBA8);
  if (!layer) return std::unexpected(cc::PipelineError::CompositingFailure);
  return composite_through_mask(template_rgba_, *layer, mask_);
}

}  // namespace covermock::vision
