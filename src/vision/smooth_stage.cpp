#include <covermock/vision/smooth_stage.hpp>
#include "frame_cv_utils.hpp"
#include <opencv2/core.hpp>
#include <opencv2/imgproc.hpp>

namespace covermock::vision {

namespace cc = covermock::core;

namespace {

bool has_alpha(cc::PixelFormat format) noexcept {
  return format == cc::PixelFormat::RGBA8 || format == cc::PixelFormat::BGRA8;
}

// Color is resampled premultiplied by alpha, so transparent neighbours
// contribute coverage but no color to the edge pixels.
std::expected<cc::Frame, cc::PipelineError> smooth_premultiplied(const cc::Frame& input,
                                                                 int interpolation) {
  auto src = detail::frame_to_mat(input);
  if (!src) return std::unexpected(cc::PipelineError::InvalidImage);

  cv::Mat premultiplied;
  src->convertTo(premultiplied, CV_32FC4, 1.0 / 255.0);
  for (int y = 0; y < premultiplied.rows; ++y) {
    auto* p = premultiplied.ptr<cv::Vec4f>(y);
    for (int x = 0; x < premultiplied.cols; ++x) {
      for (int c = 0; c < 3; ++c) p[x][c] *= p[x][3];
    }
  }

  cv::Mat up;
  cv::Mat down;
  cv::resize(premultiplied, up, cv::Size(src->cols * 2, src->rows * 2), 0, 0, interpolation);
  cv::resize(up, down, src->size(), 0, 0, interpolation);

  cv::Mat out(down.rows, down.cols, CV_8UC4);
  for (int y = 0; y < down.rows; ++y) {
    const auto* d = down.ptr<cv::Vec4f>(y);
    auto* o = out.ptr<cv::Vec4b>(y);
    for (int x = 0; x < down.cols; ++x) {
      const float alpha = d[x][3];
      if (alpha * 255.0f < 0.5f) {
        o[x] = cv::Vec4b(0, 0, 0, 0);
        continue;
      }
      for (int c = 0; c < 3; ++c) o[x][c] = cv::saturate_cast<uchar>(d[x][c] / alpha * 255.0f);
      o[x][3] = cv::saturate_cast<uchar>(alpha * 255.0f);
    }
  }
  return detail::mat_to_frame(out, input.format());
}

}  // namespace

SmoothStage::SmoothStage(Interpolation interpolation) : interpolation_(interpolation) {}

std::expected<cc::Frame, cc::PipelineError> SmoothStage::process(const cc::Frame& input) const {
  if (!input.valid()) {
    return std::unexpected(cc::PipelineError::InvalidImage);
  }
  if (has_alpha(input.format())) {
    return smooth_premultiplied(input, detail::cv_interpolation(interpolation_));
  }
  auto up = resize_frame(input, input.width() * 2, input.height() * 2, interpolation_);
  if (!up) return std::unexpected(up.error());
  return resize_frame(*up, input.width(), input.height(), interpolation_);
}

}  // namespace covermock::vision
