#include <covermock/vision/color_convert_stage.hpp>
#include "frame_cv_utils.hpp"
#include <covermock/core/error.hpp>
#include <covermock/core/frame.hpp>
#include <opencv2/core.hpp>
#include <opencv2/imgproc.hpp>
#include <array>
#include <vector>

namespace covermock::vision {

namespace {

using covermock::core::PixelFormat;

struct Conversion {
  PixelFormat from;
  PixelFormat to;
  int code;
};

constexpr std::array<Conversion, 20> kConversions{{
    {PixelFormat::BGR8, PixelFormat::RGB8, cv::COLOR_BGR2RGB},
    {PixelFormat::RGB8, PixelFormat::BGR8, cv::COLOR_RGB2BGR},
    {PixelFormat::BGRA8, PixelFormat::RGBA8, cv::COLOR_BGRA2RGBA},
    {PixelFormat::RGBA8, PixelFormat::BGRA8, cv::COLOR_RGBA2BGRA},
    {PixelFormat::BGR8, PixelFormat::RGBA8, cv::COLOR_BGR2RGBA},
    {PixelFormat::RGB8, PixelFormat::RGBA8, cv::COLOR_RGB2RGBA},
    {PixelFormat::RGBA8, PixelFormat::RGB8, cv::COLOR_RGBA2RGB},
    {PixelFormat::BGRA8, PixelFormat::RGB8, cv::COLOR_BGRA2RGB},
    {PixelFormat::BGR8, PixelFormat::BGRA8, cv::COLOR_BGR2BGRA},
    {PixelFormat::RGB8, PixelFormat::BGRA8, cv::COLOR_RGB2BGRA},
    {PixelFormat::Grayscale8, PixelFormat::RGB8, cv::COLOR_GRAY2RGB},
    {PixelFormat::Grayscale8, PixelFormat::BGR8, cv::COLOR_GRAY2BGR},
    {PixelFormat::Grayscale8, PixelFormat::RGBA8, cv::COLOR_GRAY2RGBA},
    {PixelFormat::Grayscale8, PixelFormat::BGRA8, cv::COLOR_GRAY2BGRA},
    {PixelFormat::RGB8, PixelFormat::Grayscale8, cv::COLOR_RGB2GRAY},
    {PixelFormat::BGR8, PixelFormat::Grayscale8, cv::COLOR_BGR2GRAY},
    {PixelFormat::RGBA8, PixelFormat::Grayscale8, cv::COLOR_RGBA2GRAY},
    {PixelFormat::BGRA8, PixelFormat::Grayscale8, cv::COLOR_BGRA2GRAY},
    {PixelFormat::BGRA8, PixelFormat::BGR8, cv::COLOR_BGRA2BGR},
    {PixelFormat::RGBA8, PixelFormat::BGR8, cv::COLOR_RGBA2BGR},
}};

}  // namespace

std::expected<covermock::core::Frame, covermock::core::PipelineError>
convert_frame(const covermock::core::Frame& input, PixelFormat output_format) {
  using namespace covermock::core;

  auto mat_in = detail::frame_to_mat(input);
  if (!mat_in) {
    return std::unexpected(PipelineError::InvalidImage);
  }

  if (input.format() == output_format) {
    std::vector<std::byte> buf(input.data().begin(), input.data().end());
    return Frame(input.width(), input.height(), output_format, std::move(buf));
  }

  for (const auto& conv : kConversions) {
    if (conv.from == input.format() && conv.to == output_format) {
      cv::Mat mat_out;
      cv::cvtColor(*mat_in, mat_out, conv.code);
      return detail::mat_to_frame(mat_out, output_format);
    }
  }
  return std::unexpected(PipelineError::InvalidImage);
}

std::expected<covermock::core::Frame, covermock::core::PipelineError>
flatten_onto_white(const covermock::core::Frame& input) {
  using namespace covermock::core;

  if (input.format() != PixelFormat::RGBA8 && input.format() != PixelFormat::BGRA8) {
    return convert_frame(input, input.format());
  }
  auto mat_in = detail::frame_to_mat(input);
  if (!mat_in) {
    return std::unexpected(PipelineError::InvalidImage);
  }

  cv::Mat out(mat_in->rows, mat_in->cols, CV_8UC4);
  for (int y = 0; y < mat_in->rows; ++y) {
    const auto* src = mat_in->ptr<cv::Vec4b>(y);
    auto* dst = out.ptr<cv::Vec4b>(y);
    for (int x = 0; x < mat_in->cols; ++x) {
      const int a = src[x][3];
      for (int c = 0; c < 3; ++c) {
        dst[x][c] = static_cast<uchar>((src[x][c] * a + 255 * (255 - a) + 127) / 255);
      }
      dst[x][3] = 255;
    }
  }
  return detail::mat_to_frame(out, input.format());
}

ColorConvertStage::ColorConvertStage(PixelFormat output_format)
    : output_format_(output_format) {}

std::expected<covermock::core::Frame, covermock::core::PipelineError>
ColorConvertStage::process(const covermock::core::Frame& input) const {
  return convert_frame(input, output_format_);
}

}  // namespace covermock::vision
