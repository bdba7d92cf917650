#include "frame_cv_utils.hpp"
#include <covermock/core/frame.hpp>
#include <opencv2/core.hpp>
#include <opencv2/imgproc.hpp>
#include <cstddef>
#include <cstring>
#include <vector>

namespace covermock::vision::detail {

namespace cc = covermock::core;

int cv_type_for(cc::PixelFormat format) noexcept {
  switch (format) {
    case cc::PixelFormat::Grayscale8:
      return CV_8UC1;
    case cc::PixelFormat::RGB8:
    case cc::PixelFormat::BGR8:
      return CV_8UC3;
    case cc::PixelFormat::RGBA8:
    case cc::PixelFormat::BGRA8:
      return CV_8UC4;
    case cc::PixelFormat::Unknown:
    default:
      return -1;
  }
}

int cv_interpolation(Interpolation interpolation) noexcept {
  switch (interpolation) {
    case Interpolation::Nearest:
      return cv::INTER_NEAREST;
    case Interpolation::Area:
      return cv::INTER_AREA;
    case Interpolation::Lanczos:
      return cv::INTER_LANCZOS4;
    case Interpolation::Linear:
    default:
      return cv::INTER_LINEAR;
  }
}

std::optional<cv::Mat> frame_to_mat(const cc::Frame& frame) {
  if (!frame.valid()) return std::nullopt;

  const int type = cv_type_for(frame.format());
  if (type < 0) return std::nullopt;

  const int w = static_cast<int>(frame.width());
  const int h = static_cast<int>(frame.height());
  const std::size_t step = static_cast<std::size_t>(frame.width()) * frame.channels();
  return cv::Mat(h, w, type, const_cast<std::byte*>(frame.data().data()), step);
}

cc::Frame mat_to_frame(const cv::Mat& mat, cc::PixelFormat format) {
  if (mat.empty()) return cc::Frame();

  const cv::Mat packed = mat.isContinuous() ? mat : mat.clone();
  const std::uint32_t w = static_cast<std::uint32_t>(packed.cols);
  const std::uint32_t h = static_cast<std::uint32_t>(packed.rows);
  const std::size_t len = packed.total() * packed.elemSize();
  std::vector<std::byte> buffer(len);
  std::memcpy(buffer.data(), packed.ptr(), len);
  return cc::Frame(w, h, format, std::move(buffer));
}

}  // namespace covermock::vision::detail
