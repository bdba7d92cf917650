#include <covermock/vision/resize.hpp>
#include "frame_cv_utils.hpp"
#include <covermock/core/error.hpp>
#include <covermock/core/frame.hpp>
#include <opencv2/imgproc.hpp>
#include <utility>
#include <vector>

namespace covermock::vision {

std::expected<covermock::core::Frame, covermock::core::PipelineError>
resize_frame(const covermock::core::Frame& input,
             std::uint32_t target_width,
             std::uint32_t target_height,
             Interpolation interpolation) {
  using namespace covermock::core;

  if (target_width == 0 || target_height == 0) {
    return std::unexpected(PipelineError::InvalidImage);
  }
  auto mat_in = detail::frame_to_mat(input);
  if (!mat_in) {
    return std::unexpected(PipelineError::InvalidImage);
  }

  if (input.width() == target_width && input.height() == target_height) {
    std::vector<std::byte> buf(input.data().begin(), input.data().end());
    return Frame(input.width(), input.height(), input.format(), std::move(buf));
  }

  cv::Mat mat_out;
  cv::resize(*mat_in, mat_out,
             cv::Size(static_cast<int>(target_width),
                      static_cast<int>(target_height)),
             0, 0, detail::cv_interpolation(interpolation));

  return detail::mat_to_frame(mat_out, input.format());
}

}  // namespace covermock::vision
