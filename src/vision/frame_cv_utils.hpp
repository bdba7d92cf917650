#pragma once

#include <covermock/core/frame.hpp>
#include <covermock/vision/resize.hpp>
#include <opencv2/core/mat.hpp>
#include <optional>

namespace covermock::vision::detail {

/// Convert Frame to cv::Mat (non-owning view over the frame buffer).
/// Returns nullopt if the frame is invalid or its format unsupported.
std::optional<cv::Mat> frame_to_mat(const covermock::core::Frame& frame);

/// Convert cv::Mat (8-bit, 1/3/4 channels) to Frame (copy).
covermock::core::Frame mat_to_frame(const cv::Mat& mat,
                                    covermock::core::PixelFormat format);

/// OpenCV type for a pixel format, or -1 when it has none.
int cv_type_for(covermock::core::PixelFormat format) noexcept;

/// cv::InterpolationFlags value for \p interpolation.
int cv_interpolation(Interpolation interpolation) noexcept;

}  // namespace covermock::vision::detail
