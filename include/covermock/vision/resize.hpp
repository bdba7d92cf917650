#pragma once

#include <covermock/core/error.hpp>
#include <covermock/core/frame.hpp>
#include <cstdint>
#include <expected>

namespace covermock::vision {

/// Resampling filter.
enum class Interpolation : std::uint8_t {
  Nearest,
  Linear,
  Area,
  Lanczos,
};

/// Resize \p input to exactly target_width x target_height, keeping its format.
/// InvalidImage for an invalid frame or a zero target dimension.
[[nodiscard]] std::expected<covermock::core::Frame, covermock::core::PipelineError>
resize_frame(const covermock::core::Frame& input,
             std::uint32_t target_width,
             std::uint32_t target_height,
             Interpolation interpolation);

}  // namespace covermock::vision
