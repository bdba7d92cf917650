#pragma once

#include <covermock/core/error.hpp>
#include <covermock/core/frame.hpp>
#include <expected>
#include <string>

namespace covermock::vision {

/// Load an image file into a Frame as decoded (BGR8, BGRA8 or Grayscale8).
/// ResourceNotFound if the path does not exist; InvalidImage if it cannot be decoded.
[[nodiscard]] std::expected<covermock::core::Frame, covermock::core::PipelineError>
load_frame_from_image(const std::string& path);

/// Load a cover as RGB8. Covers carrying alpha are flattened onto white first.
[[nodiscard]] std::expected<covermock::core::Frame, covermock::core::PipelineError>
load_cover_image(const std::string& path);

/// Load a mask as Grayscale8.
[[nodiscard]] std::expected<covermock::core::Frame, covermock::core::PipelineError>
load_mask_image(const std::string& path);

/// Encode \p frame by the extension of \p path and write it atomically
/// (temporary file, then rename). No file is left behind on failure.
/// RGB/RGBA frames are swapped to OpenCV channel order before encoding.
[[nodiscard]] std::expected<void, covermock::core::PipelineError>
save_frame_to_image(const covermock::core::Frame& frame, const std::string& path);

}  // namespace covermock::vision
