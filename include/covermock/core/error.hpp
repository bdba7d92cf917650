#pragma once

#include <string_view>

namespace covermock::core {

/// Pipeline error codes; used with std::expected for recoverable failures.
/// Only missing or invalid resources are errors; geometric edge cases are normalized by the stages.
enum class PipelineError {
  None = 0,
  InvalidImage,          // unreadable, empty or zero-dimension image
  NoTemplatesAvailable,  // empty template palette
  ResourceNotFound,      // cover, template or mask path does not exist
  CompositingFailure,    // blending or output write failed
  InvalidConfig,
  DuplicateOutput,       // another cover of the batch already maps to the same output file
};

/// Stable name for logs and CLI output.
[[nodiscard]] constexpr std::string_view to_string(PipelineError e) noexcept {
  switch (e) {
    case PipelineError::None:
      return "None";
    case PipelineError::InvalidImage:
      return "InvalidImage";
    case PipelineError::NoTemplatesAvailable:
      return "NoTemplatesAvailable";
    case PipelineError::ResourceNotFound:
      return "ResourceNotFound";
    case PipelineError::CompositingFailure:
      return "CompositingFailure";
    case PipelineError::InvalidConfig:
      return "InvalidConfig";
    case PipelineError::DuplicateOutput:
      return "DuplicateOutput";
  }
  return "Unknown";
}

}  // namespace covermock::core
