#pragma once

#include <covermock/core/error.hpp>
#include <covermock/core/frame.hpp>
#include <covermock/core/pipeline_stage.hpp>
#include <expected>
#include <functional>
#include <memory>
#include <string_view>
#include <vector>

namespace covermock::core {

/// Callback for per-stage timing: (stage_index, stage_name, duration_ms). Optional; pass to run().
using StageTimingCallback =
    std::function<void(std::size_t stage_index, std::string_view stage_name, double duration_ms)>;

/// Runs a sequence of stages, handing each stage's Frame to the next.
class Pipeline {
 public:
  Pipeline() = default;

  void add_stage(std::unique_ptr<IPipelineStage> stage);

  /// Run pipeline on one frame; returns the last stage's Frame or the first error.
  /// An empty pipeline is a configuration error.
  /// If timing_cb is non-null, it is called after each stage.
  /// Thread-safe: safe to call run() from multiple threads concurrently
  /// (stages are not modified during process()).
  [[nodiscard]] std::expected<Frame, PipelineError> run(
      const Frame& input,
      const StageTimingCallback* timing_cb = nullptr) const;

  [[nodiscard]] std::size_t stage_count() const noexcept {
    return stages_.size();
  }

 private:
  std::vector<std::unique_ptr<IPipelineStage>> stages_;
};

}  // namespace covermock::core
