#pragma once

#include <covermock/core/error.hpp>
#include <covermock/core/quad.hpp>
#include <covermock/vision/color_sampler.hpp>
#include <covermock/vision/quad_warp_stage.hpp>
#include <cstddef>
#include <expected>
#include <optional>
#include <string>
#include <string_view>

namespace covermock::app {

/// How a batch of covers is scheduled.
enum class RunnerType {
  Sequential,
  Threads,  // std::thread worker pool
  Tbb,      // tbb::parallel_for; requires a TBB build
};

/// Batch configuration: input/output locations, face geometry and tuning.
struct MockupConfig {
  std::string templates_dir{"originals"};
  std::string template_extension{".png"};
  std::string mask_path{"book_cover_mask_large.png"};
  std::string covers_dir{"covers"};
  std::string output_dir{"generated_books"};
  std::string output_suffix{"_book"};
  std::string output_extension{".png"};
  covermock::core::QuadRegion quad{covermock::core::default_quad()};
  covermock::vision::WarpOptions warp{};
  covermock::vision::SamplerOptions sampler{};
  RunnerType runner{RunnerType::Sequential};
  std::size_t num_workers{0};  // 0 = hardware concurrency
};

/// Load config from a simple key=value file (one per line, '#' comments) or use defaults
/// when the file cannot be opened. Malformed numbers throw std::invalid_argument.
MockupConfig load_config(const std::string& path);

/// Default config when no file is provided.
MockupConfig default_config();

/// InvalidConfig for values the pipeline cannot run with.
[[nodiscard]] std::expected<void, covermock::core::PipelineError> validate_config(
    const MockupConfig& config);

/// "614,374,1200,286,1200,1860,614,1730" (TL, TR, BR, BL). Throws std::invalid_argument.
covermock::core::QuadRegion parse_quad(std::string_view text);

/// "sequential", "threads" or "tbb".
[[nodiscard]] std::optional<RunnerType> parse_runner_type(std::string_view text);

}  // namespace covermock::app
