#pragma once

#include <covermock/app/config.hpp>
#include <covermock/core/color.hpp>
#include <covermock/core/error.hpp>
#include <covermock/core/frame.hpp>
#include <covermock/core/pipeline.hpp>
#include <covermock/core/quad.hpp>
#include <covermock/vision/color_sampler.hpp>
#include <covermock/vision/quad_warp_stage.hpp>
#include <covermock/vision/template_matcher.hpp>
#include <cstddef>
#include <expected>
#include <functional>
#include <optional>
#include <string>
#include <vector>

namespace covermock::app {

/// Read-only inputs shared by every cover of a batch. Safe to use from many threads at once.
struct MockupContext {
  covermock::vision::TemplatePalette palette;
  covermock::core::Frame mask;  // Grayscale8
  covermock::core::QuadRegion quad{covermock::core::default_quad()};
  covermock::vision::WarpOptions warp{};
  covermock::vision::SamplerOptions sampler{};
  std::string output_dir;
  std::string output_suffix{"_book"};
  std::string output_extension{".png"};
};

/// Builds the context for \p config: default palette, loaded mask, created output directory.
/// InvalidConfig for invalid settings or an output directory that cannot be created;
/// ResourceNotFound / InvalidImage for the mask.
[[nodiscard]] std::expected<MockupContext, covermock::core::PipelineError> make_context(
    const MockupConfig& config);

/// Composite plus what was chosen on the way.
struct CoverComposite {
  covermock::core::Frame image;  // RGBA8, template size
  covermock::core::Rgb color;
  covermock::vision::TemplateEntry chosen;
};

/// Stage pipeline for one template: convert to RGBA -> warp -> smooth -> mask composite.
[[nodiscard]] std::expected<covermock::core::Pipeline, covermock::core::PipelineError>
build_cover_pipeline(const covermock::core::Frame& book_template, const MockupContext& context);

/// Samples \p cover, picks its template, loads it and runs the stage pipeline.
/// No shared state is modified; independent covers may run concurrently.
[[nodiscard]] std::expected<CoverComposite, covermock::core::PipelineError> compose_cover(
    const covermock::core::Frame& cover,
    const MockupContext& context,
    const covermock::core::StageTimingCallback* timing_cb = nullptr);

/// <output_dir>/<cover stem><suffix><extension>
[[nodiscard]] std::string output_path_for(const std::string& cover_path,
                                          const MockupContext& context);

/// Cover images (.jpg, .jpeg, .png, .bmp, any case) directly inside \p dir, sorted by path.
/// ResourceNotFound if \p dir is not a directory.
[[nodiscard]] std::expected<std::vector<std::string>, covermock::core::PipelineError>
list_cover_files(const std::string& dir);

/// Result of one cover.
struct CoverOutcome {
  std::string cover_path;
  std::string output_path;
  std::optional<covermock::core::Rgb> color;
  std::string template_name;
  std::optional<covermock::core::PipelineError> error;
  std::string detail;  // exception text, if any

  [[nodiscard]] bool ok() const noexcept { return !error.has_value(); }
};

/// Counts and per-cover outcomes (in input order).
struct BatchSummary {
  std::size_t succeeded{0};
  std::size_t failed{0};
  std::vector<CoverOutcome> outcomes;
};

/// Callback for each finished cover; may be invoked from worker threads.
/// Must be thread-safe if using a parallel runner.
using CoverOutcomeCallback = std::function<void(const CoverOutcome&)>;

/// Load, compose and write one cover. Never throws: exceptions raised while
/// processing are reported as CompositingFailure. The output file is written
/// only after every stage succeeded.
[[nodiscard]] CoverOutcome process_cover_file(const std::string& cover_path,
                                              const MockupContext& context,
                                              const covermock::core::StageTimingCallback* timing_cb = nullptr);

/// Per cover, the index of the first earlier cover in \p cover_paths that maps to the same
/// output path (e.g. "x.jpg" and "x.png"), or nullopt when its output path is unique.
[[nodiscard]] std::vector<std::optional<std::size_t>> find_output_collisions(
    const std::vector<std::string>& cover_paths, const MockupContext& context);

/// Outcome for a cover skipped because \p first_cover_path already owns its output path.
[[nodiscard]] CoverOutcome duplicate_output_outcome(const std::string& cover_path,
                                                    const std::string& first_cover_path,
                                                    const MockupContext& context);

/// Runners below process only the first cover for each output path; later ones
/// fail with DuplicateOutput instead of overwriting it.

/// Runs covers sequentially; one cover's failure does not stop the batch.
BatchSummary run_cover_batch(const std::vector<std::string>& cover_paths,
                             const MockupContext& context,
                             const CoverOutcomeCallback& callback = nullptr);

/// Runs covers on a thread pool. num_workers 0 = use hardware concurrency.
BatchSummary run_cover_batch_parallel(const std::vector<std::string>& cover_paths,
                                      const MockupContext& context,
                                      const CoverOutcomeCallback& callback = nullptr,
                                      std::size_t num_workers = 0);

/// Tallies outcomes into a summary, keeping their order.
[[nodiscard]] BatchSummary summarize(std::vector<CoverOutcome> outcomes);

}  // namespace covermock::app
