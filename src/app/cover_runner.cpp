#include <covermock/app/cover_runner.hpp>
#include <covermock/vision/color_convert_stage.hpp>
#include <covermock/vision/load_image.hpp>
#include <covermock/vision/mask_composite_stage.hpp>
#include <covermock/vision/smooth_stage.hpp>
#include <algorithm>
#include <array>
#include <cctype>
#include <exception>
#include <filesystem>
#include <memory>
#include <mutex>
#include <queue>
#include <thread>
#include <unordered_map>
#include <vector>

namespace covermock::app {

namespace cc = covermock::core;
namespace vis = covermock::vision;
namespace fs = std::filesystem;

std::expected<MockupContext, cc::PipelineError> make_context(const MockupConfig& config) {
  if (auto valid = validate_config(config); !valid) {
    return std::unexpected(valid.error());
  }

  auto mask = vis::load_mask_image(config.mask_path);
  if (!mask) return std::unexpected(mask.error());

  std::error_code ec;
  fs::create_directories(config.output_dir, ec);
  if (ec) return std::unexpected(cc::PipelineError::InvalidConfig);

  MockupContext context;
  context.palette = vis::default_palette(config.templates_dir, config.template_extension);
  context.mask = std::move(*mask);
  context.quad = config.quad;
  context.warp = config.warp;
  context.sampler = config.sampler;
  context.output_dir = config.output_dir;
  context.output_suffix = config.output_suffix;
  context.output_extension = config.output_extension;
  return context;
}

std::expected<cc::Pipeline, cc::PipelineError> build_cover_pipeline(
    const cc::Frame& book_template,
    const MockupContext& context) {
  auto composite = std::make_unique<vis::MaskCompositeStage>(book_template, context.mask);
  if (!composite->is_ready()) {
    return std::unexpected(cc::PipelineError::InvalidImage);
  }

  cc::Pipeline pipeline;
  pipeline.add_stage(std::make_unique<vis::ColorConvertStage>(cc::PixelFormat::RGBA8));
  pipeline.add_stage(std::make_unique<vis::QuadWarpStage>(
      context.quad, composite->canvas_width(), composite->canvas_height(), context.warp));
  pipeline.add_stage(std::make_unique<vis::SmoothStage>(vis::Interpolation::Lanczos));
  pipeline.add_stage(std::move(composite));
  return pipeline;
}

std::expected<CoverComposite, cc::PipelineError> compose_cover(
    const cc::Frame& cover,
    const MockupContext& context,
    const cc::StageTimingCallback* timing_cb) {
  auto color = vis::sample_dominant_color(cover, context.sampler);
  if (!color) return std::unexpected(color.error());

  auto chosen = vis::match_template(*color, context.palette);
  if (!chosen) return std::unexpected(chosen.error());

  auto book_template = vis::load_frame_from_image(chosen->path);
  if (!book_template) return std::unexpected(book_template.error());

  auto pipeline = build_cover_pipeline(*book_template, context);
  if (!pipeline) return std::unexpected(pipeline.error());

  auto image = pipeline->run(cover, timing_cb);
  if (!image) return std::unexpected(image.error());

  return CoverComposite{std::move(*image), *color, std::move(*chosen)};
}

std::string output_path_for(const std::string& cover_path, const MockupContext& context) {
  const fs::path stem = fs::path(cover_path).stem();
  return (fs::path(context.output_dir) /
          (stem.string() + context.output_suffix + context.output_extension))
      .string();
}

std::expected<std::vector<std::string>, cc::PipelineError> list_cover_files(
    const std::string& dir) {
  std::error_code ec;
  if (!fs::is_directory(dir, ec)) {
    return std::unexpected(cc::PipelineError::ResourceNotFound);
  }

  static constexpr std::array<std::string_view, 4> kExtensions{".jpg", ".jpeg", ".png", ".bmp"};
  std::vector<std::string> files;
  for (const auto& entry : fs::directory_iterator(dir, ec)) {
    if (!entry.is_regular_file(ec)) continue;
    std::string ext = entry.path().extension().string();
    std::transform(ext.begin(), ext.end(), ext.begin(),
                   [](unsigned char ch) { return static_cast<char>(std::tolower(ch)); });
    if (std::find(kExtensions.begin(), kExtensions.end(), ext) != kExtensions.end()) {
      files.push_back(entry.path().string());
    }
  }
  if (ec) return std::unexpected(cc::PipelineError::ResourceNotFound);
  std::sort(files.begin(), files.end());
  return files;
}

CoverOutcome process_cover_file(const std::string& cover_path,
                                const MockupContext& context,
                                const cc::StageTimingCallback* timing_cb) {
  CoverOutcome outcome;
  outcome.cover_path = cover_path;
  outcome.output_path = output_path_for(cover_path, context);

  try {
    auto cover = vis::load_cover_image(cover_path);
    if (!cover) {
      outcome.error = cover.error();
      return outcome;
    }

    auto composite = compose_cover(*cover, context, timing_cb);
    if (!composite) {
      outcome.error = composite.error();
      return outcome;
    }
    outcome.color = composite->color;
    outcome.template_name = composite->chosen.name;

    auto written = vis::save_frame_to_image(composite->image, outcome.output_path);
    if (!written) outcome.error = written.error();
  } catch (const std::exception& e) {
    // cv::Exception derives from std::exception.
    outcome.error = cc::PipelineError::CompositingFailure;
    outcome.detail = e.what();
  }
  return outcome;
}

BatchSummary summarize(std::vector<CoverOutcome> outcomes) {
  BatchSummary summary;
  for (const auto& o : outcomes) {
    if (o.ok()) ++summary.succeeded;
    else ++summary.failed;
  }
  summary.outcomes = std::move(outcomes);
  return summary;
}

std::vector<std::optional<std::size_t>> find_output_collisions(
    const std::vector<std::string>& cover_paths,
    const MockupContext& context) {
  std::vector<std::optional<std::size_t>> collisions(cover_paths.size());
  std::unordered_map<std::string, std::size_t> owners;
  owners.reserve(cover_paths.size());
  for (std::size_t i = 0; i < cover_paths.size(); ++i) {
    const auto [it, inserted] = owners.emplace(output_path_for(cover_paths[i], context), i);
    if (!inserted) collisions[i] = it->second;
  }
  return collisions;
}

CoverOutcome duplicate_output_outcome(const std::string& cover_path,
                                      const std::string& first_cover_path,
                                      const MockupContext& context) {
  CoverOutcome outcome;
  outcome.cover_path = cover_path;
  outcome.output_path = output_path_for(cover_path, context);
  outcome.error = cc::PipelineError::DuplicateOutput;
  outcome.detail = "output already produced by " + first_cover_path;
  return outcome;
}

namespace {

CoverOutcome run_one(std::size_t idx,
                     const std::vector<std::string>& cover_paths,
                     const std::vector<std::optional<std::size_t>>& collisions,
                     const MockupContext& context) {
  if (const auto& first = collisions[idx]) {
    return duplicate_output_outcome(cover_paths[idx], cover_paths[*first], context);
  }
  return process_cover_file(cover_paths[idx], context);
}

}  // namespace

BatchSummary run_cover_batch(const std::vector<std::string>& cover_paths,
                             const MockupContext& context,
                             const CoverOutcomeCallback& callback) {
  const auto collisions = find_output_collisions(cover_paths, context);
  std::vector<CoverOutcome> outcomes;
  outcomes.reserve(cover_paths.size());
  for (std::size_t i = 0; i < cover_paths.size(); ++i) {
    outcomes.push_back(run_one(i, cover_paths, collisions, context));
    if (callback) callback(outcomes.back());
  }
  return summarize(std::move(outcomes));
}

namespace {

std::size_t effective_workers(std::size_t num_workers) {
  if (num_workers > 0) return num_workers;
  const unsigned hw = std::thread::hardware_concurrency();
  return hw > 0 ? static_cast<std::size_t>(hw) : 1;
}

}  // namespace

BatchSummary run_cover_batch_parallel(const std::vector<std::string>& cover_paths,
                                      const MockupContext& context,
                                      const CoverOutcomeCallback& callback,
                                      std::size_t num_workers) {
  const std::size_t n = cover_paths.size();
  const std::size_t workers = std::min(effective_workers(num_workers), n);
  if (workers <= 1) {
    return run_cover_batch(cover_paths, context, callback);
  }

  std::queue<std::size_t> index_queue;
  for (std::size_t i = 0; i < n; ++i) {
    index_queue.push(i);
  }
  std::mutex queue_mutex;
  const auto collisions = find_output_collisions(cover_paths, context);
  std::vector<CoverOutcome> outcomes(n);

  auto worker = [&]() {
    while (true) {
      std::size_t idx;
      {
        std::lock_guard lock(queue_mutex);
        if (index_queue.empty()) break;
        idx = index_queue.front();
        index_queue.pop();
      }

      outcomes[idx] = run_one(idx, cover_paths, collisions, context);
      if (callback) callback(outcomes[idx]);
    }
  };

  std::vector<std::thread> threads;
  threads.reserve(workers);
  for (std::size_t i = 0; i < workers; ++i) {
    threads.emplace_back(worker);
  }
  for (auto& t : threads) {
    t.join();
  }
  return summarize(std::move(outcomes));
}

}  // namespace covermock::app
