/**
 * covermock-cli: composite cover images onto color-matched book templates.
 * Build: cmake -B build && cmake --build build
 * Run:   ./build/covermock_cli [--config path] [--covers dir | --input file]
 * Writes <output_dir>/<cover>_book.png for every cover and prints a summary.
 */

#include <covermock/app/config.hpp>
#include <covermock/app/cover_runner.hpp>
#include <covermock/core/error.hpp>
#include <covermock/core/pipeline.hpp>
#ifdef COVERMOCK_HAS_TBB
#include <covermock/app/cover_runner_tbb.hpp>
#endif

#include <cstddef>
#include <exception>
#include <iostream>
#include <mutex>
#include <string>
#include <string_view>
#include <vector>

namespace {

void print_usage() {
  std::cout << "Usage: covermock_cli [options]\n"
            << "  --config <path>     Config (key=value file); default: built-in\n"
            << "  --covers <dir>      Directory of cover images (default from config: covers)\n"
            << "  --input <path>      Single cover image instead of a directory\n"
            << "  --templates <dir>   Book template directory (black.png, blue.png, ...)\n"
            << "  --mask <path>       Grayscale cover mask\n"
            << "  --output <dir>      Output directory (default from config: generated_books)\n"
            << "  --runner <type>     sequential | threads | tbb\n"
            << "  --workers <n>       Worker count for threads runner (0 = hardware concurrency)\n"
            << "  --timings           Print per-stage timings (single --input only)\n";
}

void print_outcome(const covermock::app::CoverOutcome& o) {
  if (o.ok()) {
    std::cout << "OK   " << o.cover_path;
    if (o.color) {
      std::cout << " color=(" << int{o.color->r} << "," << int{o.color->g} << ","
                << int{o.color->b} << ")";
    }
    std::cout << " template=" << o.template_name << " -> " << o.output_path << "\n";
  } else {
    std::cerr << "FAIL " << o.cover_path << ": " << covermock::core::to_string(*o.error);
    if (!o.detail.empty()) std::cerr << " (" << o.detail << ")";
    std::cerr << "\n";
  }
}

}  // namespace

int main(int argc, char* argv[]) {
  std::string config_path;
  std::string input_path;
  std::string covers_override;
  std::string templates_override;
  std::string mask_override;
  std::string output_override;
  std::string runner_override;
  std::string workers_override;
  bool timings = false;

  for (int i = 1; i < argc; ++i) {
    const std::string arg = argv[i];
    if (arg == "--config" && i + 1 < argc) {
      config_path = argv[++i];
    } else if (arg == "--input" && i + 1 < argc) {
      input_path = argv[++i];
    } else if (arg == "--covers" && i + 1 < argc) {
      covers_override = argv[++i];
    } else if (arg == "--templates" && i + 1 < argc) {
      templates_override = argv[++i];
    } else if (arg == "--mask" && i + 1 < argc) {
      mask_override = argv[++i];
    } else if (arg == "--output" && i + 1 < argc) {
      output_override = argv[++i];
    } else if (arg == "--runner" && i + 1 < argc) {
      runner_override = argv[++i];
    } else if (arg == "--workers" && i + 1 < argc) {
      workers_override = argv[++i];
    } else if (arg == "--timings") {
      timings = true;
    } else if (arg == "--help" || arg == "-h") {
      print_usage();
      return 0;
    } else {
      std::cerr << "Unknown argument " << arg << "\n";
      print_usage();
      return 1;
    }
  }

  covermock::app::MockupConfig cfg;
  try {
    cfg = config_path.empty() ? covermock::app::default_config()
                              : covermock::app::load_config(config_path);
    if (!workers_override.empty()) cfg.num_workers = std::stoul(workers_override);
  } catch (const std::exception& e) {
    std::cerr << "Invalid config: " << e.what() << "\n";
    return 1;
  }
  if (!covers_override.empty()) cfg.covers_dir = covers_override;
  if (!templates_override.empty()) cfg.templates_dir = templates_override;
  if (!mask_override.empty()) cfg.mask_path = mask_override;
  if (!output_override.empty()) cfg.output_dir = output_override;
  if (!runner_override.empty()) {
    auto runner = covermock::app::parse_runner_type(runner_override);
    if (!runner) {
      std::cerr << "Unknown --runner " << runner_override << " (use sequential, threads, or tbb)\n";
      return 1;
    }
    cfg.runner = *runner;
  }
#ifndef COVERMOCK_HAS_TBB
  if (cfg.runner == covermock::app::RunnerType::Tbb) {
    std::cerr << "TBB runner not available (build with -DCOVERMOCK_USE_TBB=ON and TBB installed)\n";
    return 1;
  }
#endif

  auto context = covermock::app::make_context(cfg);
  if (!context) {
    std::cerr << "Setup failed: " << covermock::core::to_string(context.error())
              << " (mask: " << cfg.mask_path << ", output: " << cfg.output_dir << ")\n";
    return 1;
  }

  if (!input_path.empty()) {
    covermock::core::StageTimingCallback timing_cb =
        [](std::size_t index, std::string_view name, double ms) {
          std::cout << "  stage " << index << " " << name << ": " << ms << " ms\n";
        };
    const auto outcome = covermock::app::process_cover_file(
        input_path, *context, timings ? &timing_cb : nullptr);
    print_outcome(outcome);
    return outcome.ok() ? 0 : 1;
  }

  auto covers = covermock::app::list_cover_files(cfg.covers_dir);
  if (!covers) {
    std::cerr << "Cannot read covers directory: " << cfg.covers_dir << "\n";
    return 1;
  }
  if (covers->empty()) {
    std::cout << "No cover files found in " << cfg.covers_dir << "\n";
    return 0;
  }
  std::cout << "Found " << covers->size() << " cover files to process\n";

  std::mutex print_mutex;
  const covermock::app::CoverOutcomeCallback on_outcome =
      [&print_mutex](const covermock::app::CoverOutcome& o) {
        std::lock_guard lock(print_mutex);
        print_outcome(o);
      };

  covermock::app::BatchSummary summary;
  switch (cfg.runner) {
    case covermock::app::RunnerType::Threads:
      summary = covermock::app::run_cover_batch_parallel(*covers, *context, on_outcome,
                                                         cfg.num_workers);
      break;
#ifdef COVERMOCK_HAS_TBB
    case covermock::app::RunnerType::Tbb:
      summary = covermock::app::run_cover_batch_tbb(*covers, *context, on_outcome);
      break;
#endif
    case covermock::app::RunnerType::Sequential:
    default:
      summary = covermock::app::run_cover_batch(*covers, *context, on_outcome);
      break;
  }

  std::cout << "Batch complete: " << summary.succeeded << " succeeded, " << summary.failed
            << " failed, output in " << cfg.output_dir << "\n";
  return summary.failed == 0 ? 0 : 1;
}
