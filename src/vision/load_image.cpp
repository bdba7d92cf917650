#include <covermock/vision/load_image.hpp>
#include "frame_cv_utils.hpp"
#include <covermock/core/frame.hpp>
#include <covermock/vision/color_convert_stage.hpp>
#include <opencv2/core.hpp>
#include <opencv2/imgcodecs.hpp>
#include <atomic>
#include <cstdint>
#include <filesystem>
#include <fstream>
#include <random>
#include <sstream>
#include <system_error>
#include <thread>
#include <vector>

namespace covermock::vision {

namespace cc = covermock::core;

namespace {

// Unique per process, thread and call, so concurrent writers of one target never share it.
std::filesystem::path partial_path_for(const std::filesystem::path& target) {
  static const std::uint32_t process_tag = std::random_device{}();
  static std::atomic<std::uint64_t> counter{0};
  std::ostringstream suffix;
  suffix << '.' << std::hex << process_tag << '-' << std::this_thread::get_id() << '-'
         << counter.fetch_add(1, std::memory_order_relaxed) << ".part";
  std::filesystem::path partial = target;
  partial += suffix.str();
  return partial;
}

}  // namespace

std::expected<cc::Frame, cc::PipelineError> load_frame_from_image(const std::string& path) {
  std::error_code ec;
  if (!std::filesystem::is_regular_file(path, ec)) {
    return std::unexpected(cc::PipelineError::ResourceNotFound);
  }

  cv::Mat mat = cv::imread(path, cv::IMREAD_UNCHANGED);
  if (mat.empty()) return std::unexpected(cc::PipelineError::InvalidImage);

  // 16-bit PNG/TIFF inputs are reduced to 8 bits per channel.
  if (mat.depth() != CV_8U) {
    cv::Mat converted;
    mat.convertTo(converted, CV_8U, mat.depth() == CV_16U ? 1.0 / 257.0 : 1.0);
    mat = converted;
  }

  switch (mat.channels()) {
    case 1:
      return detail::mat_to_frame(mat, cc::PixelFormat::Grayscale8);
    case 3:
      return detail::mat_to_frame(mat, cc::PixelFormat::BGR8);
    case 4:
      return detail::mat_to_frame(mat, cc::PixelFormat::BGRA8);
    default:
      return std::unexpected(cc::PipelineError::InvalidImage);
  }
}

std::expected<cc::Frame, cc::PipelineError> load_cover_image(const std::string& path) {
  auto frame = load_frame_from_image(path);
  if (!frame) return std::unexpected(frame.error());

  auto flat = flatten_onto_white(*frame);
  if (!flat) return std::unexpected(flat.error());
  return convert_frame(*flat, cc::PixelFormat::RGB8);
}

std::expected<cc::Frame, cc::PipelineError> load_mask_image(const std::string& path) {
  auto frame = load_frame_from_image(path);
  if (!frame) return std::unexpected(frame.error());
  return convert_frame(*frame, cc::PixelFormat::Grayscale8);
}

std::expected<void, cc::PipelineError> save_frame_to_image(const cc::Frame& frame,
                                                           const std::string& path) {
  cc::Frame ordered;
  switch (frame.format()) {
    case cc::PixelFormat::RGB8: {
      auto bgr = convert_frame(frame, cc::PixelFormat::BGR8);
      if (!bgr) return std::unexpected(bgr.error());
      ordered = std::move(*bgr);
      break;
    }
    case cc::PixelFormat::RGBA8: {
      auto bgra = convert_frame(frame, cc::PixelFormat::BGRA8);
      if (!bgra) return std::unexpected(bgra.error());
      ordered = std::move(*bgra);
      break;
    }
    default:
      break;
  }
  const cc::Frame& to_write = ordered.empty() ? frame : ordered;

  auto mat = detail::frame_to_mat(to_write);
  if (!mat) return std::unexpected(cc::PipelineError::InvalidImage);

  const std::filesystem::path target(path);
  std::vector<uchar> encoded;
  if (!cv::imencode(target.extension().string(), *mat, encoded)) {
    return std::unexpected(cc::PipelineError::CompositingFailure);
  }

  const std::filesystem::path partial = partial_path_for(target);
  {
    std::ofstream f(partial, std::ios::binary | std::ios::trunc);
    if (!f) return std::unexpected(cc::PipelineError::CompositingFailure);
    f.write(reinterpret_cast<const char*>(encoded.data()),
            static_cast<std::streamsize>(encoded.size()));
    if (!f) {
      f.close();
      std::error_code ignored;
      std::filesystem::remove(partial, ignored);
      return std::unexpected(cc::PipelineError::CompositingFailure);
    }
  }

  std::error_code ec;
  std::filesystem::rename(partial, target, ec);
  if (ec) {
    std::error_code ignored;
    std::filesystem::remove(partial, ignored);
    return std::unexpected(cc::PipelineError::CompositingFailure);
  }
  return {};
}

}  // namespace covermock::vision
