#pragma once

#include <cstddef>
#include <cstdint>
#include <span>
#include <utility>
#include <vector>

namespace covermock::core {

/// Memory: Frame owns a single contiguous buffer (std::vector<std::byte>), rows tightly packed;
/// move semantics and RAII throughout. Use data() for std::span views (non-owning).
/// Thread-safety: distinct Frame instances are independent; sharing one Frame
/// across threads is safe only for const access.

/// Pixel layout / format.
enum class PixelFormat : std::uint8_t {
  Unknown,
  Grayscale8,
  RGB8,
  BGR8,
  RGBA8,
  BGRA8,
};

/// Raster image: dimensions, format, and owned pixel buffer.
class Frame {
 public:
  Frame() = default;

  Frame(std::uint32_t width,
        std::uint32_t height,
        PixelFormat format,
        std::vector<std::byte> buffer)
      : width_(width),
        height_(height),
        format_(format),
        buffer_(std::move(buffer)) {}

  [[nodiscard]] std::uint32_t width() const noexcept { return width_; }
  [[nodiscard]] std::uint32_t height() const noexcept { return height_; }
  [[nodiscard]] PixelFormat format() const noexcept { return format_; }
  [[nodiscard]] std::uint32_t channels() const noexcept { return channel_count(format_); }

  /// Mutable view of the buffer (owned).
  [[nodiscard]] std::span<std::byte> data() noexcept {
    return std::span<std::byte>(buffer_.data(), buffer_.size());
  }
  [[nodiscard]] std::span<const std::byte> data() const noexcept {
    return std::span<const std::byte>(buffer_.data(), buffer_.size());
  }

  [[nodiscard]] bool empty() const noexcept { return buffer_.empty(); }
  [[nodiscard]] std::size_t size_bytes() const noexcept { return buffer_.size(); }

  /// True when dimensions are non-zero, the format is known and the buffer holds every pixel.
  [[nodiscard]] bool valid() const noexcept;

  /// Filled frame: every pixel set to the first channels() bytes of \p pixel.
  [[nodiscard]] static Frame filled(std::uint32_t width,
                                    std::uint32_t height,
                                    PixelFormat format,
                                    std::span<const std::uint8_t> pixel);

  /// Minimum bytes required for given dimensions and format (for validation).
  [[nodiscard]] static std::size_t min_bytes(std::uint32_t width,
                                             std::uint32_t height,
                                             PixelFormat format);

  [[nodiscard]] static std::uint32_t channel_count(PixelFormat format) noexcept;

 private:
  std::uint32_t width_{0};
  std::uint32_t height_{0};
  PixelFormat format_{PixelFormat::Unknown};
  std::vector<std::byte> buffer_;
};

}  // namespace covermock::core
