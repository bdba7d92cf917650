#include <covermock/core/frame.hpp>
#include <cstddef>

namespace covermock::core {

std::uint32_t Frame::channel_count(PixelFormat format) noexcept {
  switch (format) {
    case PixelFormat::Grayscale8:
      return 1;
    case PixelFormat::RGB8:
    case PixelFormat::BGR8:
      return 3;
    case PixelFormat::RGBA8:
    case PixelFormat::BGRA8:
      return 4;
    case PixelFormat::Unknown:
    default:
      return 0;
  }
}

std::size_t Frame::min_bytes(std::uint32_t width,
                              std::uint32_t height,
                              PixelFormat format) {
  const std::size_t pixels = static_cast<std::size_t>(width) * height;
  return pixels * channel_count(format);
}

bool Frame::valid() const noexcept {
  if (width_ == 0 || height_ == 0 || channel_count(format_) == 0) return false;
  return buffer_.size() >= min_bytes(width_, height_, format_);
}

Frame Frame::filled(std::uint32_t width,
                    std::uint32_t height,
                    PixelFormat format,
                    std::span<const std::uint8_t> pixel) {
  const std::size_t ch = channel_count(format);
  std::vector<std::byte> buffer(min_bytes(width, height, format));
  for (std::size_t i = 0; i < buffer.size(); ++i) {
    const std::size_t c = i % ch;
    buffer[i] = std::byte{c < pixel.size() ? pixel[c] : std::uint8_t{0}};
  }
  return Frame(width, height, format, std::move(buffer));
}

}  // namespace covermock::core
