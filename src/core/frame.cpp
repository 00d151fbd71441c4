#include <idphoto/core/frame.hpp>
#include <cstddef>

namespace idphoto::core {

std::size_t Frame::min_bytes(std::uint32_t width,
                             std::uint32_t height,
                             PixelFormat format) {
  const std::size_t pixels = static_cast<std::size_t>(width) * height;
  switch (format) {
    case PixelFormat::Grayscale8:
      return pixels;
    case PixelFormat::RGB8:
    case PixelFormat::BGR8:
      return pixels * 3;
    case PixelFormat::RGBA8:
    case PixelFormat::BGRA8:
      return pixels * 4;
    case PixelFormat::Float32Planar:
      return pixels * 3 * sizeof(float);
    case PixelFormat::Unknown:
    default:
      return 0;
  }
}

bool Frame::is_well_formed() const noexcept {
  if (empty() || width_ == 0 || height_ == 0) return false;
  const std::size_t needed = min_bytes(width_, height_, format_);
  return needed > 0 && buffer_.size() >= needed;
}

}  // namespace idphoto::core
