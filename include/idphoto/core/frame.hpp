#pragma once

#include <chrono>
#include <cstddef>
#include <cstdint>
#include <span>
#include <vector>

namespace idphoto::core {

/// Monotonic frame timestamp: milliseconds on the booth's steady clock.
using Timestamp = std::chrono::milliseconds;

/// Memory: Frame owns a single contiguous buffer (std::vector<std::byte>);
/// move semantics and RAII throughout. Use data() for std::span views (non-owning).
/// Frames are immutable once produced: the core only reads them.

/// Pixel layout / format.
enum class PixelFormat : std::uint8_t {
  Unknown,
  Grayscale8,
  RGB8,
  BGR8,
  RGBA8,
  BGRA8,
  Float32Planar,  // HWC float, 3 channels (model input)
};

/// Single camera sample: dimensions, format, owned pixel buffer and capture time.
class Frame {
 public:
  Frame() = default;

  Frame(std::uint32_t width,
        std::uint32_t height,
        PixelFormat format,
        std::vector<std::byte> buffer,
        Timestamp timestamp = Timestamp{0})
      : width_(width),
        height_(height),
        format_(format),
        buffer_(std::move(buffer)),
        timestamp_(timestamp) {}

  [[nodiscard]] std::uint32_t width() const noexcept { return width_; }
  [[nodiscard]] std::uint32_t height() const noexcept { return height_; }
  [[nodiscard]] PixelFormat format() const noexcept { return format_; }
  [[nodiscard]] Timestamp timestamp() const noexcept { return timestamp_; }

  [[nodiscard]] std::span<const std::byte> data() const noexcept {
    return std::span<const std::byte>(buffer_.data(), buffer_.size());
  }

  [[nodiscard]] bool empty() const noexcept { return buffer_.empty(); }
  [[nodiscard]] std::size_t size_bytes() const noexcept { return buffer_.size(); }

  /// Minimum bytes required for given dimensions and format (for validation).
  [[nodiscard]] static std::size_t min_bytes(std::uint32_t width,
                                             std::uint32_t height,
                                             PixelFormat format);

  /// True if the buffer holds at least min_bytes() for this frame's geometry.
  [[nodiscard]] bool is_well_formed() const noexcept;

 private:
  std::uint32_t width_{0};
  std::uint32_t height_{0};
  PixelFormat format_{PixelFormat::Unknown};
  std::vector<std::byte> buffer_;
  Timestamp timestamp_{0};
};

}  // namespace idphoto::core
