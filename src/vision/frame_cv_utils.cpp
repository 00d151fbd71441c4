#include "frame_cv_utils.hpp"
#include <idphoto/core/frame.hpp>
#include <opencv2/core.hpp>
#include <opencv2/imgproc.hpp>
#include <cmath>
#include <cstddef>
#include <cstring>
#include <vector>

namespace idphoto::vision::detail {

namespace ic = idphoto::core;

std::optional<cv::Mat> frame_to_mat(const ic::Frame& frame) {
  if (!frame.is_well_formed()) return std::nullopt;

  const int w = static_cast<int>(frame.width());
  const int h = static_cast<int>(frame.height());
  const std::size_t step = frame.size_bytes() / static_cast<std::size_t>(h);
  auto* data = const_cast<std::byte*>(frame.data().data());

  switch (frame.format()) {
    case ic::PixelFormat::Grayscale8:
      return cv::Mat(h, w, CV_8UC1, data, step);
    case ic::PixelFormat::RGB8:
    case ic::PixelFormat::BGR8:
      return cv::Mat(h, w, CV_8UC3, data, step);
    case ic::PixelFormat::RGBA8:
    case ic::PixelFormat::BGRA8:
      return cv::Mat(h, w, CV_8UC4, data, step);
    case ic::PixelFormat::Float32Planar:
    case ic::PixelFormat::Unknown:
    default:
      return std::nullopt;
  }
}

ic::Frame mat_to_frame(const cv::Mat& mat, ic::PixelFormat format, ic::Timestamp timestamp) {
  if (mat.empty()) return ic::Frame();

  const cv::Mat contiguous = mat.isContinuous() ? mat : mat.clone();
  const std::uint32_t w = static_cast<std::uint32_t>(contiguous.cols);
  const std::uint32_t h = static_cast<std::uint32_t>(contiguous.rows);
  const std::size_t len = contiguous.total() * contiguous.elemSize();
  std::vector<std::byte> buffer(len);
  std::memcpy(buffer.data(), contiguous.ptr(), len);
  return ic::Frame(w, h, format, std::move(buffer), timestamp);
}

std::optional<cv::Mat> to_gray(const ic::Frame& frame) {
  auto mat = frame_to_mat(frame);
  if (!mat) return std::nullopt;

  cv::Mat gray;
  switch (frame.format()) {
    case ic::PixelFormat::Grayscale8:
      return *mat;
    case ic::PixelFormat::BGR8:
      cv::cvtColor(*mat, gray, cv::COLOR_BGR2GRAY);
      return gray;
    case ic::PixelFormat::RGB8:
      cv::cvtColor(*mat, gray, cv::COLOR_RGB2GRAY);
      return gray;
    case ic::PixelFormat::BGRA8:
      cv::cvtColor(*mat, gray, cv::COLOR_BGRA2GRAY);
      return gray;
    case ic::PixelFormat::RGBA8:
      cv::cvtColor(*mat, gray, cv::COLOR_RGBA2GRAY);
      return gray;
    default:
      return std::nullopt;
  }
}

std::optional<cv::Mat> to_bgr(const ic::Frame& frame) {
  auto mat = frame_to_mat(frame);
  if (!mat) return std::nullopt;

  cv::Mat bgr;
  switch (frame.format()) {
    case ic::PixelFormat::BGR8:
      return *mat;
    case ic::PixelFormat::RGB8:
      cv::cvtColor(*mat, bgr, cv::COLOR_RGB2BGR);
      return bgr;
    case ic::PixelFormat::Grayscale8:
      cv::cvtColor(*mat, bgr, cv::COLOR_GRAY2BGR);
      return bgr;
    case ic::PixelFormat::BGRA8:
      cv::cvtColor(*mat, bgr, cv::COLOR_BGRA2BGR);
      return bgr;
    case ic::PixelFormat::RGBA8:
      cv::cvtColor(*mat, bgr, cv::COLOR_RGBA2BGR);
      return bgr;
    default:
      return std::nullopt;
  }
}

cv::Rect clip_to_image(const ic::BBox& box, cv::Size size) {
  return padded_rect(box, 0.f, 0.f, size);
}

cv::Rect padded_rect(const ic::BBox& box, float pad_x, float pad_y, cv::Size size) {
  const int x0 = static_cast<int>(std::floor(box.x - pad_x));
  const int y0 = static_cast<int>(std::floor(box.y - pad_y));
  const int x1 = static_cast<int>(std::ceil(box.x + box.w + pad_x));
  const int y1 = static_cast<int>(std::ceil(box.y + box.h + pad_y));
  const cv::Rect r(cv::Point(x0, y0), cv::Point(x1, y1));
  return r & cv::Rect(0, 0, size.width, size.height);
}

}  // namespace idphoto::vision::detail
