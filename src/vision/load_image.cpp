#include <idphoto/vision/load_image.hpp>
#include "frame_cv_utils.hpp"
#include <opencv2/core.hpp>
#include <opencv2/imgcodecs.hpp>

namespace idphoto::vision {

namespace ic = idphoto::core;

std::expected<ic::Frame, ic::BoothError> load_frame_from_image(const std::string& path,
                                                               ic::Timestamp timestamp) {
  cv::Mat mat = cv::imread(path, cv::IMREAD_UNCHANGED);
  if (mat.empty() || mat.depth() != CV_8U) {
    return std::unexpected(ic::BoothError::LoadFailed);
  }

  ic::PixelFormat format = ic::PixelFormat::BGR8;
  if (mat.channels() == 1) format = ic::PixelFormat::Grayscale8;
  if (mat.channels() == 4) format = ic::PixelFormat::BGRA8;

  return detail::mat_to_frame(mat, format, timestamp);
}

std::expected<void, ic::BoothError> save_frame_to_image(const ic::Frame& frame,
                                                        const std::string& path) {
  auto bgr = detail::to_bgr(frame);
  if (!bgr) {
    return std::unexpected(ic::BoothError::InvalidFrame);
  }
  try {
    if (!cv::imwrite(path, *bgr)) {
      return std::unexpected(ic::BoothError::Storage);
    }
  } catch (const cv::Exception&) {
    return std::unexpected(ic::BoothError::Storage);
  }
  return {};
}

}  // namespace idphoto::vision
