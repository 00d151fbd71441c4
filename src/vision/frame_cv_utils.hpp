#pragma once

#include <idphoto/core/frame.hpp>
#include <idphoto/core/geometry.hpp>
#include <opencv2/core/mat.hpp>
#include <optional>

namespace idphoto::vision::detail {

/// Wrap an 8-bit Frame as a cv::Mat view (no copy). Returns nullopt if the
/// format is not an 8-bit image or the buffer is too small.
std::optional<cv::Mat> frame_to_mat(const idphoto::core::Frame& frame);

/// Copy a cv::Mat into a Frame.
idphoto::core::Frame mat_to_frame(const cv::Mat& mat,
                                  idphoto::core::PixelFormat format,
                                  idphoto::core::Timestamp timestamp = idphoto::core::Timestamp{0});

/// Single-channel 8-bit luminance of the frame; nullopt if unsupported.
std::optional<cv::Mat> to_gray(const idphoto::core::Frame& frame);

/// 3-channel BGR copy or view of the frame; nullopt if unsupported.
std::optional<cv::Mat> to_bgr(const idphoto::core::Frame& frame);

/// Box clipped to the image; empty rect when it lies outside.
cv::Rect clip_to_image(const idphoto::core::BBox& box, cv::Size size);

/// Box grown by pad_x / pad_y pixels on each side, then clipped.
cv::Rect padded_rect(const idphoto::core::BBox& box, float pad_x, float pad_y, cv::Size size);

}  // namespace idphoto::vision::detail
