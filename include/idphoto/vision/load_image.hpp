#pragma once

#include <idphoto/core/error.hpp>
#include <idphoto/core/frame.hpp>
#include <expected>
#include <string>

namespace idphoto::vision {

/// Load an image file into a Frame (BGR8 or Grayscale8) stamped with the given
/// time. BoothError::LoadFailed if the file is missing or cannot be decoded.
[[nodiscard]] std::expected<idphoto::core::Frame, idphoto::core::BoothError>
load_frame_from_image(const std::string& path,
                      idphoto::core::Timestamp timestamp = idphoto::core::Timestamp{0});

/// Write a Frame to an image file (format chosen by extension).
[[nodiscard]] std::expected<void, idphoto::core::BoothError>
save_frame_to_image(const idphoto::core::Frame& frame, const std::string& path);

}  // namespace idphoto::vision
