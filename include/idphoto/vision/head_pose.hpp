#pragma once

#include <idphoto/core/geometry.hpp>
#include <idphoto/core/landmark_layout.hpp>
#include <cstdint>
#include <optional>
#include <vector>

namespace idphoto::vision {

/// Head orientation from six layout landmarks (nose tip, chin, outer eye
/// corners, mouth corners) fitted to a generic 3D face with cv::solvePnP.
/// The camera is approximated with focal length = image width and the
/// principal point at the image center.
///
/// Returns nullopt when the landmark count does not match the layout or the
/// solver does not converge.
[[nodiscard]] std::optional<idphoto::core::HeadPose> estimate_head_pose(
    const std::vector<idphoto::core::Landmark>& landmarks,
    const idphoto::core::LandmarkLayout& layout,
    std::uint32_t image_width,
    std::uint32_t image_height);

}  // namespace idphoto::vision
