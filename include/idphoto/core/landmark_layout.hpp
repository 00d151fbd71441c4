#pragma once

#include <cstddef>
#include <optional>
#include <string>
#include <string_view>

namespace idphoto::core {

/// Landmark indices of one eye. "left" and "right" are image-space (camera view).
struct EyeIndices {
  std::size_t outer{0};
  std::size_t inner{0};
  std::size_t upper_lid{0};
  std::size_t lower_lid{0};
};

/// Index map of a perception-model version. The landmark count is fixed per
/// model; validators that read specific indices compare against landmark_count
/// and fail with LANDMARK_COUNT_MISMATCH instead of reading out of range.
struct LandmarkLayout {
  std::string name;
  std::size_t landmark_count{0};

  EyeIndices left_eye;
  EyeIndices right_eye;
  std::size_t inner_lip_top{0};
  std::size_t inner_lip_bottom{0};
  std::size_t mouth_left{0};
  std::size_t mouth_right{0};
  std::size_t nose_tip{0};
  std::size_t chin{0};

  /// iBUG 300-W 68-point annotation (dlib shape predictor order, 0-based).
  [[nodiscard]] static LandmarkLayout ibug68();

  /// MediaPipe Face Mesh 468-point topology.
  [[nodiscard]] static LandmarkLayout mediapipe468();

  /// Lookup by name ("ibug68", "mediapipe468"); nullopt if unknown.
  [[nodiscard]] static std::optional<LandmarkLayout> by_name(std::string_view name);

  bool operator==(const LandmarkLayout&) const = default;
};

}  // namespace idphoto::core
