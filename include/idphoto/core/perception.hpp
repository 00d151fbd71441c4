#pragma once

#include <idphoto/core/geometry.hpp>
#include <map>
#include <optional>
#include <string>
#include <variant>
#include <vector>

namespace idphoto::core {

/// Face geometry and expression signals for the single subject in a frame.
struct FaceObservation {
  BBox bounding_box{};
  std::vector<Landmark> landmarks;
  /// Expression label -> confidence in [0,1]. Ordered so reports are reproducible.
  std::map<std::string, float> expression_scores;
  HeadPose head_pose{};
  float detection_confidence{0.f};

  /// Confidence for label, or nullopt when the model did not report it.
  [[nodiscard]] std::optional<float> expression(const std::string& label) const {
    const auto it = expression_scores.find(label);
    if (it == expression_scores.end()) return std::nullopt;
    return it->second;
  }

  bool operator==(const FaceObservation&) const = default;
};

/// The perception model ran and found no face. A normal outcome, not an error.
struct NoFaceDetected {
  bool operator==(const NoFaceDetected&) const = default;
};

/// Normalized output of a perception adapter for one frame.
using PerceptionResult = std::variant<FaceObservation, NoFaceDetected>;

/// Face observation if one was detected, nullptr otherwise.
[[nodiscard]] inline const FaceObservation* face_of(const PerceptionResult& result) noexcept {
  return std::get_if<FaceObservation>(&result);
}

}  // namespace idphoto::core
