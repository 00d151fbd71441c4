#pragma once

#include <idphoto/core/landmark_layout.hpp>
#include <idphoto/core/outcome.hpp>
#include <idphoto/core/perception.hpp>
#include <algorithm>
#include <cmath>
#include <string_view>
#include <variant>

namespace idphoto::vision::detail {

/// Score for "measured >= threshold" rules: min(1, measured / threshold).
inline float score_at_least(float measured, float threshold) noexcept {
  if (threshold <= 0.f) return 1.f;
  return std::clamp(measured / threshold, 0.f, 1.f);
}

/// Score for "measured <= threshold" rules: min(1, threshold / measured).
inline float score_at_most(float measured, float threshold) noexcept {
  if (measured <= threshold || measured <= 0.f) return 1.f;
  return std::clamp(threshold / measured, 0.f, 1.f);
}

/// 1 inside [lo, hi]; ratio to the violated bound outside.
inline float score_in_band(float measured, float lo, float hi) noexcept {
  if (measured < lo) return score_at_least(measured, lo);
  if (measured > hi) return score_at_most(measured, hi);
  return 1.f;
}

/// Either the face to evaluate or the outcome to return without numeric work.
using FaceOrOutcome = std::variant<const idphoto::core::FaceObservation*,
                                   idphoto::core::ValidationOutcome>;

/// FACE_NOT_DETECTED for NoFaceDetected; otherwise the face.
inline FaceOrOutcome require_face(std::string_view validator_name,
                                  const idphoto::core::PerceptionResult& perception) {
  const auto* face = idphoto::core::face_of(perception);
  if (!face) {
    return idphoto::core::fail_outcome(validator_name,
                                       idphoto::core::OutcomeCode::FaceNotDetected, 0.f);
  }
  return face;
}

/// As require_face(), and additionally LANDMARK_COUNT_MISMATCH when the
/// landmark count differs from the configured model layout.
inline FaceOrOutcome require_landmarks(std::string_view validator_name,
                                       const idphoto::core::PerceptionResult& perception,
                                       const idphoto::core::LandmarkLayout& layout) {
  auto r = require_face(validator_name, perception);
  if (const auto* face = std::get_if<const idphoto::core::FaceObservation*>(&r)) {
    if ((*face)->landmarks.size() != layout.landmark_count) {
      return idphoto::core::fail_outcome(
          validator_name, idphoto::core::OutcomeCode::LandmarkCountMismatch, 0.f,
          static_cast<float>((*face)->landmarks.size()));
    }
  }
  return r;
}

inline float distance(const idphoto::core::Landmark& a, const idphoto::core::Landmark& b) noexcept {
  return std::hypot(a.x - b.x, a.y - b.y);
}

}  // namespace idphoto::vision::detail
