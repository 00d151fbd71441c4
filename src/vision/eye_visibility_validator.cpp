#include <idphoto/vision/eye_visibility_validator.hpp>
#include "validator_support.hpp"
#include <algorithm>
#include <utility>
#include <vector>

namespace idphoto::vision {

namespace ic = idphoto::core;

namespace {

float mean_visibility(const std::vector<ic::Landmark>& lm, const ic::EyeIndices& eye) {
  return (lm[eye.outer].visibility + lm[eye.inner].visibility + lm[eye.upper_lid].visibility +
          lm[eye.lower_lid].visibility) /
         4.f;
}

float aspect_ratio(const std::vector<ic::Landmark>& lm, const ic::EyeIndices& eye) {
  const float width = detail::distance(lm[eye.outer], lm[eye.inner]);
  if (width <= 0.f) return 0.f;
  return detail::distance(lm[eye.upper_lid], lm[eye.lower_lid]) / width;
}

}  // namespace

ic::ValidationOutcome EyeVisibilityValidator::evaluate(const ic::Frame& /*frame*/,
                                                       const ic::PerceptionResult& perception,
                                                       const ic::ValidatorConfig& config) const {
  const auto& layout = config.landmark_layout;
  auto guard = detail::require_landmarks(kName, perception, layout);
  if (auto* early = std::get_if<ic::ValidationOutcome>(&guard)) return std::move(*early);
  const auto& lm = std::get<const ic::FaceObservation*>(guard)->landmarks;

  const auto& t = config.eyes;
  const float visibility =
      std::min(mean_visibility(lm, layout.left_eye), mean_visibility(lm, layout.right_eye));
  const float ear = std::min(aspect_ratio(lm, layout.left_eye), aspect_ratio(lm, layout.right_eye));
  const bool ear_enabled = t.eye_aspect_ratio_min > 0.f;

  float score = detail::score_at_least(visibility, t.visibility_min);
  if (ear_enabled) score = std::min(score, detail::score_at_least(ear, t.eye_aspect_ratio_min));

  if (visibility < t.visibility_min) {
    return ic::fail_outcome(kName, ic::OutcomeCode::EyesObstructed, score, visibility);
  }
  if (ear_enabled && ear < t.eye_aspect_ratio_min) {
    return ic::fail_outcome(kName, ic::OutcomeCode::EyesClosed, score, ear);
  }
  return ic::pass_outcome(kName, score, visibility);
}

}  // namespace idphoto::vision
