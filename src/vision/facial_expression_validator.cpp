#include <idphoto/vision/facial_expression_validator.hpp>
#include "validator_support.hpp"
#include <algorithm>
#include <utility>

namespace idphoto::vision {

namespace ic = idphoto::core;

ic::ValidationOutcome FacialExpressionValidator::evaluate(
    const ic::Frame& /*frame*/, const ic::PerceptionResult& perception,
    const ic::ValidatorConfig& config) const {
  const auto& layout = config.landmark_layout;
  auto guard = detail::require_landmarks(kName, perception, layout);
  if (auto* early = std::get_if<ic::ValidationOutcome>(&guard)) return std::move(*early);
  const ic::FaceObservation& face = *std::get<const ic::FaceObservation*>(guard);

  const auto& t = config.expression;
  const float neutral = face.expression(t.neutral_label).value_or(0.f);
  const float mouth = detail::distance(face.landmarks[layout.inner_lip_top],
                                       face.landmarks[layout.inner_lip_bottom]);

  const float score = std::min(detail::score_at_least(neutral, t.neutral_min),
                               detail::score_at_most(mouth, t.mouth_open_max_px));

  if (mouth > t.mouth_open_max_px) {
    return ic::fail_outcome(kName, ic::OutcomeCode::MouthOpen, score, mouth);
  }
  if (neutral < t.neutral_min) {
    return ic::fail_outcome(kName, ic::OutcomeCode::NonNeutralExpression, score, neutral);
  }
  return ic::pass_outcome(kName, score, neutral);
}

}  // namespace idphoto::vision
