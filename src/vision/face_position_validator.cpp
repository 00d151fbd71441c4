#include <idphoto/vision/face_position_validator.hpp>
#include "validator_support.hpp"
#include <algorithm>
#include <utility>
#include <cmath>

namespace idphoto::vision {

namespace ic = idphoto::core;

ic::ValidationOutcome FacePositionValidator::evaluate(const ic::Frame& frame,
                                                      const ic::PerceptionResult& perception,
                                                      const ic::ValidatorConfig& config) const {
  auto guard = detail::require_face(kName, perception);
  if (auto* early = std::get_if<ic::ValidationOutcome>(&guard)) return std::move(*early);
  const ic::FaceObservation& face = *std::get<const ic::FaceObservation*>(guard);

  if (frame.width() == 0 || frame.height() == 0) {
    return ic::fail_outcome(kName, ic::OutcomeCode::ImageUnreadable, 0.f);
  }
  const float fw = static_cast<float>(frame.width());
  const float fh = static_cast<float>(frame.height());
  const auto& box = face.bounding_box;
  const auto& t = config.face_position;

  const float size_ratio = box.h / fh;
  const float offset = std::max(std::abs(box.center_x() - fw * 0.5f) / fw,
                                std::abs(box.center_y() - fh * 0.5f) / fh);
  const auto& pose = face.head_pose;
  const float yaw = std::abs(pose.yaw);
  const float pitch = std::abs(pose.pitch);
  const float roll = std::abs(pose.roll);

  const float size_score = detail::score_in_band(size_ratio, t.size_ratio_min, t.size_ratio_max);
  const float center_score = detail::score_at_most(offset, t.center_tolerance);
  const float pose_score = std::min({detail::score_at_most(yaw, t.max_yaw_deg),
                                     detail::score_at_most(pitch, t.max_pitch_deg),
                                     detail::score_at_most(roll, t.max_roll_deg)});
  const float score = std::min({size_score, center_score, pose_score});

  if (size_ratio < t.size_ratio_min) {
    return ic::fail_outcome(kName, ic::OutcomeCode::FaceTooSmall, score, size_ratio);
  }
  if (size_ratio > t.size_ratio_max) {
    return ic::fail_outcome(kName, ic::OutcomeCode::FaceTooLarge, score, size_ratio);
  }
  if (offset > t.center_tolerance) {
    return ic::fail_outcome(kName, ic::OutcomeCode::FaceOffCenter, score, offset);
  }
  if (yaw > t.max_yaw_deg || pitch > t.max_pitch_deg || roll > t.max_roll_deg) {
    return ic::fail_outcome(kName, ic::OutcomeCode::HeadTilted, score,
                            std::max({yaw, pitch, roll}));
  }
  return ic::pass_outcome(kName, score, size_ratio);
}

}  // namespace idphoto::vision
