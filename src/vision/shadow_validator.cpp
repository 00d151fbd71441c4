#include <idphoto/vision/shadow_validator.hpp>
#include "frame_cv_utils.hpp"
#include "validator_support.hpp"
#include <opencv2/core.hpp>
#include <algorithm>
#include <cmath>
#include <utility>

namespace idphoto::vision {

namespace ic = idphoto::core;

ic::ValidationOutcome ShadowValidator::evaluate(const ic::Frame& frame,
                                                const ic::PerceptionResult& perception,
                                                const ic::ValidatorConfig& config) const {
  auto guard = detail::require_face(kName, perception);
  if (auto* early = std::get_if<ic::ValidationOutcome>(&guard)) return std::move(*early);
  const ic::FaceObservation& face = *std::get<const ic::FaceObservation*>(guard);

  auto gray = detail::to_gray(frame);
  if (!gray) {
    return ic::fail_outcome(kName, ic::OutcomeCode::ImageUnreadable, 0.f);
  }
  const cv::Rect roi = detail::clip_to_image(face.bounding_box, gray->size());
  if (roi.width < 2 || roi.height < 1) return ic::pass_outcome(kName, 1.f, 0.f);

  const int half = roi.width / 2;
  const cv::Rect left(roi.x, roi.y, half, roi.height);
  const cv::Rect right(roi.x + roi.width - half, roi.y, half, roi.height);
  const float l = static_cast<float>(cv::mean((*gray)(left))[0]);
  const float r = static_cast<float>(cv::mean((*gray)(right))[0]);
  const float brighter = std::max({l, r, 1.f});
  const float asymmetry = std::abs(l - r) / brighter;

  const auto& t = config.shadow;
  const float score = detail::score_at_most(asymmetry, t.max_asymmetry);
  if (asymmetry >= t.max_asymmetry) {
    return ic::fail_outcome(kName, ic::OutcomeCode::ShadowDetected, score, asymmetry);
  }
  return ic::pass_outcome(kName, score, asymmetry);
}

}  // namespace idphoto::vision
