#include <idphoto/vision/brightness_validator.hpp>
#include "frame_cv_utils.hpp"
#include "validator_support.hpp"
#include <opencv2/core.hpp>
#include <algorithm>

namespace idphoto::vision {

namespace ic = idphoto::core;

ic::ValidationOutcome BrightnessValidator::evaluate(const ic::Frame& frame,
                                                    const ic::PerceptionResult& perception,
                                                    const ic::ValidatorConfig& config) const {
  auto gray = detail::to_gray(frame);
  if (!gray) {
    return ic::fail_outcome(kName, ic::OutcomeCode::ImageUnreadable, 0.f);
  }

  cv::Mat region = *gray;
  if (const auto* face = ic::face_of(perception)) {
    const cv::Rect roi = detail::clip_to_image(face->bounding_box, gray->size());
    if (!roi.empty()) region = (*gray)(roi);
  }

  cv::Scalar mean;
  cv::Scalar stddev;
  cv::meanStdDev(region, mean, stddev);
  const float m = static_cast<float>(mean[0]);
  const float s = static_cast<float>(stddev[0]);

  const auto& t = config.brightness;
  const float score = std::min(detail::score_in_band(m, t.mean_min, t.mean_max),
                               detail::score_in_band(s, t.stddev_min, t.stddev_max));

  if (m < t.mean_min) return ic::fail_outcome(kName, ic::OutcomeCode::TooDark, score, m);
  if (m > t.mean_max) return ic::fail_outcome(kName, ic::OutcomeCode::TooBright, score, m);
  if (s < t.stddev_min) return ic::fail_outcome(kName, ic::OutcomeCode::LowContrast, score, m);
  if (s > t.stddev_max) return ic::fail_outcome(kName, ic::OutcomeCode::HighContrast, score, m);
  return ic::pass_outcome(kName, score, m);
}

}  // namespace idphoto::vision
