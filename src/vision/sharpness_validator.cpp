#include <idphoto/vision/sharpness_validator.hpp>
#include "frame_cv_utils.hpp"
#include "validator_support.hpp"
#include <opencv2/core.hpp>
#include <opencv2/imgproc.hpp>
#include <algorithm>

namespace idphoto::vision {

namespace ic = idphoto::core;

ic::ValidationOutcome SharpnessValidator::evaluate(const ic::Frame& frame,
                                                   const ic::PerceptionResult& perception,
                                                   const ic::ValidatorConfig& config) const {
  auto gray = detail::to_gray(frame);
  if (!gray) {
    return ic::fail_outcome(kName, ic::OutcomeCode::ImageUnreadable, 0.f);
  }

  const auto& t = config.sharpness;
  cv::Mat region = *gray;
  if (const auto* face = ic::face_of(perception)) {
    const auto& box = face->bounding_box;
    const float pad = t.roi_padding * std::min(box.w, box.h);
    const cv::Rect roi = detail::padded_rect(box, pad, pad, gray->size());
    if (roi.width >= 3 && roi.height >= 3) region = (*gray)(roi);
  }

  cv::Mat lap;
  cv::Laplacian(region, lap, CV_64F, 3);
  cv::Scalar mean;
  cv::Scalar stddev;
  cv::meanStdDev(lap, mean, stddev);
  const float variance = static_cast<float>(stddev[0] * stddev[0]);

  const float score = detail::score_at_least(variance, t.min_laplacian_variance);
  if (variance < t.min_laplacian_variance) {
    return ic::fail_outcome(kName, ic::OutcomeCode::Blurry, score, variance);
  }
  return ic::pass_outcome(kName, score, variance);
}

}  // namespace idphoto::vision
