#include <idphoto/vision/headwear_validator.hpp>
#include "frame_cv_utils.hpp"
#include "validator_support.hpp"
#include <opencv2/core.hpp>
#include <opencv2/imgproc.hpp>
#include <algorithm>
#include <utility>

namespace idphoto::vision {

namespace ic = idphoto::core;

namespace {

/// Fraction of skin-toned pixels (two HSV ranges covering light and dark skin).
float skin_ratio(const cv::Mat& bgr) {
  cv::Mat hsv;
  cv::cvtColor(bgr, hsv, cv::COLOR_BGR2HSV);
  cv::Mat light;
  cv::Mat dark;
  cv::inRange(hsv, cv::Scalar(0, 20, 70), cv::Scalar(20, 255, 255), light);
  cv::inRange(hsv, cv::Scalar(0, 10, 40), cv::Scalar(25, 200, 255), dark);
  cv::Mat skin;
  cv::bitwise_or(light, dark, skin);
  return static_cast<float>(cv::countNonZero(skin)) / static_cast<float>(skin.total());
}

}  // namespace

ic::ValidationOutcome HeadwearValidator::evaluate(const ic::Frame& frame,
                                                  const ic::PerceptionResult& perception,
                                                  const ic::ValidatorConfig& config) const {
  auto guard = detail::require_face(kName, perception);
  if (auto* early = std::get_if<ic::ValidationOutcome>(&guard)) return std::move(*early);
  const ic::FaceObservation& face = *std::get<const ic::FaceObservation*>(guard);

  auto bgr = detail::to_bgr(frame);
  if (!bgr) {
    return ic::fail_outcome(kName, ic::OutcomeCode::ImageUnreadable, 0.f);
  }

  const auto& t = config.headwear;
  const auto& box = face.bounding_box;
  const float band_h = t.band_height_ratio * box.h;
  const ic::BBox band{box.x, box.y - band_h, box.w, band_h};
  const cv::Rect roi = detail::clip_to_image(band, bgr->size());
  // Face touching the top edge: nothing to inspect.
  if (roi.area() == 0) return ic::pass_outcome(kName, 1.f, 1.f);

  const cv::Mat region = (*bgr)(roi);
  const float skin = skin_ratio(region);

  cv::Mat gray;
  cv::cvtColor(region, gray, cv::COLOR_BGR2GRAY);
  cv::Mat dark_mask;
  cv::threshold(gray, dark_mask, static_cast<double>(t.dark_level) - 1.0, 255.0,
                cv::THRESH_BINARY_INV);
  const float dark = static_cast<float>(cv::countNonZero(dark_mask)) /
                     static_cast<float>(dark_mask.total());

  cv::Scalar mean;
  cv::Scalar stddev;
  cv::meanStdDev(region, mean, stddev);
  const float color_stddev = static_cast<float>((stddev[0] + stddev[1] + stddev[2]) / 3.0);

  const bool covered = skin < t.min_skin_ratio;
  const bool headwear = covered && (dark > t.max_dark_ratio || color_stddev < t.uniform_stddev);
  const float score = detail::score_at_least(skin, t.min_skin_ratio);
  if (headwear) {
    return ic::fail_outcome(kName, ic::OutcomeCode::HeadwearDetected, score, skin);
  }
  return ic::pass_outcome(kName, score, skin);
}

}  // namespace idphoto::vision
