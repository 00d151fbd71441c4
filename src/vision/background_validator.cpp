#include <idphoto/vision/background_validator.hpp>
#include "frame_cv_utils.hpp"
#include "validator_support.hpp"
#include <opencv2/core.hpp>
#include <opencv2/imgproc.hpp>
#include <algorithm>
#include <utility>

namespace idphoto::vision {

namespace ic = idphoto::core;

namespace {

/// Fewer background pixels than this and the check is skipped.
constexpr int kMinBackgroundPixels = 100;

}  // namespace

ic::ValidationOutcome BackgroundValidator::evaluate(const ic::Frame& frame,
                                                    const ic::PerceptionResult& perception,
                                                    const ic::ValidatorConfig& config) const {
  auto guard = detail::require_face(kName, perception);
  if (auto* early = std::get_if<ic::ValidationOutcome>(&guard)) return std::move(*early);
  const ic::FaceObservation& face = *std::get<const ic::FaceObservation*>(guard);

  auto gray = detail::to_gray(frame);
  if (!gray) {
    return ic::fail_outcome(kName, ic::OutcomeCode::ImageUnreadable, 0.f);
  }

  // Head, hair and shoulders: 1.6 x face width, 1.8 x face height.
  const auto& box = face.bounding_box;
  const ic::BBox person{box.x - 0.3f * box.w, box.y - 0.2f * box.h, 1.6f * box.w, 1.8f * box.h};
  const cv::Rect person_roi = detail::clip_to_image(person, gray->size());

  cv::Mat mask(gray->size(), CV_8UC1, cv::Scalar(255));
  if (person_roi.area() > 0) mask(person_roi).setTo(cv::Scalar(0));
  const int background_pixels = cv::countNonZero(mask);
  if (background_pixels < kMinBackgroundPixels) return ic::pass_outcome(kName, 1.f, 0.f);

  cv::Scalar mean;
  cv::Scalar stddev;
  cv::meanStdDev(*gray, mean, stddev, mask);
  const float sd = static_cast<float>(stddev[0]);

  cv::Mat edges;
  cv::Canny(*gray, edges, 50, 150);
  cv::Mat background_edges;
  cv::bitwise_and(edges, mask, background_edges);
  const float edge_density = static_cast<float>(cv::countNonZero(background_edges)) /
                             static_cast<float>(background_pixels);

  const auto& t = config.background;
  const float score = std::min(detail::score_at_most(sd, t.max_stddev),
                               detail::score_at_most(edge_density, t.max_edge_density));
  if (sd > t.max_stddev || edge_density > t.max_edge_density) {
    return ic::fail_outcome(kName, ic::OutcomeCode::BackgroundNotUniform, score, sd);
  }
  return ic::pass_outcome(kName, score, sd);
}

}  // namespace idphoto::vision
