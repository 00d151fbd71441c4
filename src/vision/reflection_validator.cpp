#include <idphoto/vision/reflection_validator.hpp>
#include "frame_cv_utils.hpp"
#include "validator_support.hpp"
#include <opencv2/core.hpp>
#include <opencv2/imgproc.hpp>
#include <algorithm>
#include <initializer_list>
#include <limits>
#include <utility>
#include <vector>

namespace idphoto::vision {

namespace ic = idphoto::core;

namespace {

/// Bounding box of both eyes' landmarks.
ic::BBox eye_span(const std::vector<ic::Landmark>& lm, const ic::LandmarkLayout& layout) {
  float x0 = std::numeric_limits<float>::max();
  float y0 = std::numeric_limits<float>::max();
  float x1 = std::numeric_limits<float>::lowest();
  float y1 = std::numeric_limits<float>::lowest();
  for (const auto* eye : {&layout.left_eye, &layout.right_eye}) {
    for (std::size_t idx : {eye->outer, eye->inner, eye->upper_lid, eye->lower_lid}) {
      x0 = std::min(x0, lm[idx].x);
      y0 = std::min(y0, lm[idx].y);
      x1 = std::max(x1, lm[idx].x);
      y1 = std::max(y1, lm[idx].y);
    }
  }
  return ic::BBox{x0, y0, x1 - x0, y1 - y0};
}

}  // namespace

ic::ValidationOutcome ReflectionValidator::evaluate(const ic::Frame& frame,
                                                    const ic::PerceptionResult& perception,
                                                    const ic::ValidatorConfig& config) const {
  const auto& layout = config.landmark_layout;
  auto guard = detail::require_landmarks(kName, perception, layout);
  if (auto* early = std::get_if<ic::ValidationOutcome>(&guard)) return std::move(*early);
  const auto& lm = std::get<const ic::FaceObservation*>(guard)->landmarks;

  auto gray = detail::to_gray(frame);
  if (!gray) {
    return ic::fail_outcome(kName, ic::OutcomeCode::ImageUnreadable, 0.f);
  }

  const auto& t = config.reflection;
  const ic::BBox eyes = eye_span(lm, layout);
  const float corner_distance =
      detail::distance(lm[layout.left_eye.outer], lm[layout.right_eye.outer]);
  const float pad = t.eye_region_padding * corner_distance;
  const cv::Rect roi = detail::padded_rect(eyes, pad, pad, gray->size());
  // Eyes outside the frame are a framing problem, reported by FacePosition.
  // Nothing was inspected, so the score stays neutral.
  if (roi.area() == 0) return ic::pass_outcome(kName, kUninspectedScore, 0.f);

  cv::Mat mask;
  cv::threshold((*gray)(roi), mask, static_cast<double>(t.bright_level) - 1.0, 255.0,
                cv::THRESH_BINARY);
  cv::morphologyEx(mask, mask, cv::MORPH_OPEN,
                   cv::getStructuringElement(cv::MORPH_RECT, cv::Size(3, 3)));

  cv::Mat labels;
  cv::Mat stats;
  cv::Mat centroids;
  const int n = cv::connectedComponentsWithStats(mask, labels, stats, centroids, 8, CV_32S);
  long long clustered = 0;
  for (int i = 1; i < n; ++i) {  // label 0 is the background
    const int area = stats.at<int>(i, cv::CC_STAT_AREA);
    if (area >= t.min_cluster_area) clustered += area;
  }
  const float ratio = static_cast<float>(clustered) / static_cast<float>(roi.area());

  const float score = detail::score_at_most(ratio, t.max_area_ratio);
  if (ratio >= t.max_area_ratio) {
    return ic::fail_outcome(kName, ic::OutcomeCode::ReflectionDetected, score, ratio);
  }
  return ic::pass_outcome(kName, score, ratio);
}

}  // namespace idphoto::vision
