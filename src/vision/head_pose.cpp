#include <idphoto/vision/head_pose.hpp>
#include <opencv2/calib3d.hpp>
#include <opencv2/core.hpp>
#include <vector>

namespace idphoto::vision {

namespace ic = idphoto::core;

namespace {

/// Generic face in camera axes (x right, y down, z away from the camera),
/// nose tip at the origin. Order matches image_points() below.
const std::vector<cv::Point3d>& model_points() {
  static const std::vector<cv::Point3d> points{
      {0.0, 0.0, 0.0},          // nose tip
      {0.0, 330.0, 65.0},       // chin
      {-225.0, -170.0, 135.0},  // image-left eye, outer corner
      {225.0, -170.0, 135.0},   // image-right eye, outer corner
      {-150.0, 150.0, 125.0},   // image-left mouth corner
      {150.0, 150.0, 125.0},    // image-right mouth corner
  };
  return points;
}

std::vector<cv::Point2d> image_points(const std::vector<ic::Landmark>& lm,
                                      const ic::LandmarkLayout& layout) {
  const auto at = [&](std::size_t i) { return cv::Point2d(lm[i].x, lm[i].y); };
  return {at(layout.nose_tip),        at(layout.chin),       at(layout.left_eye.outer),
          at(layout.right_eye.outer), at(layout.mouth_left), at(layout.mouth_right)};
}

}  // namespace

std::optional<ic::HeadPose> estimate_head_pose(const std::vector<ic::Landmark>& landmarks,
                                               const ic::LandmarkLayout& layout,
                                               std::uint32_t image_width,
                                               std::uint32_t image_height) {
  if (landmarks.size() != layout.landmark_count || image_width == 0 || image_height == 0) {
    return std::nullopt;
  }

  const double focal = static_cast<double>(image_width);
  const cv::Matx33d camera(focal, 0.0, image_width / 2.0,
                           0.0, focal, image_height / 2.0,
                           0.0, 0.0, 1.0);
  const cv::Mat dist = cv::Mat::zeros(4, 1, CV_64F);

  cv::Mat rvec;
  cv::Mat tvec;
  const bool ok = cv::solvePnP(model_points(), image_points(landmarks, layout), camera, dist,
                               rvec, tvec, false, cv::SOLVEPNP_ITERATIVE);
  if (!ok) return std::nullopt;

  cv::Mat rotation;
  cv::Rodrigues(rvec, rotation);
  cv::Mat mtx_r;
  cv::Mat mtx_q;
  // Euler angles in degrees about x (pitch), y (yaw), z (roll).
  const cv::Vec3d euler = cv::RQDecomp3x3(rotation, mtx_r, mtx_q);
  return ic::HeadPose{static_cast<float>(euler[1]), static_cast<float>(euler[0]),
                      static_cast<float>(euler[2])};
}

}  // namespace idphoto::vision
