#include <idphoto/core/validator_config.hpp>
#include <cmath>
#include <initializer_list>

namespace idphoto::core {

namespace {

bool finite(std::initializer_list<float> values) {
  for (float v : values) {
    if (!std::isfinite(v)) return false;
  }
  return true;
}

bool unit(float v) { return v >= 0.f && v <= 1.f; }

bool layout_ok(const LandmarkLayout& l) {
  if (l.landmark_count == 0) return false;
  for (std::size_t idx : {l.left_eye.outer, l.left_eye.inner, l.left_eye.upper_lid,
                          l.left_eye.lower_lid, l.right_eye.outer, l.right_eye.inner,
                          l.right_eye.upper_lid, l.right_eye.lower_lid, l.inner_lip_top,
                          l.inner_lip_bottom, l.mouth_left, l.mouth_right, l.nose_tip, l.chin}) {
    if (idx >= l.landmark_count) return false;
  }
  return true;
}

}  // namespace

std::expected<void, BoothError> validate_config(const ValidatorConfig& c) {
  const auto& b = c.brightness;
  const auto& p = c.face_position;
  const bool ok =
      layout_ok(c.landmark_layout) &&
      finite({b.mean_min, b.mean_max, b.stddev_min, b.stddev_max}) &&
      b.mean_min >= 0.f && b.mean_min < b.mean_max && b.mean_max <= 255.f &&
      b.stddev_min >= 0.f && b.stddev_min < b.stddev_max &&
      finite({c.sharpness.min_laplacian_variance, c.sharpness.roi_padding}) &&
      c.sharpness.min_laplacian_variance > 0.f && c.sharpness.roi_padding >= 0.f &&
      finite({p.center_tolerance, p.size_ratio_min, p.size_ratio_max, p.max_yaw_deg,
              p.max_pitch_deg, p.max_roll_deg}) &&
      p.center_tolerance > 0.f && p.center_tolerance <= 0.5f &&
      p.size_ratio_min > 0.f && p.size_ratio_min < p.size_ratio_max && p.size_ratio_max <= 1.f &&
      p.max_yaw_deg > 0.f && p.max_pitch_deg > 0.f && p.max_roll_deg > 0.f &&
      !c.expression.neutral_label.empty() &&
      finite({c.expression.neutral_min, c.expression.mouth_open_max_px}) &&
      unit(c.expression.neutral_min) && c.expression.neutral_min > 0.f &&
      c.expression.mouth_open_max_px > 0.f &&
      finite({c.eyes.visibility_min, c.eyes.eye_aspect_ratio_min}) &&
      unit(c.eyes.visibility_min) && c.eyes.visibility_min > 0.f &&
      c.eyes.eye_aspect_ratio_min >= 0.f &&
      finite({c.reflection.max_area_ratio, c.reflection.eye_region_padding}) &&
      unit(c.reflection.max_area_ratio) && c.reflection.max_area_ratio > 0.f &&
      c.reflection.min_cluster_area > 0 && c.reflection.eye_region_padding >= 0.f &&
      finite({c.shadow.max_asymmetry}) && c.shadow.max_asymmetry > 0.f &&
      unit(c.shadow.max_asymmetry) &&
      finite({c.headwear.band_height_ratio, c.headwear.min_skin_ratio,
              c.headwear.max_dark_ratio, c.headwear.uniform_stddev}) &&
      c.headwear.band_height_ratio > 0.f && unit(c.headwear.min_skin_ratio) &&
      unit(c.headwear.max_dark_ratio) &&
      finite({c.background.max_stddev, c.background.max_edge_density}) &&
      c.background.max_stddev > 0.f && c.background.max_edge_density > 0.f &&
      unit(c.background.max_edge_density);
  if (!ok) return std::unexpected(BoothError::ValidatorConfig);
  return {};
}

}  // namespace idphoto::core
