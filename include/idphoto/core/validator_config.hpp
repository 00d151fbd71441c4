#pragma once

#include <idphoto/core/error.hpp>
#include <idphoto/core/landmark_layout.hpp>
#include <cstdint>
#include <expected>
#include <string>

namespace idphoto::core {

/// Luminance bands over the face region (grayscale, 0-255).
struct BrightnessThresholds {
  float mean_min{60.f};
  float mean_max{200.f};
  float stddev_min{8.f};
  float stddev_max{90.f};
};

/// Laplacian-variance focus measure over the padded face region.
struct SharpnessThresholds {
  float min_laplacian_variance{50.f};
  /// Face box grown by this fraction of min(w, h) on each side.
  float roi_padding{0.1f};
};

/// Head placement relative to the frame.
struct FacePositionThresholds {
  /// Max |center offset| / frame dimension, per axis.
  float center_tolerance{0.1f};
  /// Face height / frame height band.
  float size_ratio_min{0.3f};
  float size_ratio_max{0.6f};
  float max_yaw_deg{12.f};
  float max_pitch_deg{12.f};
  float max_roll_deg{8.f};
};

struct ExpressionThresholds {
  std::string neutral_label{"neutral"};
  float neutral_min{0.8f};
  /// Inner-lip distance in pixels.
  float mouth_open_max_px{5.f};
};

struct EyeVisibilityThresholds {
  float visibility_min{0.7f};
  /// Lid distance / corner distance; 0 disables the closed-eye check.
  float eye_aspect_ratio_min{0.12f};
};

/// Specular highlights in the eye/glasses region.
struct ReflectionThresholds {
  std::uint8_t bright_level{240};
  int min_cluster_area{4};
  /// Clustered bright area / eye region area must stay below this.
  float max_area_ratio{0.02f};
  /// Eye region grown on each side by this fraction of the outer-corner
  /// distance, so the lenses of glasses are covered.
  float eye_region_padding{0.15f};
};

/// Left/right luminance balance of the face.
struct ShadowThresholds {
  float max_asymmetry{0.25f};
};

/// Band above the face box inspected for caps and hats.
struct HeadwearThresholds {
  float band_height_ratio{0.3f};
  /// Below this skin fraction the band is covered by something.
  float min_skin_ratio{0.3f};
  /// Covered and darker than this fraction: dark cap or hat.
  float max_dark_ratio{0.4f};
  std::uint8_t dark_level{60};
  /// Covered and color stddev below this: uniform fabric.
  float uniform_stddev{25.f};
};

/// Background outside the expanded face box should be plain.
struct BackgroundThresholds {
  float max_stddev{40.f};
  float max_edge_density{0.1f};
};

/// Per-validator thresholds and the landmark layout of the perception model.
/// Loaded once per session and passed by const reference; never mutated mid-session.
struct ValidatorConfig {
  LandmarkLayout landmark_layout{LandmarkLayout::ibug68()};
  BrightnessThresholds brightness;
  SharpnessThresholds sharpness;
  FacePositionThresholds face_position;
  ExpressionThresholds expression;
  EyeVisibilityThresholds eyes;
  ReflectionThresholds reflection;
  ShadowThresholds shadow;
  HeadwearThresholds headwear;
  BackgroundThresholds background;
};

/// Reject inconsistent or out-of-range thresholds (inverted bands, ratios
/// outside [0,1], NaN, empty layout). Returns BoothError::ValidatorConfig.
[[nodiscard]] std::expected<void, BoothError> validate_config(const ValidatorConfig& config);

}  // namespace idphoto::core
