#include <idphoto/core/landmark_layout.hpp>
#include <idphoto/core/validator_config.hpp>
#include <gtest/gtest.h>
#include <limits>

namespace ic = idphoto::core;

TEST(ValidatorConfig, DefaultsAreValid) {
  ic::ValidatorConfig config;
  EXPECT_TRUE(ic::validate_config(config).has_value());
  EXPECT_EQ(config.landmark_layout.name, "ibug68");
  EXPECT_FLOAT_EQ(config.brightness.mean_min, 60.f);
  EXPECT_FLOAT_EQ(config.expression.neutral_min, 0.8f);
}

TEST(ValidatorConfig, InvertedBandIsRejected) {
  ic::ValidatorConfig config;
  config.brightness.mean_min = 210.f;
  auto r = ic::validate_config(config);
  ASSERT_FALSE(r.has_value());
  EXPECT_EQ(r.error(), ic::BoothError::ValidatorConfig);
}

TEST(ValidatorConfig, RatioOutsideUnitIntervalIsRejected) {
  ic::ValidatorConfig config;
  config.eyes.visibility_min = 1.5f;
  EXPECT_FALSE(ic::validate_config(config).has_value());
}

TEST(ValidatorConfig, NanIsRejected) {
  ic::ValidatorConfig config;
  config.shadow.max_asymmetry = std::numeric_limits<float>::quiet_NaN();
  EXPECT_FALSE(ic::validate_config(config).has_value());
}

TEST(ValidatorConfig, LayoutIndicesMustBeInRange) {
  ic::ValidatorConfig config;
  config.landmark_layout.landmark_count = 10;
  EXPECT_FALSE(ic::validate_config(config).has_value());
}

TEST(LandmarkLayout, BuiltinsByName) {
  auto ibug = ic::LandmarkLayout::by_name("ibug68");
  ASSERT_TRUE(ibug.has_value());
  EXPECT_EQ(ibug->landmark_count, 68u);
  EXPECT_EQ(ibug->nose_tip, 30u);

  auto mesh = ic::LandmarkLayout::by_name("mediapipe468");
  ASSERT_TRUE(mesh.has_value());
  EXPECT_EQ(mesh->landmark_count, 468u);
  EXPECT_EQ(mesh->chin, 152u);

  EXPECT_FALSE(ic::LandmarkLayout::by_name("dlib5").has_value());
}
