#include <idphoto/core/validator_config.hpp>
#include <idphoto/vision/shadow_validator.hpp>
#include "support/synthetic_face.hpp"
#include <gtest/gtest.h>

namespace ic = idphoto::core;
namespace iv = idphoto::vision;
namespace it = idphoto::test;

TEST(ShadowValidator, EvenlyLitFacePasses) {
  iv::ShadowValidator v;
  auto o = v.evaluate(it::portrait_frame(), it::portrait_face(), ic::ValidatorConfig{});
  EXPECT_TRUE(o.passed);
  EXPECT_LT(o.measured, 0.05f);
}

TEST(ShadowValidator, HalfShadowedFaceFails) {
  const auto face = it::portrait_face();
  const auto& b = face.bounding_box;
  cv::Mat img = it::portrait_mat();
  cv::Mat left = img(cv::Rect(static_cast<int>(b.x), static_cast<int>(b.y),
                              static_cast<int>(b.w / 2), static_cast<int>(b.h)));
  left.convertTo(left, -1, 0.5);

  iv::ShadowValidator v;
  auto o = v.evaluate(it::frame_from_mat(img), face, ic::ValidatorConfig{});
  EXPECT_FALSE(o.passed);
  EXPECT_EQ(o.code, ic::OutcomeCode::ShadowDetected);
  EXPECT_NEAR(o.measured, 0.5f, 0.05f);
}

TEST(ShadowValidator, NoFace) {
  iv::ShadowValidator v;
  EXPECT_EQ(v.evaluate(it::portrait_frame(), ic::NoFaceDetected{}, ic::ValidatorConfig{}).code,
            ic::OutcomeCode::FaceNotDetected);
}
