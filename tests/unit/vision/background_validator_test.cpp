#include <idphoto/core/validator_config.hpp>
#include <idphoto/vision/background_validator.hpp>
#include "support/synthetic_face.hpp"
#include <opencv2/imgproc.hpp>
#include <gtest/gtest.h>

namespace ic = idphoto::core;
namespace iv = idphoto::vision;
namespace it = idphoto::test;

TEST(BackgroundValidator, PlainBackgroundPasses) {
  iv::BackgroundValidator v;
  auto o = v.evaluate(it::portrait_frame(), it::portrait_face(), ic::ValidatorConfig{});
  EXPECT_TRUE(o.passed) << "stddev=" << o.measured;
  EXPECT_LT(o.measured, 10.f);
}

TEST(BackgroundValidator, StripedBackgroundFails) {
  cv::Mat img = it::portrait_mat();
  for (int x = 0; x < img.cols; x += 20) {
    cv::rectangle(img, cv::Rect(x, 0, 10, img.rows), cv::Scalar(20, 20, 20), cv::FILLED);
  }
  // Redraw the subject over the stripes so only the background changes.
  const cv::Mat clean = it::portrait_mat();
  const auto face = it::portrait_face();
  const auto& b = face.bounding_box;
  const cv::Rect subject(static_cast<int>(b.x), static_cast<int>(b.y), static_cast<int>(b.w),
                         static_cast<int>(b.h));
  clean(subject).copyTo(img(subject));

  iv::BackgroundValidator v;
  auto o = v.evaluate(it::frame_from_mat(img), face, ic::ValidatorConfig{});
  EXPECT_FALSE(o.passed);
  EXPECT_EQ(o.code, ic::OutcomeCode::BackgroundNotUniform);
  EXPECT_GT(o.measured, 40.f);
}

TEST(BackgroundValidator, SubjectFillingFramePasses) {
  auto face = it::portrait_face();
  face.bounding_box = ic::BBox{0.f, 0.f, static_cast<float>(it::kFrameWidth),
                               static_cast<float>(it::kFrameHeight)};
  iv::BackgroundValidator v;
  auto o = v.evaluate(it::uniform_gray_frame(128), face, ic::ValidatorConfig{});
  EXPECT_TRUE(o.passed);
}
