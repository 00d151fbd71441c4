#include <idphoto/vision/mock_perception_adapter.hpp>
#include "support/synthetic_face.hpp"
#include <gtest/gtest.h>

namespace ic = idphoto::core;
namespace iv = idphoto::vision;
namespace it = idphoto::test;

TEST(MockPerceptionAdapter, DefaultsToNoFace) {
  iv::MockPerceptionAdapter adapter;
  auto r = adapter.detect(it::uniform_gray_frame(128, 8, 8));
  ASSERT_TRUE(r.has_value());
  EXPECT_TRUE(std::holds_alternative<ic::NoFaceDetected>(*r));
  EXPECT_EQ(adapter.call_count(), 1u);
}

TEST(MockPerceptionAdapter, QueuedResultsComeFirst) {
  iv::MockPerceptionAdapter adapter(it::portrait_face());
  ic::FaceObservation other = it::portrait_face();
  other.detection_confidence = 0.5f;
  adapter.enqueue(ic::NoFaceDetected{});
  adapter.enqueue(other);

  const auto frame = it::uniform_gray_frame(128, 8, 8);
  EXPECT_TRUE(std::holds_alternative<ic::NoFaceDetected>(*adapter.detect(frame)));
  EXPECT_FLOAT_EQ(ic::face_of(*adapter.detect(frame))->detection_confidence, 0.5f);
  EXPECT_FLOAT_EQ(ic::face_of(*adapter.detect(frame))->detection_confidence, 0.99f);
  EXPECT_EQ(adapter.call_count(), 3u);
}

TEST(MockPerceptionAdapter, UnavailableAndInvalidInput) {
  iv::MockPerceptionAdapter adapter;
  auto empty = adapter.detect(ic::Frame{});
  ASSERT_FALSE(empty.has_value());
  EXPECT_EQ(empty.error(), ic::BoothError::InvalidFrame);

  adapter.set_unavailable(true);
  auto r = adapter.detect(it::uniform_gray_frame(128, 8, 8));
  ASSERT_FALSE(r.has_value());
  EXPECT_EQ(r.error(), ic::BoothError::PerceptionUnavailable);
}

TEST(FrontalFaceObservation, MatchesLayout) {
  const auto face = iv::frontal_face_observation(480, 640);
  EXPECT_EQ(face.landmarks.size(), 68u);
  EXPECT_FLOAT_EQ(face.bounding_box.center_x(), 240.f);
  EXPECT_FLOAT_EQ(face.bounding_box.center_y(), 320.f);
  EXPECT_EQ(face.expression("neutral"), 0.95f);
  EXPECT_EQ(face.head_pose, ic::HeadPose{});

  const auto mesh = iv::frontal_face_observation(480, 640, ic::LandmarkLayout::mediapipe468(),
                                                 "calm");
  EXPECT_EQ(mesh.landmarks.size(), 468u);
  EXPECT_TRUE(mesh.expression("calm").has_value());
}
