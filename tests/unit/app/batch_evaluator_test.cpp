#include <idphoto/app/batch_evaluator.hpp>
#include <idphoto/core/orchestrator.hpp>
#include <idphoto/vision/mock_perception_adapter.hpp>
#include "support/fake_validators.hpp"
#include "support/synthetic_face.hpp"
#include <algorithm>
#include <memory>
#include <vector>
#include <gtest/gtest.h>

namespace ia = idphoto::app;
namespace ic = idphoto::core;
namespace iv = idphoto::vision;
namespace it = idphoto::test;

namespace {

/// Frames 0, 1, 2, ... with a face on every frame except those in no_face.
std::unique_ptr<ic::ValidationOrchestrator> make_orchestrator(std::size_t frames,
                                                              std::vector<std::size_t> no_face) {
  auto adapter = std::make_unique<iv::MockPerceptionAdapter>();
  for (std::size_t i = 0; i < frames; ++i) {
    const bool missing = std::find(no_face.begin(), no_face.end(), i) != no_face.end();
    if (missing) {
      adapter->enqueue(ic::NoFaceDetected{});
    } else {
      adapter->enqueue(it::portrait_face(64, 64));
    }
  }
  ic::ValidatorRegistry registry;
  (void)registry.add(std::make_unique<it::FixedValidator>("Brightness", true,
                                                          ic::OutcomeCode::TooDark, false));
  (void)registry.add(std::make_unique<it::FixedValidator>("FacePosition", true));
  return std::make_unique<ic::ValidationOrchestrator>(std::move(adapter), std::move(registry),
                                                      ic::ValidatorConfig{});
}

std::vector<ic::Frame> make_frames(std::size_t n) {
  std::vector<ic::Frame> frames;
  for (std::size_t i = 0; i < n; ++i) {
    frames.push_back(it::uniform_gray_frame(128, 64, 64, ic::Timestamp{static_cast<long long>(i)}));
  }
  return frames;
}

}  // namespace

TEST(BatchEvaluator, SequentialKeepsFrameOrder) {
  auto orchestrator = make_orchestrator(3, {1});
  auto results = ia::evaluate_batch(*orchestrator, make_frames(3));
  ASSERT_EQ(results.size(), 3u);
  ASSERT_TRUE(results[0].has_value());
  EXPECT_TRUE(results[0]->overall_passed());
  ASSERT_TRUE(results[1].has_value());
  EXPECT_FALSE(results[1]->face_detected());
  EXPECT_FALSE(results[1]->overall_passed());
  EXPECT_EQ(results[2]->timestamp(), ic::Timestamp{2});
}

TEST(BatchEvaluator, ParallelMatchesSequential) {
  const std::size_t n = 16;
  auto sequential = ia::evaluate_batch(*make_orchestrator(n, {3, 7}), make_frames(n));
  auto parallel = ia::evaluate_batch_parallel(*make_orchestrator(n, {3, 7}), make_frames(n), 4);
  ASSERT_EQ(parallel.size(), n);
  for (std::size_t i = 0; i < n; ++i) {
    ASSERT_TRUE(parallel[i].has_value()) << i;
    EXPECT_EQ(*parallel[i], *sequential[i]) << i;
  }
}

TEST(BatchEvaluator, PerceptionErrorsStayPerFrame) {
  auto orchestrator = make_orchestrator(2, {});
  std::vector<ic::Frame> frames;
  frames.push_back(it::uniform_gray_frame(128, 64, 64));
  frames.emplace_back();
  frames.push_back(it::uniform_gray_frame(128, 64, 64));

  auto results = ia::evaluate_batch_parallel(*orchestrator, frames, 2);
  ASSERT_EQ(results.size(), 3u);
  EXPECT_TRUE(results[0].has_value());
  ASSERT_FALSE(results[1].has_value());
  EXPECT_EQ(results[1].error(), ic::BoothError::InvalidFrame);
  EXPECT_TRUE(results[2].has_value());
}

TEST(BatchEvaluator, EmptyBatch) {
  auto orchestrator = make_orchestrator(0, {});
  EXPECT_TRUE(ia::evaluate_batch(*orchestrator, {}).empty());
  EXPECT_TRUE(ia::evaluate_batch_parallel(*orchestrator, {}).empty());
}
