#ifdef IDPHOTO_HAS_TBB

#include <idphoto/app/batch_evaluator.hpp>
#include <idphoto/app/batch_evaluator_tbb.hpp>
#include <idphoto/core/orchestrator.hpp>
#include <idphoto/vision/mock_perception_adapter.hpp>
#include "support/fake_validators.hpp"
#include "support/synthetic_face.hpp"
#include <memory>
#include <vector>
#include <gtest/gtest.h>

namespace ia = idphoto::app;
namespace ic = idphoto::core;
namespace iv = idphoto::vision;
namespace it = idphoto::test;

namespace {

std::unique_ptr<ic::ValidationOrchestrator> make_orchestrator(ic::PerceptionResult perception) {
  ic::ValidatorRegistry registry;
  (void)registry.add(std::make_unique<it::FixedValidator>("Brightness", true,
                                                          ic::OutcomeCode::TooDark, false));
  (void)registry.add(std::make_unique<it::FixedValidator>("EyeVisibility", false,
                                                          ic::OutcomeCode::EyesClosed));
  return std::make_unique<ic::ValidationOrchestrator>(
      std::make_unique<iv::MockPerceptionAdapter>(std::move(perception)), std::move(registry),
      ic::ValidatorConfig{});
}

}  // namespace

TEST(BatchEvaluatorTbb, OneReportPerFrameInOrder) {
  auto orchestrator = make_orchestrator(it::portrait_face(64, 64));
  std::vector<ic::Frame> frames;
  for (int i = 0; i < 32; ++i) {
    frames.push_back(it::uniform_gray_frame(128, 64, 64, ic::Timestamp{i}));
  }

  auto results = ia::evaluate_batch_tbb(*orchestrator, frames);
  ASSERT_EQ(results.size(), frames.size());
  for (std::size_t i = 0; i < results.size(); ++i) {
    ASSERT_TRUE(results[i].has_value());
    EXPECT_EQ(results[i]->timestamp(), frames[i].timestamp());
    EXPECT_EQ(results[i]->outcomes()[1].code, ic::OutcomeCode::EyesClosed);
  }
}

TEST(BatchEvaluatorTbb, MatchesSequentialWithoutFace) {
  std::vector<ic::Frame> frames{it::uniform_gray_frame(20, 64, 64), ic::Frame{}};
  auto tbb_results = ia::evaluate_batch_tbb(*make_orchestrator(ic::NoFaceDetected{}), frames);
  auto seq_results = ia::evaluate_batch(*make_orchestrator(ic::NoFaceDetected{}), frames);
  ASSERT_EQ(tbb_results.size(), 2u);
  EXPECT_EQ(tbb_results[0], seq_results[0]);
  ASSERT_FALSE(tbb_results[1].has_value());
  EXPECT_EQ(tbb_results[1].error(), ic::BoothError::InvalidFrame);
}

#endif  // IDPHOTO_HAS_TBB
