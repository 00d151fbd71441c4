#include <idphoto/app/capture_loop.hpp>
#include <idphoto/core/orchestrator.hpp>
#include <idphoto/vision/mock_perception_adapter.hpp>
#include "support/fake_storage.hpp"
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

class CaptureLoopTest : public ::testing::Test {
 protected:
  void SetUp() override {
    auto adapter = std::make_unique<iv::MockPerceptionAdapter>(it::portrait_face(64, 64));
    adapter_ = adapter.get();
    ic::ValidatorRegistry registry;
    ASSERT_TRUE(registry.add(std::make_unique<it::FixedValidator>(
        "Brightness", true, ic::OutcomeCode::TooDark, false)));
    ASSERT_TRUE(registry.add(std::make_unique<it::FixedValidator>("FacePosition", true)));
    orchestrator_ = std::make_unique<ic::ValidationOrchestrator>(
        std::move(adapter), std::move(registry), ic::ValidatorConfig{});
  }

  ia::CaptureLoop make_loop(ia::CaptureLoopOptions options = {}) {
    return ia::CaptureLoop(*orchestrator_, storage_, ic::FeedbackTranslator{},
                           ic::StabilityConfig{}, options);
  }

  static ic::Frame frame_at(long long ms) {
    return it::uniform_gray_frame(128, 64, 64, ic::Timestamp{ms});
  }

  iv::MockPerceptionAdapter* adapter_{nullptr};
  std::unique_ptr<ic::ValidationOrchestrator> orchestrator_;
  it::FakeStorage storage_;
};

}  // namespace

TEST_F(CaptureLoopTest, CapturesAfterFiveStablePasses) {
  auto loop = make_loop();
  for (int i = 0; i < 4; ++i) {
    auto tick = loop.on_frame(frame_at(i * 100));
    EXPECT_TRUE(tick.evaluated);
    EXPECT_FALSE(tick.record.has_value());
    EXPECT_TRUE(tick.guidance.empty());
  }
  auto tick = loop.on_frame(frame_at(400));
  ASSERT_TRUE(tick.record.has_value());
  EXPECT_EQ(tick.record->value, "record-400");
  EXPECT_EQ(tick.decision.state, ic::CaptureState::Captured);
  EXPECT_EQ(loop.state_machine().state(), ic::CaptureState::Captured);
  EXPECT_EQ(storage_.attempts(), 1u);
  ASSERT_EQ(storage_.stored().size(), 1u);
  EXPECT_TRUE(storage_.stored()[0].overall_passed());
}

TEST_F(CaptureLoopTest, FramesAfterCaptureAreIgnored) {
  auto loop = make_loop();
  for (int i = 0; i < 5; ++i) loop.on_frame(frame_at(i * 100));
  auto tick = loop.on_frame(frame_at(500));
  EXPECT_FALSE(tick.evaluated);
  EXPECT_EQ(tick.decision.state, ic::CaptureState::Captured);
  EXPECT_EQ(adapter_->call_count(), 5u);
}

TEST_F(CaptureLoopTest, EvaluatesEveryKthFrame) {
  auto loop = make_loop(ia::CaptureLoopOptions{3, 2});
  std::size_t evaluated = 0;
  for (int i = 0; i < 13; ++i) {
    if (loop.on_frame(frame_at(i * 33)).evaluated) ++evaluated;
  }
  EXPECT_EQ(evaluated, 5u);
  EXPECT_EQ(adapter_->call_count(), 5u);
  EXPECT_EQ(loop.state_machine().state(), ic::CaptureState::Captured);
}

TEST_F(CaptureLoopTest, SkippedFramesStillTimeOut) {
  adapter_->set_result(ic::NoFaceDetected{});
  auto loop = make_loop(ia::CaptureLoopOptions{2, 2});
  loop.on_frame(frame_at(0));
  auto tick = loop.on_frame(frame_at(30001));
  EXPECT_FALSE(tick.evaluated);
  EXPECT_EQ(tick.decision.state, ic::CaptureState::Timeout);
}

TEST_F(CaptureLoopTest, StorageIsRetried) {
  storage_.fail_next(2);
  auto loop = make_loop();
  ia::LoopTick tick;
  for (int i = 0; i < 5; ++i) tick = loop.on_frame(frame_at(i * 100));
  ASSERT_TRUE(tick.record.has_value());
  EXPECT_EQ(storage_.attempts(), 3u);
  EXPECT_FALSE(tick.error.has_value());
  EXPECT_EQ(loop.state_machine().state(), ic::CaptureState::Captured);
}

TEST_F(CaptureLoopTest, ExhaustedRetriesLeaveCapturePending) {
  storage_.fail_next(3);
  auto loop = make_loop();
  ia::LoopTick tick;
  for (int i = 0; i < 5; ++i) tick = loop.on_frame(frame_at(i * 100));
  EXPECT_FALSE(tick.record.has_value());
  ASSERT_TRUE(tick.error.has_value());
  EXPECT_EQ(*tick.error, ic::BoothError::Storage);
  EXPECT_EQ(tick.decision.state, ic::CaptureState::StablePass);
  EXPECT_TRUE(loop.has_pending_capture());

  auto retried = loop.retry_pending_capture();
  ASSERT_TRUE(retried.has_value());
  EXPECT_EQ(retried->value, "record-400");
  EXPECT_FALSE(loop.has_pending_capture());
  EXPECT_EQ(loop.state_machine().state(), ic::CaptureState::Captured);
}

TEST_F(CaptureLoopTest, LateFrameWhileCapturePendingDoesNotTimeOut) {
  storage_.fail_next(3);
  auto loop = make_loop();
  for (int i = 0; i < 5; ++i) loop.on_frame(frame_at(i * 100));
  ASSERT_TRUE(loop.has_pending_capture());

  auto tick = loop.on_frame(frame_at(31000));
  EXPECT_FALSE(tick.evaluated);
  EXPECT_FALSE(tick.decision.capture_now);
  EXPECT_EQ(tick.decision.state, ic::CaptureState::StablePass);
  EXPECT_EQ(adapter_->call_count(), 5u);
  EXPECT_TRUE(loop.has_pending_capture());

  auto retried = loop.retry_pending_capture();
  ASSERT_TRUE(retried.has_value());
  EXPECT_EQ(retried->value, "record-400");
  EXPECT_EQ(storage_.stored().size(), 1u);
  EXPECT_EQ(loop.state_machine().state(), ic::CaptureState::Captured);
}

TEST_F(CaptureLoopTest, PerceptionOutageWhileCapturePendingKeepsCapture) {
  storage_.fail_next(3);
  auto loop = make_loop();
  for (int i = 0; i < 5; ++i) loop.on_frame(frame_at(i * 100));
  ASSERT_TRUE(loop.has_pending_capture());

  adapter_->set_unavailable(true);
  auto tick = loop.on_frame(frame_at(500));
  EXPECT_FALSE(tick.evaluated);
  EXPECT_FALSE(tick.error.has_value());
  EXPECT_EQ(tick.decision.state, ic::CaptureState::StablePass);

  auto retried = loop.retry_pending_capture();
  ASSERT_TRUE(retried.has_value());
  EXPECT_EQ(storage_.stored().size(), 1u);
  EXPECT_EQ(loop.state_machine().state(), ic::CaptureState::Captured);
}

TEST_F(CaptureLoopTest, NothingIsStoredAfterAbandon) {
  storage_.fail_next(3);
  auto loop = make_loop();
  for (int i = 0; i < 5; ++i) loop.on_frame(frame_at(i * 100));
  loop.abandon_pending_capture();
  const auto attempts = storage_.attempts();

  auto retried = loop.retry_pending_capture();
  ASSERT_FALSE(retried.has_value());
  EXPECT_EQ(retried.error(), ic::BoothError::SessionClosed);
  EXPECT_EQ(storage_.attempts(), attempts);
  EXPECT_TRUE(storage_.stored().empty());
  EXPECT_EQ(loop.state_machine().state(), ic::CaptureState::Error);
}

TEST_F(CaptureLoopTest, AbandonedCaptureEndsInError) {
  storage_.fail_next(100);
  auto loop = make_loop(ia::CaptureLoopOptions{1, 0});
  for (int i = 0; i < 5; ++i) loop.on_frame(frame_at(i * 100));
  ASSERT_TRUE(loop.has_pending_capture());
  EXPECT_EQ(storage_.attempts(), 1u);

  loop.abandon_pending_capture();
  EXPECT_FALSE(loop.has_pending_capture());
  EXPECT_EQ(loop.state_machine().state(), ic::CaptureState::Error);
  EXPECT_EQ(loop.state_machine().session().error, ic::BoothError::Storage);
}

TEST_F(CaptureLoopTest, RetryWithoutPendingCapture) {
  auto loop = make_loop();
  auto r = loop.retry_pending_capture();
  ASSERT_FALSE(r.has_value());
  EXPECT_EQ(r.error(), ic::BoothError::SessionClosed);
}

TEST_F(CaptureLoopTest, PerceptionOutageEndsSession) {
  auto loop = make_loop();
  loop.on_frame(frame_at(0));
  adapter_->set_unavailable(true);
  auto tick = loop.on_frame(frame_at(100));
  ASSERT_TRUE(tick.error.has_value());
  EXPECT_EQ(*tick.error, ic::BoothError::PerceptionUnavailable);
  EXPECT_EQ(tick.decision.state, ic::CaptureState::Error);
}

TEST_F(CaptureLoopTest, MalformedFrameIsSkipped) {
  auto loop = make_loop();
  loop.on_frame(frame_at(0));
  auto tick = loop.on_frame(ic::Frame{});
  EXPECT_FALSE(tick.evaluated);
  ASSERT_TRUE(tick.error.has_value());
  EXPECT_EQ(*tick.error, ic::BoothError::InvalidFrame);
  EXPECT_EQ(tick.decision.state, ic::CaptureState::Evaluating);
}

TEST_F(CaptureLoopTest, FailingFramesProduceGuidance) {
  ic::ValidatorRegistry registry;
  ASSERT_TRUE(registry.add(std::make_unique<it::FixedValidator>(
      "Brightness", false, ic::OutcomeCode::TooDark, false)));
  ic::ValidationOrchestrator orchestrator(
      std::make_unique<iv::MockPerceptionAdapter>(it::portrait_face(64, 64)),
      std::move(registry), ic::ValidatorConfig{});
  ia::CaptureLoop loop(orchestrator, storage_);

  auto tick = loop.on_frame(frame_at(0));
  ASSERT_EQ(tick.guidance.size(), 1u);
  EXPECT_EQ(tick.guidance[0].code, ic::OutcomeCode::TooDark);
  EXPECT_EQ(loop.state_machine().session().consecutive_pass_count, 0u);
}

TEST_F(CaptureLoopTest, CancelStartsOver) {
  auto loop = make_loop();
  for (int i = 0; i < 3; ++i) loop.on_frame(frame_at(i * 100));
  loop.cancel();
  EXPECT_EQ(loop.frames_seen(), 0u);
  EXPECT_EQ(loop.state_machine().state(), ic::CaptureState::WaitingForFace);
  EXPECT_EQ(loop.state_machine().session().consecutive_pass_count, 0u);

  // A fresh session measures its timeout from the first report after cancel.
  for (int i = 0; i < 5; ++i) loop.on_frame(frame_at(40000 + i * 100));
  EXPECT_EQ(loop.state_machine().state(), ic::CaptureState::Captured);
}

TEST_F(CaptureLoopTest, TickCallbackSeesEveryFrame) {
  auto loop = make_loop();
  std::vector<std::uint64_t> indices;
  loop.set_tick_callback([&](const ia::LoopTick& tick) { indices.push_back(tick.frame_index); });
  for (int i = 0; i < 3; ++i) loop.on_frame(frame_at(i * 100));
  EXPECT_EQ(indices, (std::vector<std::uint64_t>{0, 1, 2}));
}
