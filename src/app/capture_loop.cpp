#include <idphoto/app/capture_loop.hpp>
#include <utility>

namespace idphoto::app {

namespace ic = idphoto::core;

CaptureLoop::CaptureLoop(ic::ValidationOrchestrator& orchestrator,
                         IStorageCollaborator& storage,
                         ic::FeedbackTranslator translator,
                         ic::StabilityConfig stability,
                         CaptureLoopOptions options)
    : orchestrator_(orchestrator),
      storage_(storage),
      translator_(std::move(translator)),
      machine_(stability),
      options_(options) {
  if (options_.evaluate_every_kth_frame == 0) options_.evaluate_every_kth_frame = 1;
}

LoopTick CaptureLoop::on_frame(const ic::Frame& frame) {
  LoopTick tick;
  tick.frame_index = frames_seen_++;

  if (ic::is_terminal(machine_.state())) {
    tick.decision = ic::CaptureDecision{machine_.state(), false, false};
    return finish(std::move(tick));
  }

  // The capture signal has been sent; the session waits on the pending persist.
  if (pending_) {
    tick.decision = ic::CaptureDecision{machine_.state(), false, false};
    return finish(std::move(tick));
  }

  if (tick.frame_index % options_.evaluate_every_kth_frame != 0) {
    tick.decision = machine_.check_timeout(frame.timestamp());
    return finish(std::move(tick));
  }

  auto report = orchestrator_.run(frame);
  if (!report) {
    tick.error = report.error();
    if (report.error() == ic::BoothError::PerceptionUnavailable) {
      tick.decision = machine_.fail(report.error());
    } else {
      tick.decision = machine_.check_timeout(frame.timestamp());
    }
    return finish(std::move(tick));
  }

  tick.evaluated = true;
  tick.guidance = translator_.translate(*report);
  tick.decision = machine_.on_report(*report);
  tick.report = std::move(*report);

  if (tick.decision.capture_now) {
    pending_ = PendingCapture{frame, *tick.report};
    auto record = persist_pending();
    if (record) {
      tick.record = std::move(*record);
    } else {
      tick.error = record.error();
    }
    tick.decision.state = machine_.state();
  }
  return finish(std::move(tick));
}

std::expected<RecordId, ic::BoothError> CaptureLoop::persist_pending() {
  ic::BoothError last = ic::BoothError::Storage;
  const std::uint32_t attempts = options_.storage_retry_count + 1;
  for (std::uint32_t i = 0; i < attempts; ++i) {
    auto record = storage_.persist(pending_->frame, pending_->report);
    if (record) {
      pending_.reset();
      if (auto confirmed = machine_.confirm_captured(); !confirmed) {
        return std::unexpected(confirmed.error());
      }
      return record;
    }
    last = record.error();
  }
  return std::unexpected(last);
}

std::expected<RecordId, ic::BoothError> CaptureLoop::retry_pending_capture() {
  if (!pending_) {
    return std::unexpected(ic::BoothError::SessionClosed);
  }
  if (ic::is_terminal(machine_.state())) {
    pending_.reset();
    return std::unexpected(ic::BoothError::SessionClosed);
  }
  return persist_pending();
}

void CaptureLoop::abandon_pending_capture() {
  if (!pending_) return;
  pending_.reset();
  machine_.fail(ic::BoothError::Storage);
}

void CaptureLoop::cancel() {
  pending_.reset();
  machine_.cancel();
  frames_seen_ = 0;
}

LoopTick CaptureLoop::finish(LoopTick tick) {
  if (tick_callback_) tick_callback_(tick);
  return tick;
}

}  // namespace idphoto::app
