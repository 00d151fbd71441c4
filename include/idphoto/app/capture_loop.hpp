#pragma once

#include <idphoto/app/storage.hpp>
#include <idphoto/core/capture_state_machine.hpp>
#include <idphoto/core/error.hpp>
#include <idphoto/core/feedback.hpp>
#include <idphoto/core/frame.hpp>
#include <idphoto/core/orchestrator.hpp>
#include <idphoto/core/validation_report.hpp>
#include <cstdint>
#include <expected>
#include <functional>
#include <optional>
#include <vector>

namespace idphoto::app {

struct CaptureLoopOptions {
  /// Evaluate one frame in K (K >= 1); the others only advance the timeout clock.
  std::uint32_t evaluate_every_kth_frame{1};
  /// Extra persist attempts after the first failure.
  std::uint32_t storage_retry_count{2};
};

/// What happened to one camera frame.
struct LoopTick {
  std::uint64_t frame_index{0};
  bool evaluated{false};
  std::optional<idphoto::core::ValidationReport> report;
  /// Guidance for the report, most important first. Empty when not evaluated.
  std::vector<idphoto::core::GuidanceMessage> guidance;
  idphoto::core::CaptureDecision decision;
  /// Set when the frame was captured and persisted on this tick.
  std::optional<RecordId> record;
  /// Perception or storage failure on this tick.
  std::optional<idphoto::core::BoothError> error;
};

/// Invoked after every on_frame() with the tick result.
using TickCallback = std::function<void(const LoopTick&)>;

/// Single-threaded, cooperative booth loop: frame -> report -> guidance ->
/// state machine -> capture. Owns the session state; borrows the orchestrator
/// and storage, which must outlive the loop.
class CaptureLoop {
 public:
  CaptureLoop(idphoto::core::ValidationOrchestrator& orchestrator,
              IStorageCollaborator& storage,
              idphoto::core::FeedbackTranslator translator = {},
              idphoto::core::StabilityConfig stability = {},
              CaptureLoopOptions options = {});

  /// Process the next camera frame. While a capture is pending, frames are
  /// neither evaluated nor timed; retry or abandon the capture first.
  LoopTick on_frame(const idphoto::core::Frame& frame);

  /// Persist the capture whose storage failed earlier. SessionClosed, without
  /// touching storage, if none is pending or the session has already ended.
  [[nodiscard]] std::expected<RecordId, idphoto::core::BoothError> retry_pending_capture();

  /// Drop the pending capture; the session ends in Error (Storage).
  void abandon_pending_capture();

  [[nodiscard]] bool has_pending_capture() const noexcept { return pending_.has_value(); }

  /// User abort: clears the session and any pending capture immediately.
  void cancel();

  void set_tick_callback(TickCallback callback) { tick_callback_ = std::move(callback); }

  [[nodiscard]] const idphoto::core::CaptureStateMachine& state_machine() const noexcept {
    return machine_;
  }
  [[nodiscard]] std::uint64_t frames_seen() const noexcept { return frames_seen_; }

 private:
  struct PendingCapture {
    idphoto::core::Frame frame;
    idphoto::core::ValidationReport report;
  };

  std::expected<RecordId, idphoto::core::BoothError> persist_pending();
  LoopTick finish(LoopTick tick);

  idphoto::core::ValidationOrchestrator& orchestrator_;
  IStorageCollaborator& storage_;
  idphoto::core::FeedbackTranslator translator_;
  idphoto::core::CaptureStateMachine machine_;
  CaptureLoopOptions options_;
  std::optional<PendingCapture> pending_;
  std::uint64_t frames_seen_{0};
  TickCallback tick_callback_;
};

}  // namespace idphoto::app
