#pragma once

#include <idphoto/core/error.hpp>
#include <idphoto/core/frame.hpp>
#include <idphoto/core/validation_report.hpp>
#include <cstddef>
#include <cstdint>
#include <deque>
#include <expected>
#include <optional>
#include <string_view>

namespace idphoto::core {

enum class CaptureState : std::uint8_t {
  WaitingForFace,
  Evaluating,
  StablePass,
  Captured,
  Timeout,
  Error,
};

[[nodiscard]] std::string_view to_string(CaptureState state) noexcept;

/// Captured, Timeout and Error end a session; only cancel() leaves them.
[[nodiscard]] constexpr bool is_terminal(CaptureState state) noexcept {
  return state == CaptureState::Captured || state == CaptureState::Timeout ||
         state == CaptureState::Error;
}

/// Stability and timeout rules for one booth interaction.
struct StabilityConfig {
  /// N: consecutive passing reports required before capture.
  std::uint32_t required_consecutive_passes{5};
  /// T: the N passes must all fall within this rolling window.
  Timestamp window{Timestamp{2000}};
  /// Session budget measured from the first report.
  Timestamp session_timeout{Timestamp{30000}};
  /// Recent reports kept in the session history.
  std::size_t history_capacity{30};
};

/// State of the current interaction. Only CaptureStateMachine mutates it.
struct CaptureSession {
  CaptureState state{CaptureState::WaitingForFace};
  std::optional<Timestamp> started_at;
  std::uint32_t consecutive_pass_count{0};
  /// Timestamps of the passing reports that make up the current streak.
  std::deque<Timestamp> pass_streak;
  /// Most recent reports, oldest first, bounded by history_capacity.
  std::deque<ValidationReport> history;
  std::optional<BoothError> error;
};

/// Result of feeding one report (or a clock tick) to the state machine.
struct CaptureDecision {
  CaptureState state{CaptureState::WaitingForFace};
  /// Set exactly once per session: on the tick that reaches StablePass.
  bool capture_now{false};
  bool transitioned{false};
};

/// WaitingForFace -> Evaluating -> StablePass -> Captured, with Timeout and
/// Error reachable from every non-terminal state.
///
/// Time is taken from report timestamps; there is no timer thread.
class CaptureStateMachine {
 public:
  explicit CaptureStateMachine(StabilityConfig config = {});

  /// Pin the session start; otherwise the first report's timestamp is used.
  void start(Timestamp now);

  /// Feed one report. Reports arriving in a terminal state are ignored.
  CaptureDecision on_report(const ValidationReport& report);

  /// Elapsed-time check for frames that were not evaluated.
  CaptureDecision check_timeout(Timestamp now);

  /// StablePass -> Captured once the frame has been persisted.
  /// SessionClosed if not in StablePass.
  [[nodiscard]] std::expected<void, BoothError> confirm_captured();

  /// Any non-terminal state -> Error.
  CaptureDecision fail(BoothError error);

  /// User abort: back to WaitingForFace with history, streak and start time cleared.
  void cancel();

  [[nodiscard]] CaptureState state() const noexcept { return session_.state; }
  [[nodiscard]] const CaptureSession& session() const noexcept { return session_; }
  [[nodiscard]] const StabilityConfig& config() const noexcept { return config_; }

 private:
  bool timed_out(Timestamp now) const noexcept;
  void remember(const ValidationReport& report);
  void reset_streak() noexcept;
  CaptureDecision transition(CaptureState next, bool capture_now = false);

  StabilityConfig config_;
  CaptureSession session_;
};

}  // namespace idphoto::core
