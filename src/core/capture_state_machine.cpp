#include <idphoto/core/capture_state_machine.hpp>

namespace idphoto::core {

std::string_view to_string(CaptureState state) noexcept {
  switch (state) {
    case CaptureState::WaitingForFace:
      return "WAITING_FOR_FACE";
    case CaptureState::Evaluating:
      return "EVALUATING";
    case CaptureState::StablePass:
      return "STABLE_PASS";
    case CaptureState::Captured:
      return "CAPTURED";
    case CaptureState::Timeout:
      return "TIMEOUT";
    case CaptureState::Error:
      return "ERROR";
  }
  return "UNKNOWN";
}

CaptureStateMachine::CaptureStateMachine(StabilityConfig config)
    : config_(config) {}

void CaptureStateMachine::start(Timestamp now) {
  session_.started_at = now;
}

bool CaptureStateMachine::timed_out(Timestamp now) const noexcept {
  return session_.started_at.has_value() &&
         now - *session_.started_at > config_.session_timeout;
}

void CaptureStateMachine::remember(const ValidationReport& report) {
  if (config_.history_capacity == 0) return;
  session_.history.push_back(report);
  while (session_.history.size() > config_.history_capacity) {
    session_.history.pop_front();
  }
}

void CaptureStateMachine::reset_streak() noexcept {
  session_.pass_streak.clear();
  session_.consecutive_pass_count = 0;
}

CaptureDecision CaptureStateMachine::transition(CaptureState next, bool capture_now) {
  session_.state = next;
  return CaptureDecision{next, capture_now, true};
}

CaptureDecision CaptureStateMachine::on_report(const ValidationReport& report) {
  if (is_terminal(session_.state)) {
    return CaptureDecision{session_.state, false, false};
  }

  const Timestamp now = report.timestamp();
  if (!session_.started_at) {
    session_.started_at = now;
  }
  remember(report);

  if (timed_out(now)) {
    reset_streak();
    return transition(CaptureState::Timeout);
  }

  bool transitioned = false;
  switch (session_.state) {
    case CaptureState::WaitingForFace:
      if (!report.face_detected()) {
        return CaptureDecision{session_.state, false, false};
      }
      session_.state = CaptureState::Evaluating;
      transitioned = true;
      break;
    case CaptureState::Evaluating:
      break;
    case CaptureState::StablePass:
    default:
      // Signal already emitted; wait for confirm_captured().
      return CaptureDecision{session_.state, false, false};
  }

  if (!report.overall_passed()) {
    reset_streak();
    return CaptureDecision{session_.state, false, transitioned};
  }

  // Drop streak members that fell out of the rolling window.
  auto& streak = session_.pass_streak;
  while (!streak.empty() && now - streak.front() > config_.window) {
    streak.pop_front();
  }
  streak.push_back(now);
  session_.consecutive_pass_count = static_cast<std::uint32_t>(streak.size());

  if (session_.consecutive_pass_count >= config_.required_consecutive_passes) {
    return transition(CaptureState::StablePass, true);
  }
  return CaptureDecision{session_.state, false, transitioned};
}

CaptureDecision CaptureStateMachine::check_timeout(Timestamp now) {
  if (is_terminal(session_.state)) {
    return CaptureDecision{session_.state, false, false};
  }
  if (!session_.started_at) {
    session_.started_at = now;
  }
  if (timed_out(now)) {
    reset_streak();
    return transition(CaptureState::Timeout);
  }
  return CaptureDecision{session_.state, false, false};
}

std::expected<void, BoothError> CaptureStateMachine::confirm_captured() {
  if (session_.state != CaptureState::StablePass) {
    return std::unexpected(BoothError::SessionClosed);
  }
  session_.state = CaptureState::Captured;
  return {};
}

CaptureDecision CaptureStateMachine::fail(BoothError error) {
  if (is_terminal(session_.state)) {
    return CaptureDecision{session_.state, false, false};
  }
  session_.error = error;
  reset_streak();
  return transition(CaptureState::Error);
}

void CaptureStateMachine::cancel() {
  session_ = CaptureSession{};
}

}  // namespace idphoto::core
