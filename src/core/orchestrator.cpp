#include <idphoto/core/orchestrator.hpp>
#include <chrono>
#include <exception>
#include <vector>

namespace idphoto::core {

ValidationOrchestrator::ValidationOrchestrator(std::unique_ptr<IPerceptionAdapter> adapter,
                                               ValidatorRegistry registry,
                                               ValidatorConfig config)
    : adapter_(std::move(adapter)),
      registry_(std::move(registry)),
      config_(std::move(config)) {}

std::expected<PerceptionResult, BoothError> ValidationOrchestrator::perceive(
    const Frame& frame) {
  if (!frame.is_well_formed()) {
    return std::unexpected(BoothError::InvalidFrame);
  }
  if (!adapter_) {
    return std::unexpected(BoothError::PerceptionUnavailable);
  }
  auto valid = adapter_->validate_input(frame);
  if (!valid) {
    return std::unexpected(valid.error());
  }
  return adapter_->detect(frame);
}

std::expected<ValidationReport, BoothError> ValidationOrchestrator::run(
    const Frame& frame,
    ValidatorTimingCallback* timing_cb) {
  auto perception = perceive(frame);
  if (!perception) {
    return std::unexpected(perception.error());
  }
  return evaluate(frame, *perception, timing_cb);
}

ValidationReport ValidationOrchestrator::evaluate(const Frame& frame,
                                                  const PerceptionResult& perception,
                                                  ValidatorTimingCallback* timing_cb) const {
  const auto entries = registry_.active_validators();
  std::vector<ValidationOutcome> outcomes;
  outcomes.reserve(entries.size());
  const FaceObservation* face = face_of(perception);

  for (std::size_t i = 0; i < entries.size(); ++i) {
    const IValidator& validator = *entries[i].validator;
    const auto start = std::chrono::steady_clock::now();

    ValidationOutcome outcome;
    if (validator.requires_face() && !face) {
      outcome = fail_outcome(validator.name(), OutcomeCode::FaceNotDetected, 0.f);
    } else {
      try {
        outcome = validator.evaluate(frame, perception, config_);
      } catch (const std::exception&) {
        outcome = fail_outcome(validator.name(), OutcomeCode::ValidatorInternalError, 0.f);
      } catch (...) {
        outcome = fail_outcome(validator.name(), OutcomeCode::ValidatorInternalError, 0.f);
      }
    }
    // The registry key wins over whatever the validator wrote.
    outcome.validator_name = std::string(validator.name());
    outcome.required = entries[i].required;

    if (timing_cb) {
      const auto end = std::chrono::steady_clock::now();
      const double ms = 1e-6 * static_cast<double>(
          std::chrono::duration_cast<std::chrono::nanoseconds>(end - start).count());
      (*timing_cb)(i, validator.name(), ms);
    }
    outcomes.push_back(std::move(outcome));
  }

  return ValidationReport(frame.timestamp(), std::move(outcomes), face != nullptr);
}

}  // namespace idphoto::core
