#pragma once

#include <idphoto/core/error.hpp>
#include <idphoto/core/frame.hpp>
#include <idphoto/core/perception.hpp>
#include <idphoto/core/perception_adapter.hpp>
#include <idphoto/core/validation_report.hpp>
#include <idphoto/core/validator_config.hpp>
#include <idphoto/core/validator_registry.hpp>
#include <cstddef>
#include <expected>
#include <functional>
#include <memory>
#include <string_view>

namespace idphoto::core {

/// Callback for per-validator timing: (validator_index, validator_name, duration_ms).
using ValidatorTimingCallback =
    std::function<void(std::size_t index, std::string_view name, double duration_ms)>;

/// Runs perception once per frame, then every registered validator.
///
/// Never short-circuits: the report holds one outcome per active validator.
/// An exception escaping a validator is turned into a failed outcome with
/// VALIDATOR_INTERNAL_ERROR so the other validators still report.
/// Without a face, validators that require one are not called and fail with
/// FACE_NOT_DETECTED.
class ValidationOrchestrator {
 public:
  /// \param adapter Perception provider; owned.
  /// \param registry Active validators; add/remove through registry() later.
  /// \param config Thresholds, immutable for the orchestrator's lifetime.
  ValidationOrchestrator(std::unique_ptr<IPerceptionAdapter> adapter,
                         ValidatorRegistry registry,
                         ValidatorConfig config);

  /// Perception + evaluate(). Fails with PerceptionUnavailable when the adapter
  /// cannot run, InvalidFrame for an empty or malformed frame. NoFaceDetected
  /// is not an error: the report then carries FACE_NOT_DETECTED outcomes.
  /// If timing_cb is non-null, it is called after each validator.
  [[nodiscard]] std::expected<ValidationReport, BoothError> run(
      const Frame& frame,
      ValidatorTimingCallback* timing_cb = nullptr);

  /// Aggregation step only. Deterministic for identical (frame, perception, config);
  /// const and safe to call concurrently.
  [[nodiscard]] ValidationReport evaluate(const Frame& frame,
                                          const PerceptionResult& perception,
                                          ValidatorTimingCallback* timing_cb = nullptr) const;

  /// Direct access to the perception step (used by batch evaluation).
  [[nodiscard]] std::expected<PerceptionResult, BoothError> perceive(const Frame& frame);

  [[nodiscard]] ValidatorRegistry& registry() noexcept { return registry_; }
  [[nodiscard]] const ValidatorRegistry& registry() const noexcept { return registry_; }
  [[nodiscard]] const ValidatorConfig& config() const noexcept { return config_; }

 private:
  std::unique_ptr<IPerceptionAdapter> adapter_;
  ValidatorRegistry registry_;
  const ValidatorConfig config_;
};

}  // namespace idphoto::core
