#pragma once

#include <cstdint>
#include <optional>
#include <string>
#include <string_view>

namespace idphoto::core {

/// Diagnostic identifier carried by every ValidationOutcome.
enum class OutcomeCode : std::uint8_t {
  Ok,
  FaceNotDetected,
  LandmarkCountMismatch,
  ImageUnreadable,
  TooDark,
  TooBright,
  LowContrast,
  HighContrast,
  Blurry,
  FaceOffCenter,
  FaceTooSmall,
  FaceTooLarge,
  HeadTilted,
  NonNeutralExpression,
  MouthOpen,
  EyesObstructed,
  EyesClosed,
  ReflectionDetected,
  ShadowDetected,
  HeadwearDetected,
  BackgroundNotUniform,
  ValidatorInternalError,
};

/// How serious a failing outcome is; passing outcomes are Info.
enum class Severity : std::uint8_t {
  Info,
  Warning,
  Error,
  Critical,
};

/// Wire name, e.g. "TOO_DARK".
[[nodiscard]] std::string_view to_string(OutcomeCode code) noexcept;
[[nodiscard]] std::string_view to_string(Severity severity) noexcept;

/// Inverse of to_string(OutcomeCode); nullopt for unknown names.
[[nodiscard]] std::optional<OutcomeCode> outcome_code_from_string(std::string_view name) noexcept;

/// Severity a failing outcome with this code is reported at.
[[nodiscard]] Severity default_severity(OutcomeCode code) noexcept;

/// Result of one validator on one frame.
struct ValidationOutcome {
  std::string validator_name;
  bool passed{false};
  /// Normalized margin relative to the threshold, in [0,1]; 1 = comfortably passing.
  float score{0.f};
  OutcomeCode code{OutcomeCode::Ok};
  Severity severity{Severity::Info};
  /// False for advisory validators; set by the orchestrator from the registry.
  bool required{true};
  /// Raw measurement behind the score (e.g. mean luminance), for diagnostics.
  float measured{0.f};

  bool operator==(const ValidationOutcome&) const = default;
};

/// Passing outcome with the given score.
[[nodiscard]] ValidationOutcome pass_outcome(std::string_view validator_name,
                                             float score,
                                             float measured = 0.f);

/// Failing outcome; severity follows default_severity(code).
[[nodiscard]] ValidationOutcome fail_outcome(std::string_view validator_name,
                                             OutcomeCode code,
                                             float score,
                                             float measured = 0.f);

}  // namespace idphoto::core
