#pragma once

#include <idphoto/core/outcome.hpp>
#include <idphoto/core/validation_report.hpp>
#include <cstddef>
#include <string>
#include <string_view>
#include <vector>

namespace idphoto::core {

/// User-facing instruction derived from a failing required outcome.
struct GuidanceMessage {
  OutcomeCode code{OutcomeCode::Ok};
  std::string validator_name;
  /// Stable identifier for UI translation tables, e.g. "guidance.too_dark".
  std::string key;
  /// Default English instruction.
  std::string text;
  Severity severity{Severity::Info};
  /// Rank in the configured priority table; lower surfaces first.
  std::size_t priority{0};

  bool operator==(const GuidanceMessage&) const = default;
};

/// Priority table: codes earlier in the list surface first. Codes not listed
/// rank after all listed ones.
struct FeedbackConfig {
  std::vector<OutcomeCode> priority{default_priority()};

  [[nodiscard]] static std::vector<OutcomeCode> default_priority();
};

/// Maps a report to an ordered guidance list. Pure; holds only its config.
class FeedbackTranslator {
 public:
  FeedbackTranslator() = default;
  explicit FeedbackTranslator(FeedbackConfig config);

  /// One message per distinct failing code among required outcomes, ordered by
  /// priority rank, then severity (most severe first), then report order.
  [[nodiscard]] std::vector<GuidanceMessage> translate(const ValidationReport& report) const;

  [[nodiscard]] std::size_t priority_of(OutcomeCode code) const noexcept;

  [[nodiscard]] const FeedbackConfig& config() const noexcept { return config_; }

 private:
  FeedbackConfig config_;
};

/// "guidance.<lowercase code>".
[[nodiscard]] std::string guidance_key(OutcomeCode code);

/// Default English instruction for a failure code.
[[nodiscard]] std::string_view guidance_text(OutcomeCode code) noexcept;

}  // namespace idphoto::core
