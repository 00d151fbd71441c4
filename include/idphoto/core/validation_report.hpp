#pragma once

#include <idphoto/core/frame.hpp>
#include <idphoto/core/outcome.hpp>
#include <cstddef>
#include <span>
#include <string_view>
#include <vector>

namespace idphoto::core {

/// Aggregated result of every active validator on one frame.
/// Immutable once produced; outcomes keep registry order.
class ValidationReport {
 public:
  ValidationReport() = default;

  /// overall_passed is derived here: true iff at least one outcome is required
  /// and every required outcome passed. Advisory outcomes never affect it.
  ValidationReport(Timestamp timestamp,
                   std::vector<ValidationOutcome> outcomes,
                   bool face_detected);

  [[nodiscard]] Timestamp timestamp() const noexcept { return timestamp_; }
  [[nodiscard]] bool overall_passed() const noexcept { return overall_passed_; }
  [[nodiscard]] bool face_detected() const noexcept { return face_detected_; }

  [[nodiscard]] std::span<const ValidationOutcome> outcomes() const noexcept {
    return outcomes_;
  }
  [[nodiscard]] std::size_t size() const noexcept { return outcomes_.size(); }

  /// Mean score over all outcomes, advisory included; 0 for an empty report.
  /// Progress indicator for the UI, never used for the pass decision.
  [[nodiscard]] float mean_score() const noexcept;

  /// Outcome of the named validator, or nullptr.
  [[nodiscard]] const ValidationOutcome* find(std::string_view validator_name) const noexcept;

  /// Failing outcomes of required validators, in report order.
  [[nodiscard]] std::vector<const ValidationOutcome*> required_failures() const;

  bool operator==(const ValidationReport&) const = default;

 private:
  Timestamp timestamp_{0};
  std::vector<ValidationOutcome> outcomes_;
  bool face_detected_{false};
  bool overall_passed_{false};
};

}  // namespace idphoto::core
