#include <idphoto/core/validation_report.hpp>
#include <algorithm>
#include <utility>

namespace idphoto::core {

ValidationReport::ValidationReport(Timestamp timestamp,
                                   std::vector<ValidationOutcome> outcomes,
                                   bool face_detected)
    : timestamp_(timestamp),
      outcomes_(std::move(outcomes)),
      face_detected_(face_detected) {
  const bool any_required = std::any_of(outcomes_.begin(), outcomes_.end(),
                                        [](const ValidationOutcome& o) { return o.required; });
  const bool all_required_pass =
      std::all_of(outcomes_.begin(), outcomes_.end(),
                  [](const ValidationOutcome& o) { return !o.required || o.passed; });
  overall_passed_ = any_required && all_required_pass;
}

float ValidationReport::mean_score() const noexcept {
  if (outcomes_.empty()) return 0.f;
  float sum = 0.f;
  for (const auto& o : outcomes_) sum += o.score;
  return sum / static_cast<float>(outcomes_.size());
}

const ValidationOutcome* ValidationReport::find(std::string_view validator_name) const noexcept {
  for (const auto& o : outcomes_) {
    if (o.validator_name == validator_name) return &o;
  }
  return nullptr;
}

std::vector<const ValidationOutcome*> ValidationReport::required_failures() const {
  std::vector<const ValidationOutcome*> out;
  for (const auto& o : outcomes_) {
    if (o.required && !o.passed) out.push_back(&o);
  }
  return out;
}

}  // namespace idphoto::core
