#pragma once

#include <idphoto/core/validator.hpp>
#include <string_view>

namespace idphoto::vision {

/// Neutral expression score and inner-lip opening. MOUTH_OPEN is reported
/// before NON_NEUTRAL_EXPRESSION; a missing neutral score counts as 0.
class FacialExpressionValidator : public idphoto::core::IValidator {
 public:
  static constexpr std::string_view kName = "FacialExpression";

  [[nodiscard]] std::string_view name() const noexcept override { return kName; }

  [[nodiscard]] idphoto::core::ValidationOutcome evaluate(
      const idphoto::core::Frame& frame,
      const idphoto::core::PerceptionResult& perception,
      const idphoto::core::ValidatorConfig& config) const override;
};

}  // namespace idphoto::vision
