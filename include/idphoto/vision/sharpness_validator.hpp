#pragma once

#include <idphoto/core/validator.hpp>
#include <string_view>

namespace idphoto::vision {

/// Variance of the 3x3 Laplacian over the padded face box (whole frame
/// without a face). BLURRY below the configured minimum.
class SharpnessValidator : public idphoto::core::IValidator {
 public:
  static constexpr std::string_view kName = "Sharpness";

  [[nodiscard]] std::string_view name() const noexcept override { return kName; }

  [[nodiscard]] idphoto::core::ValidationOutcome evaluate(
      const idphoto::core::Frame& frame,
      const idphoto::core::PerceptionResult& perception,
      const idphoto::core::ValidatorConfig& config) const override;

  [[nodiscard]] bool requires_face() const noexcept override { return false; }
};

}  // namespace idphoto::vision
