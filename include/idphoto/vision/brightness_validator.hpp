#pragma once

#include <idphoto/core/validator.hpp>
#include <string_view>

namespace idphoto::vision {

/// Grayscale mean and stddev over the face box, or the whole frame when no
/// face was detected. Reports the violated bound: TOO_DARK, TOO_BRIGHT,
/// LOW_CONTRAST, HIGH_CONTRAST. measured = mean luminance.
class BrightnessValidator : public idphoto::core::IValidator {
 public:
  static constexpr std::string_view kName = "Brightness";

  [[nodiscard]] std::string_view name() const noexcept override { return kName; }

  [[nodiscard]] idphoto::core::ValidationOutcome evaluate(
      const idphoto::core::Frame& frame,
      const idphoto::core::PerceptionResult& perception,
      const idphoto::core::ValidatorConfig& config) const override;

  [[nodiscard]] bool requires_face() const noexcept override { return false; }
};

}  // namespace idphoto::vision
