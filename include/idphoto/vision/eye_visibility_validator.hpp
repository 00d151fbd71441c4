#pragma once

#include <idphoto/core/validator.hpp>
#include <string_view>

namespace idphoto::vision {

/// Both eyes visible (mean landmark visibility per eye) and open (eye
/// aspect ratio = lid distance / corner distance).
class EyeVisibilityValidator : public idphoto::core::IValidator {
 public:
  static constexpr std::string_view kName = "EyeVisibility";

  [[nodiscard]] std::string_view name() const noexcept override { return kName; }

  [[nodiscard]] idphoto::core::ValidationOutcome evaluate(
      const idphoto::core::Frame& frame,
      const idphoto::core::PerceptionResult& perception,
      const idphoto::core::ValidatorConfig& config) const override;
};

}  // namespace idphoto::vision
