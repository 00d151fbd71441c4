#pragma once

#include <idphoto/core/validator.hpp>
#include <string_view>

namespace idphoto::vision {

/// Clustered specular highlights in the eye region (glasses glare).
class ReflectionValidator : public idphoto::core::IValidator {
 public:
  static constexpr std::string_view kName = "Reflection";
  /// Score of the pass reported when the eye region lies outside the frame.
  static constexpr float kUninspectedScore = 0.5f;

  [[nodiscard]] std::string_view name() const noexcept override { return kName; }

  [[nodiscard]] idphoto::core::ValidationOutcome evaluate(
      const idphoto::core::Frame& frame,
      const idphoto::core::PerceptionResult& perception,
      const idphoto::core::ValidatorConfig& config) const override;
};

}  // namespace idphoto::vision
