#pragma once

#include <idphoto/core/validator.hpp>
#include <string_view>

namespace idphoto::vision {

/// Inspects the band above the face box for caps and hats: low skin
/// coverage together with a dark or uniformly colored band.
class HeadwearValidator : public idphoto::core::IValidator {
 public:
  static constexpr std::string_view kName = "Headwear";

  [[nodiscard]] std::string_view name() const noexcept override { return kName; }

  [[nodiscard]] idphoto::core::ValidationOutcome evaluate(
      const idphoto::core::Frame& frame,
      const idphoto::core::PerceptionResult& perception,
      const idphoto::core::ValidatorConfig& config) const override;
};

}  // namespace idphoto::vision
