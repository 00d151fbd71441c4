#pragma once

#include <idphoto/core/validator.hpp>
#include <string_view>

namespace idphoto::vision {

/// Plain background check outside the expanded face box (stddev and Canny
/// edge density).
class BackgroundValidator : public idphoto::core::IValidator {
 public:
  static constexpr std::string_view kName = "Background";

  [[nodiscard]] std::string_view name() const noexcept override { return kName; }

  [[nodiscard]] idphoto::core::ValidationOutcome evaluate(
      const idphoto::core::Frame& frame,
      const idphoto::core::PerceptionResult& perception,
      const idphoto::core::ValidatorConfig& config) const override;
};

}  // namespace idphoto::vision
