#pragma once

#include <idphoto/core/validator.hpp>
#include <string_view>

namespace idphoto::vision {

/// Face size and centering relative to the frame, plus head pose limits.
/// Checked in order: size, centering, pose.
class FacePositionValidator : public idphoto::core::IValidator {
 public:
  static constexpr std::string_view kName = "FacePosition";

  [[nodiscard]] std::string_view name() const noexcept override { return kName; }

  [[nodiscard]] idphoto::core::ValidationOutcome evaluate(
      const idphoto::core::Frame& frame,
      const idphoto::core::PerceptionResult& perception,
      const idphoto::core::ValidatorConfig& config) const override;
};

}  // namespace idphoto::vision
