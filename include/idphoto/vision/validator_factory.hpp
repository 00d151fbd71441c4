#pragma once

#include <idphoto/core/validator.hpp>
#include <memory>
#include <span>
#include <string_view>

namespace idphoto::vision {

/// Names of the built-in validators in default registry order:
/// Brightness, Sharpness, FacePosition, FacialExpression, EyeVisibility,
/// Reflection, Shadow, Headwear, Background.
[[nodiscard]] std::span<const std::string_view> builtin_validator_names() noexcept;

/// Built-in validator by name; nullptr if the name is unknown.
[[nodiscard]] std::unique_ptr<idphoto::core::IValidator> create_validator(std::string_view name);

}  // namespace idphoto::vision
