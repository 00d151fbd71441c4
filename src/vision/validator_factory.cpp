#include <idphoto/vision/validator_factory.hpp>
#include <idphoto/vision/background_validator.hpp>
#include <idphoto/vision/brightness_validator.hpp>
#include <idphoto/vision/eye_visibility_validator.hpp>
#include <idphoto/vision/face_position_validator.hpp>
#include <idphoto/vision/facial_expression_validator.hpp>
#include <idphoto/vision/headwear_validator.hpp>
#include <idphoto/vision/reflection_validator.hpp>
#include <idphoto/vision/shadow_validator.hpp>
#include <idphoto/vision/sharpness_validator.hpp>
#include <array>

namespace idphoto::vision {

namespace {

constexpr std::array<std::string_view, 9> kBuiltinNames{
    BrightnessValidator::kName,       SharpnessValidator::kName,
    FacePositionValidator::kName,     FacialExpressionValidator::kName,
    EyeVisibilityValidator::kName,    ReflectionValidator::kName,
    ShadowValidator::kName,           HeadwearValidator::kName,
    BackgroundValidator::kName,
};

}  // namespace

std::span<const std::string_view> builtin_validator_names() noexcept { return kBuiltinNames; }

std::unique_ptr<idphoto::core::IValidator> create_validator(std::string_view name) {
  if (name == BrightnessValidator::kName) return std::make_unique<BrightnessValidator>();
  if (name == SharpnessValidator::kName) return std::make_unique<SharpnessValidator>();
  if (name == FacePositionValidator::kName) return std::make_unique<FacePositionValidator>();
  if (name == FacialExpressionValidator::kName) {
    return std::make_unique<FacialExpressionValidator>();
  }
  if (name == EyeVisibilityValidator::kName) return std::make_unique<EyeVisibilityValidator>();
  if (name == ReflectionValidator::kName) return std::make_unique<ReflectionValidator>();
  if (name == ShadowValidator::kName) return std::make_unique<ShadowValidator>();
  if (name == HeadwearValidator::kName) return std::make_unique<HeadwearValidator>();
  if (name == BackgroundValidator::kName) return std::make_unique<BackgroundValidator>();
  return nullptr;
}

}  // namespace idphoto::vision
