#include <idphoto/core/error.hpp>

namespace idphoto::core {

std::string_view to_string(BoothError error) noexcept {
  switch (error) {
    case BoothError::None:
      return "None";
    case BoothError::InvalidFrame:
      return "InvalidFrame";
    case BoothError::LoadFailed:
      return "LoadFailed";
    case BoothError::InvalidConfig:
      return "InvalidConfig";
    case BoothError::DuplicateValidator:
      return "DuplicateValidator";
    case BoothError::UnknownValidator:
      return "UnknownValidator";
    case BoothError::ValidatorConfig:
      return "ValidatorConfig";
    case BoothError::PerceptionUnavailable:
      return "PerceptionUnavailable";
    case BoothError::Storage:
      return "Storage";
    case BoothError::SessionClosed:
      return "SessionClosed";
  }
  return "Unknown";
}

}  // namespace idphoto::core
