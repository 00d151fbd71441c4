#pragma once

#include <string_view>

namespace idphoto::core {

/// Booth error codes; used with std::expected for recoverable failures.
/// "No face found" is not an error: it is a PerceptionResult alternative.
enum class BoothError {
  None = 0,
  InvalidFrame,
  LoadFailed,
  InvalidConfig,
  DuplicateValidator,
  UnknownValidator,
  ValidatorConfig,
  PerceptionUnavailable,
  Storage,
  SessionClosed,
};

[[nodiscard]] std::string_view to_string(BoothError error) noexcept;

}  // namespace idphoto::core
