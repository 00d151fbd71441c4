#pragma once

#include <idphoto/core/error.hpp>
#include <idphoto/core/frame.hpp>
#include <idphoto/core/perception.hpp>
#include <expected>

namespace idphoto::core {

/// Abstract perception provider: Frame -> PerceptionResult.
/// Implement detect(); optionally override validate_input and warmup.
///
/// detect() returns NoFaceDetected when the model ran and found nothing, and
/// BoothError::PerceptionUnavailable only when the model cannot run at all.
class IPerceptionAdapter {
 public:
  virtual ~IPerceptionAdapter() = default;

  [[nodiscard]] virtual std::expected<PerceptionResult, BoothError>
  detect(const Frame& input) = 0;

  /// Optional: validate frame format/dimensions before detect. Default: accept.
  [[nodiscard]] virtual std::expected<void, BoothError>
  validate_input(const Frame& /*input*/) const {
    return {};
  }

  /// Optional: warmup run (e.g. dummy inference). Call once after construction. Default: no-op.
  virtual void warmup() {}
};

}  // namespace idphoto::core
