#pragma once

#include <idphoto/core/frame.hpp>
#include <idphoto/core/outcome.hpp>
#include <idphoto/core/perception.hpp>
#include <idphoto/core/validator_config.hpp>
#include <string_view>

namespace idphoto::core {

/// One passport-photo requirement as a stateless strategy.
///
/// evaluate() is a pure function of its arguments: no shared mutable state, no I/O.
/// Face-dependent validators (requires_face() == true) must return
/// FACE_NOT_DETECTED without numeric work when perception is NoFaceDetected.
class IValidator {
 public:
  virtual ~IValidator() = default;

  /// Unique registry key, e.g. "Brightness".
  [[nodiscard]] virtual std::string_view name() const noexcept = 0;

  [[nodiscard]] virtual ValidationOutcome evaluate(const Frame& frame,
                                                   const PerceptionResult& perception,
                                                   const ValidatorConfig& config) const = 0;

  /// True if the rule needs a detected face (box or landmarks). Default: true.
  [[nodiscard]] virtual bool requires_face() const noexcept { return true; }
};

}  // namespace idphoto::core
