#pragma once

#include <idphoto/app/config.hpp>
#include <idphoto/core/error.hpp>
#include <idphoto/core/orchestrator.hpp>
#include <idphoto/core/perception_adapter.hpp>
#include <idphoto/core/validator_registry.hpp>
#include <expected>
#include <memory>

namespace idphoto::app {

/// Built-in validators in default order, minus config.disabled_validators;
/// names in config.advisory_validators are registered as advisory.
/// UnknownValidator if either list names a validator that does not exist.
[[nodiscard]] std::expected<idphoto::core::ValidatorRegistry, idphoto::core::BoothError>
make_registry(const BoothConfig& config);

/// Perception adapter for config.backend_type. The mock starts with
/// NoFaceDetected. Throws if the ONNX models cannot be loaded.
[[nodiscard]] std::unique_ptr<idphoto::core::IPerceptionAdapter> make_perception_adapter(
    const BoothConfig& config);

/// Registry from make_registry() wired to the given adapter and thresholds.
[[nodiscard]] std::expected<std::unique_ptr<idphoto::core::ValidationOrchestrator>,
                            idphoto::core::BoothError>
make_orchestrator(const BoothConfig& config,
                  std::unique_ptr<idphoto::core::IPerceptionAdapter> adapter);

}  // namespace idphoto::app
