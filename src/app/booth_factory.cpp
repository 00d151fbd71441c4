#include <idphoto/app/booth_factory.hpp>
#include <idphoto/vision/mock_perception_adapter.hpp>
#include <idphoto/vision/onnx_perception_adapter.hpp>
#include <idphoto/vision/validator_factory.hpp>
#include <algorithm>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

namespace idphoto::app {

namespace ic = idphoto::core;

namespace {

bool listed(const std::vector<std::string>& names, std::string_view name) {
  return std::find(names.begin(), names.end(), name) != names.end();
}

bool all_builtin(const std::vector<std::string>& names) {
  const auto builtin = vision::builtin_validator_names();
  return std::all_of(names.begin(), names.end(), [&](const std::string& n) {
    return std::find(builtin.begin(), builtin.end(), n) != builtin.end();
  });
}

}  // namespace

std::expected<ic::ValidatorRegistry, ic::BoothError> make_registry(const BoothConfig& config) {
  if (!all_builtin(config.advisory_validators) || !all_builtin(config.disabled_validators)) {
    return std::unexpected(ic::BoothError::UnknownValidator);
  }

  ic::ValidatorRegistry registry;
  for (std::string_view name : vision::builtin_validator_names()) {
    if (listed(config.disabled_validators, name)) continue;
    const bool required = !listed(config.advisory_validators, name);
    if (auto added = registry.add(vision::create_validator(name), required); !added) {
      return std::unexpected(added.error());
    }
  }
  return registry;
}

std::unique_ptr<ic::IPerceptionAdapter> make_perception_adapter(const BoothConfig& config) {
  if (config.backend_type == PerceptionBackendType::Onnx) {
    vision::OnnxPerceptionOptions options;
    options.landmark_model_path = config.landmark_model_path;
    options.expression_model_path = config.expression_model_path;
    options.layout = config.validators.landmark_layout;
    options.expression_labels = config.expression_labels;
    options.face_score_threshold = config.face_score_threshold;
    return std::make_unique<vision::OnnxPerceptionAdapter>(std::move(options));
  }
  return std::make_unique<vision::MockPerceptionAdapter>();
}

std::expected<std::unique_ptr<ic::ValidationOrchestrator>, ic::BoothError> make_orchestrator(
    const BoothConfig& config, std::unique_ptr<ic::IPerceptionAdapter> adapter) {
  if (auto valid = ic::validate_config(config.validators); !valid) {
    return std::unexpected(valid.error());
  }
  auto registry = make_registry(config);
  if (!registry) {
    return std::unexpected(registry.error());
  }
  return std::make_unique<ic::ValidationOrchestrator>(std::move(adapter), std::move(*registry),
                                                      config.validators);
}

}  // namespace idphoto::app
