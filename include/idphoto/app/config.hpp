#pragma once

#include <idphoto/core/capture_state_machine.hpp>
#include <idphoto/core/error.hpp>
#include <idphoto/core/feedback.hpp>
#include <idphoto/core/validator_config.hpp>
#include <cstdint>
#include <expected>
#include <istream>
#include <string>
#include <vector>

namespace idphoto::app {

/// Perception backend type: mock (scripted) or onnx (real models).
enum class PerceptionBackendType {
  Mock,
  Onnx,
};

/// Everything a booth session is built from. Immutable once the session starts.
struct BoothConfig {
  PerceptionBackendType backend_type{PerceptionBackendType::Mock};
  std::string landmark_model_path;
  std::string expression_model_path;
  std::vector<std::string> expression_labels;
  float face_score_threshold{0.5f};

  idphoto::core::ValidatorConfig validators;
  idphoto::core::StabilityConfig stability;
  idphoto::core::FeedbackConfig feedback;

  /// Evaluate one frame in K; skipped frames only advance the timeout clock.
  std::uint32_t evaluate_every_kth_frame{1};
  /// Extra persist attempts after the first failure.
  std::uint32_t storage_retry_count{2};

  /// Registered but excluded from overall_passed and guidance.
  std::vector<std::string> advisory_validators;
  /// Built-in validators that are not registered at all.
  std::vector<std::string> disabled_validators;
};

/// Default config when no file is provided.
[[nodiscard]] BoothConfig default_config();

/// Parse key=value lines ('#' comments and blank lines ignored) over the
/// defaults. Unknown keys are ignored.
///
/// BoothError::ValidatorConfig if a threshold does not parse, the thresholds
/// are inconsistent, or (require_all_keys) a threshold or stability key is
/// missing. BoothError::InvalidConfig for other malformed values.
[[nodiscard]] std::expected<BoothConfig, idphoto::core::BoothError> parse_config(
    std::istream& in, bool require_all_keys = false);

/// parse_config() on a file. BoothError::LoadFailed if it cannot be opened.
[[nodiscard]] std::expected<BoothConfig, idphoto::core::BoothError> load_config(
    const std::string& path, bool require_all_keys = false);

/// Keys that strict loading requires (all thresholds and stability rules).
[[nodiscard]] std::vector<std::string> threshold_keys();

/// Source of the booth configuration.
class IConfigurationSource {
 public:
  virtual ~IConfigurationSource() = default;

  [[nodiscard]] virtual std::expected<BoothConfig, idphoto::core::BoothError>
  load_thresholds() = 0;
};

/// Configuration read from a key=value file.
class KeyValueConfigSource : public IConfigurationSource {
 public:
  explicit KeyValueConfigSource(std::string path, bool require_all_keys = false);

  [[nodiscard]] std::expected<BoothConfig, idphoto::core::BoothError>
  load_thresholds() override;

 private:
  std::string path_;
  bool require_all_keys_;
};

}  // namespace idphoto::app
