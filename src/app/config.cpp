#include <idphoto/app/config.hpp>
#include <idphoto/core/outcome.hpp>
#include <charconv>
#include <cmath>
#include <fstream>
#include <functional>
#include <set>
#include <string_view>
#include <system_error>
#include <utility>

namespace idphoto::app {

namespace ic = idphoto::core;

namespace {

void trim(std::string& s) {
  const auto start = s.find_first_not_of(" \t\r\n");
  if (start == std::string::npos) {
    s.clear();
    return;
  }
  const auto end = s.find_last_not_of(" \t\r\n");
  s = s.substr(start, end == std::string::npos ? std::string::npos : end - start + 1);
}

bool parse_line(std::string_view line, std::string& key, std::string& value) {
  const auto pos = line.find('=');
  if (pos == std::string_view::npos) return false;
  key.assign(line.substr(0, pos));
  value.assign(line.substr(pos + 1));
  trim(key);
  trim(value);
  return !key.empty();
}

/// Comma-separated list; items trimmed, empty items dropped.
std::vector<std::string> split_list(const std::string& value) {
  std::vector<std::string> items;
  std::size_t begin = 0;
  while (begin <= value.size()) {
    const auto comma = value.find(',', begin);
    std::string item = value.substr(begin, comma == std::string::npos ? std::string::npos
                                                                       : comma - begin);
    trim(item);
    if (!item.empty()) items.push_back(std::move(item));
    if (comma == std::string::npos) break;
    begin = comma + 1;
  }
  return items;
}

template <typename T>
bool parse_number(std::string_view s, T& out) {
  const char* end = s.data() + s.size();
  const auto [ptr, ec] = std::from_chars(s.data(), end, out);
  return ec == std::errc{} && ptr == end;
}

/// Assigns one parsed value into the config; false if the value is malformed.
using Assign = std::function<bool(BoothConfig&, const std::string&)>;

struct ThresholdField {
  std::string_view key;
  Assign assign;
};

template <typename Ref>
ThresholdField float_field(std::string_view key, Ref ref) {
  return {key, [ref](BoothConfig& c, const std::string& v) {
            float f{};
            if (!parse_number(v, f) || !std::isfinite(f)) return false;
            ref(c) = f;
            return true;
          }};
}

template <typename Ref>
ThresholdField level_field(std::string_view key, Ref ref) {
  return {key, [ref](BoothConfig& c, const std::string& v) {
            int n{};
            if (!parse_number(v, n) || n < 0 || n > 255) return false;
            ref(c) = static_cast<std::uint8_t>(n);
            return true;
          }};
}

template <typename T, typename Ref>
ThresholdField integer_field(std::string_view key, Ref ref) {
  return {key, [ref](BoothConfig& c, const std::string& v) {
            T n{};
            if (!parse_number(v, n)) return false;
            ref(c) = n;
            return true;
          }};
}

template <typename Ref>
ThresholdField millis_field(std::string_view key, Ref ref) {
  return {key, [ref](BoothConfig& c, const std::string& v) {
            long long ms{};
            if (!parse_number(v, ms) || ms < 0) return false;
            ref(c) = ic::Timestamp{ms};
            return true;
          }};
}

const std::vector<ThresholdField>& threshold_fields() {
  static const std::vector<ThresholdField> fields{
      float_field("brightness.mean_min",
                  [](BoothConfig& c) -> float& { return c.validators.brightness.mean_min; }),
      float_field("brightness.mean_max",
                  [](BoothConfig& c) -> float& { return c.validators.brightness.mean_max; }),
      float_field("brightness.stddev_min",
                  [](BoothConfig& c) -> float& { return c.validators.brightness.stddev_min; }),
      float_field("brightness.stddev_max",
                  [](BoothConfig& c) -> float& { return c.validators.brightness.stddev_max; }),
      float_field("sharpness.min_laplacian_variance",
                  [](BoothConfig& c) -> float& {
                    return c.validators.sharpness.min_laplacian_variance;
                  }),
      float_field("sharpness.roi_padding",
                  [](BoothConfig& c) -> float& { return c.validators.sharpness.roi_padding; }),
      float_field("face_position.center_tolerance",
                  [](BoothConfig& c) -> float& {
                    return c.validators.face_position.center_tolerance;
                  }),
      float_field("face_position.size_ratio_min",
                  [](BoothConfig& c) -> float& {
                    return c.validators.face_position.size_ratio_min;
                  }),
      float_field("face_position.size_ratio_max",
                  [](BoothConfig& c) -> float& {
                    return c.validators.face_position.size_ratio_max;
                  }),
      float_field("face_position.max_yaw_deg",
                  [](BoothConfig& c) -> float& { return c.validators.face_position.max_yaw_deg; }),
      float_field("face_position.max_pitch_deg",
                  [](BoothConfig& c) -> float& {
                    return c.validators.face_position.max_pitch_deg;
                  }),
      float_field("face_position.max_roll_deg",
                  [](BoothConfig& c) -> float& {
                    return c.validators.face_position.max_roll_deg;
                  }),
      {"expression.neutral_label",
       [](BoothConfig& c, const std::string& v) {
         if (v.empty()) return false;
         c.validators.expression.neutral_label = v;
         return true;
       }},
      float_field("expression.neutral_min",
                  [](BoothConfig& c) -> float& { return c.validators.expression.neutral_min; }),
      float_field("expression.mouth_open_max_px",
                  [](BoothConfig& c) -> float& {
                    return c.validators.expression.mouth_open_max_px;
                  }),
      float_field("eyes.visibility_min",
                  [](BoothConfig& c) -> float& { return c.validators.eyes.visibility_min; }),
      float_field("eyes.eye_aspect_ratio_min",
                  [](BoothConfig& c) -> float& { return c.validators.eyes.eye_aspect_ratio_min; }),
      level_field("reflection.bright_level",
                  [](BoothConfig& c) -> std::uint8_t& {
                    return c.validators.reflection.bright_level;
                  }),
      integer_field<int>("reflection.min_cluster_area",
                         [](BoothConfig& c) -> int& {
                           return c.validators.reflection.min_cluster_area;
                         }),
      float_field("reflection.max_area_ratio",
                  [](BoothConfig& c) -> float& { return c.validators.reflection.max_area_ratio; }),
      float_field("reflection.eye_region_padding",
                  [](BoothConfig& c) -> float& {
                    return c.validators.reflection.eye_region_padding;
                  }),
      float_field("shadow.max_asymmetry",
                  [](BoothConfig& c) -> float& { return c.validators.shadow.max_asymmetry; }),
      float_field("headwear.band_height_ratio",
                  [](BoothConfig& c) -> float& { return c.validators.headwear.band_height_ratio; }),
      float_field("headwear.min_skin_ratio",
                  [](BoothConfig& c) -> float& { return c.validators.headwear.min_skin_ratio; }),
      float_field("headwear.max_dark_ratio",
                  [](BoothConfig& c) -> float& { return c.validators.headwear.max_dark_ratio; }),
      level_field("headwear.dark_level",
                  [](BoothConfig& c) -> std::uint8_t& { return c.validators.headwear.dark_level; }),
      float_field("headwear.uniform_stddev",
                  [](BoothConfig& c) -> float& { return c.validators.headwear.uniform_stddev; }),
      float_field("background.max_stddev",
                  [](BoothConfig& c) -> float& { return c.validators.background.max_stddev; }),
      float_field("background.max_edge_density",
                  [](BoothConfig& c) -> float& {
                    return c.validators.background.max_edge_density;
                  }),
      integer_field<std::uint32_t>("stability.required_passes",
                                   [](BoothConfig& c) -> std::uint32_t& {
                                     return c.stability.required_consecutive_passes;
                                   }),
      millis_field("stability.window_ms",
                   [](BoothConfig& c) -> ic::Timestamp& { return c.stability.window; }),
      millis_field("stability.session_timeout_ms",
                   [](BoothConfig& c) -> ic::Timestamp& { return c.stability.session_timeout; }),
      integer_field<std::size_t>("stability.history_capacity",
                                 [](BoothConfig& c) -> std::size_t& {
                                   return c.stability.history_capacity;
                                 }),
  };
  return fields;
}

const ThresholdField* find_field(std::string_view key) {
  for (const auto& f : threshold_fields()) {
    if (f.key == key) return &f;
  }
  return nullptr;
}

bool stability_ok(const ic::StabilityConfig& s) {
  return s.required_consecutive_passes >= 1 && s.window.count() > 0 &&
         s.session_timeout.count() > 0 && s.history_capacity >= 1;
}

}  // namespace

BoothConfig default_config() {
  BoothConfig c;
  c.backend_type = PerceptionBackendType::Mock;
  c.expression_labels = {"neutral", "happiness", "surprise", "sadness",
                         "anger",   "disgust",   "fear",     "contempt"};
  c.face_score_threshold = 0.5f;
  c.evaluate_every_kth_frame = 1;
  c.storage_retry_count = 2;
  c.advisory_validators = {"Headwear", "Background"};
  return c;
}

std::vector<std::string> threshold_keys() {
  std::vector<std::string> keys;
  keys.reserve(threshold_fields().size());
  for (const auto& f : threshold_fields()) keys.emplace_back(f.key);
  return keys;
}

std::expected<BoothConfig, ic::BoothError> parse_config(std::istream& in,
                                                        bool require_all_keys) {
  BoothConfig c = default_config();
  std::set<std::string, std::less<>> seen;

  std::string line;
  std::string key;
  std::string value;
  while (std::getline(in, line)) {
    trim(line);
    if (line.empty() || line[0] == '#') continue;
    if (!parse_line(line, key, value)) continue;

    if (const auto* field = find_field(key)) {
      if (!field->assign(c, value)) return std::unexpected(ic::BoothError::ValidatorConfig);
      seen.insert(key);
    } else if (key == "perception_backend") {
      if (value == "onnx") c.backend_type = PerceptionBackendType::Onnx;
      else if (value == "mock") c.backend_type = PerceptionBackendType::Mock;
      else return std::unexpected(ic::BoothError::InvalidConfig);
    } else if (key == "landmark_model_path") {
      c.landmark_model_path = value;
    } else if (key == "expression_model_path") {
      c.expression_model_path = value;
    } else if (key == "landmark_layout") {
      auto layout = ic::LandmarkLayout::by_name(value);
      if (!layout) return std::unexpected(ic::BoothError::ValidatorConfig);
      c.validators.landmark_layout = std::move(*layout);
    } else if (key == "face_score_threshold") {
      float f{};
      if (!parse_number(value, f) || f < 0.f || f > 1.f) {
        return std::unexpected(ic::BoothError::InvalidConfig);
      }
      c.face_score_threshold = f;
    } else if (key == "expression_labels") {
      c.expression_labels = split_list(value);
      if (c.expression_labels.empty()) return std::unexpected(ic::BoothError::InvalidConfig);
    } else if (key == "capture.every_kth_frame") {
      if (!parse_number(value, c.evaluate_every_kth_frame) || c.evaluate_every_kth_frame == 0) {
        return std::unexpected(ic::BoothError::InvalidConfig);
      }
    } else if (key == "capture.storage_retries") {
      if (!parse_number(value, c.storage_retry_count)) {
        return std::unexpected(ic::BoothError::InvalidConfig);
      }
    } else if (key == "validators.advisory") {
      c.advisory_validators = split_list(value);
    } else if (key == "validators.disabled") {
      c.disabled_validators = split_list(value);
    } else if (key == "feedback.priority") {
      std::vector<ic::OutcomeCode> priority;
      for (const auto& name : split_list(value)) {
        auto code = ic::outcome_code_from_string(name);
        if (!code) return std::unexpected(ic::BoothError::InvalidConfig);
        priority.push_back(*code);
      }
      c.feedback.priority = std::move(priority);
    }
  }

  if (require_all_keys) {
    for (const auto& f : threshold_fields()) {
      if (!seen.contains(f.key)) return std::unexpected(ic::BoothError::ValidatorConfig);
    }
  }
  if (!stability_ok(c.stability)) return std::unexpected(ic::BoothError::ValidatorConfig);
  if (auto valid = ic::validate_config(c.validators); !valid) {
    return std::unexpected(valid.error());
  }
  if (c.backend_type == PerceptionBackendType::Onnx && c.landmark_model_path.empty()) {
    return std::unexpected(ic::BoothError::InvalidConfig);
  }
  return c;
}

std::expected<BoothConfig, ic::BoothError> load_config(const std::string& path,
                                                       bool require_all_keys) {
  std::ifstream f(path);
  if (!f) return std::unexpected(ic::BoothError::LoadFailed);
  return parse_config(f, require_all_keys);
}

KeyValueConfigSource::KeyValueConfigSource(std::string path, bool require_all_keys)
    : path_(std::move(path)), require_all_keys_(require_all_keys) {}

std::expected<BoothConfig, ic::BoothError> KeyValueConfigSource::load_thresholds() {
  return load_config(path_, require_all_keys_);
}

}  // namespace idphoto::app
