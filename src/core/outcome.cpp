#include <idphoto/core/outcome.hpp>
#include <algorithm>
#include <array>
#include <utility>

namespace idphoto::core {

namespace {

constexpr std::array<std::pair<OutcomeCode, std::string_view>, 22> kCodeNames{{
    {OutcomeCode::Ok, "OK"},
    {OutcomeCode::FaceNotDetected, "FACE_NOT_DETECTED"},
    {OutcomeCode::LandmarkCountMismatch, "LANDMARK_COUNT_MISMATCH"},
    {OutcomeCode::ImageUnreadable, "IMAGE_UNREADABLE"},
    {OutcomeCode::TooDark, "TOO_DARK"},
    {OutcomeCode::TooBright, "TOO_BRIGHT"},
    {OutcomeCode::LowContrast, "LOW_CONTRAST"},
    {OutcomeCode::HighContrast, "HIGH_CONTRAST"},
    {OutcomeCode::Blurry, "BLURRY"},
    {OutcomeCode::FaceOffCenter, "FACE_OFF_CENTER"},
    {OutcomeCode::FaceTooSmall, "FACE_TOO_SMALL"},
    {OutcomeCode::FaceTooLarge, "FACE_TOO_LARGE"},
    {OutcomeCode::HeadTilted, "HEAD_TILTED"},
    {OutcomeCode::NonNeutralExpression, "NON_NEUTRAL_EXPRESSION"},
    {OutcomeCode::MouthOpen, "MOUTH_OPEN"},
    {OutcomeCode::EyesObstructed, "EYES_OBSTRUCTED"},
    {OutcomeCode::EyesClosed, "EYES_CLOSED"},
    {OutcomeCode::ReflectionDetected, "REFLECTION_DETECTED"},
    {OutcomeCode::ShadowDetected, "SHADOW_DETECTED"},
    {OutcomeCode::HeadwearDetected, "HEADWEAR_DETECTED"},
    {OutcomeCode::BackgroundNotUniform, "BACKGROUND_NOT_UNIFORM"},
    {OutcomeCode::ValidatorInternalError, "VALIDATOR_INTERNAL_ERROR"},
}};

}  // namespace

std::string_view to_string(OutcomeCode code) noexcept {
  for (const auto& [c, name] : kCodeNames) {
    if (c == code) return name;
  }
  return "UNKNOWN";
}

std::string_view to_string(Severity severity) noexcept {
  switch (severity) {
    case Severity::Info:
      return "INFO";
    case Severity::Warning:
      return "WARNING";
    case Severity::Error:
      return "ERROR";
    case Severity::Critical:
      return "CRITICAL";
  }
  return "UNKNOWN";
}

std::optional<OutcomeCode> outcome_code_from_string(std::string_view name) noexcept {
  const auto it = std::find_if(kCodeNames.begin(), kCodeNames.end(),
                               [name](const auto& entry) { return entry.second == name; });
  if (it == kCodeNames.end()) return std::nullopt;
  return it->first;
}

Severity default_severity(OutcomeCode code) noexcept {
  switch (code) {
    case OutcomeCode::Ok:
      return Severity::Info;
    case OutcomeCode::FaceNotDetected:
    case OutcomeCode::ImageUnreadable:
      return Severity::Critical;
    case OutcomeCode::HeadwearDetected:
    case OutcomeCode::BackgroundNotUniform:
    case OutcomeCode::LowContrast:
    case OutcomeCode::HighContrast:
      return Severity::Warning;
    default:
      return Severity::Error;
  }
}

ValidationOutcome pass_outcome(std::string_view validator_name,
                               float score,
                               float measured) {
  ValidationOutcome o;
  o.validator_name = std::string(validator_name);
  o.passed = true;
  o.score = std::clamp(score, 0.f, 1.f);
  o.code = OutcomeCode::Ok;
  o.severity = Severity::Info;
  o.measured = measured;
  return o;
}

ValidationOutcome fail_outcome(std::string_view validator_name,
                               OutcomeCode code,
                               float score,
                               float measured) {
  ValidationOutcome o;
  o.validator_name = std::string(validator_name);
  o.passed = false;
  o.score = std::clamp(score, 0.f, 1.f);
  o.code = code;
  o.severity = default_severity(code);
  o.measured = measured;
  return o;
}

}  // namespace idphoto::core
