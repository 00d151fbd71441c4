#include <idphoto/core/feedback.hpp>
#include <algorithm>
#include <cctype>
#include <string>
#include <utility>

namespace idphoto::core {

std::vector<OutcomeCode> FeedbackConfig::default_priority() {
  // Without a face nothing else is actionable; then framing, then pose and
  // expression, then lighting and image quality.
  return {
      OutcomeCode::FaceNotDetected,
      OutcomeCode::ImageUnreadable,
      OutcomeCode::LandmarkCountMismatch,
      OutcomeCode::FaceTooSmall,
      OutcomeCode::FaceTooLarge,
      OutcomeCode::FaceOffCenter,
      OutcomeCode::HeadTilted,
      OutcomeCode::EyesClosed,
      OutcomeCode::EyesObstructed,
      OutcomeCode::MouthOpen,
      OutcomeCode::NonNeutralExpression,
      OutcomeCode::TooDark,
      OutcomeCode::TooBright,
      OutcomeCode::ShadowDetected,
      OutcomeCode::ReflectionDetected,
      OutcomeCode::LowContrast,
      OutcomeCode::HighContrast,
      OutcomeCode::Blurry,
      OutcomeCode::HeadwearDetected,
      OutcomeCode::BackgroundNotUniform,
      OutcomeCode::ValidatorInternalError,
  };
}

FeedbackTranslator::FeedbackTranslator(FeedbackConfig config)
    : config_(std::move(config)) {}

std::size_t FeedbackTranslator::priority_of(OutcomeCode code) const noexcept {
  const auto it = std::find(config_.priority.begin(), config_.priority.end(), code);
  return static_cast<std::size_t>(it - config_.priority.begin());
}

std::vector<GuidanceMessage> FeedbackTranslator::translate(const ValidationReport& report) const {
  std::vector<GuidanceMessage> messages;
  for (const ValidationOutcome* o : report.required_failures()) {
    const bool seen = std::any_of(messages.begin(), messages.end(),
                                  [o](const GuidanceMessage& m) { return m.code == o->code; });
    if (seen) continue;

    GuidanceMessage m;
    m.code = o->code;
    m.validator_name = o->validator_name;
    m.key = guidance_key(o->code);
    m.text = std::string(guidance_text(o->code));
    m.severity = o->severity;
    m.priority = priority_of(o->code);
    messages.push_back(std::move(m));
  }

  // stable_sort keeps report order as the final tie-break.
  std::stable_sort(messages.begin(), messages.end(),
                   [](const GuidanceMessage& a, const GuidanceMessage& b) {
                     if (a.priority != b.priority) return a.priority < b.priority;
                     return a.severity > b.severity;
                   });
  return messages;
}

std::string guidance_key(OutcomeCode code) {
  std::string key = "guidance.";
  for (char c : to_string(code)) {
    key.push_back(static_cast<char>(std::tolower(static_cast<unsigned char>(c))));
  }
  return key;
}

std::string_view guidance_text(OutcomeCode code) noexcept {
  switch (code) {
    case OutcomeCode::Ok:
      return "";
    case OutcomeCode::FaceNotDetected:
      return "No face detected. Look straight into the camera.";
    case OutcomeCode::LandmarkCountMismatch:
      return "Face could not be analysed. Please stay still.";
    case OutcomeCode::ImageUnreadable:
      return "Camera image could not be read. Please wait.";
    case OutcomeCode::TooDark:
      return "The photo is too dark. Move into the light.";
    case OutcomeCode::TooBright:
      return "The photo is too bright. Step back from the light.";
    case OutcomeCode::LowContrast:
      return "The lighting is too flat.";
    case OutcomeCode::HighContrast:
      return "The lighting is too harsh.";
    case OutcomeCode::Blurry:
      return "The photo is blurry. Hold still.";
    case OutcomeCode::FaceOffCenter:
      return "Center your face in the frame.";
    case OutcomeCode::FaceTooSmall:
      return "Move closer to the camera.";
    case OutcomeCode::FaceTooLarge:
      return "Move back from the camera.";
    case OutcomeCode::HeadTilted:
      return "Keep your head straight and face the camera.";
    case OutcomeCode::NonNeutralExpression:
      return "Keep a neutral expression.";
    case OutcomeCode::MouthOpen:
      return "Close your mouth.";
    case OutcomeCode::EyesObstructed:
      return "Make sure both eyes are clearly visible.";
    case OutcomeCode::EyesClosed:
      return "Open your eyes.";
    case OutcomeCode::ReflectionDetected:
      return "Reflections on your glasses. Tilt them slightly or remove them.";
    case OutcomeCode::ShadowDetected:
      return "There is a shadow on your face.";
    case OutcomeCode::HeadwearDetected:
      return "Remove your hat or cap.";
    case OutcomeCode::BackgroundNotUniform:
      return "The background must be plain.";
    case OutcomeCode::ValidatorInternalError:
      return "A check could not be completed. Please stay still.";
  }
  return "";
}

}  // namespace idphoto::core
