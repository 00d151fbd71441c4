#include <idphoto/vision/mock_perception_adapter.hpp>
#include <utility>

namespace idphoto::vision {

namespace ic = idphoto::core;

MockPerceptionAdapter::MockPerceptionAdapter(ic::PerceptionResult result)
    : default_result_(std::move(result)) {}

void MockPerceptionAdapter::set_result(ic::PerceptionResult result) {
  default_result_ = std::move(result);
}

void MockPerceptionAdapter::enqueue(ic::PerceptionResult result) {
  queued_.push_back(std::move(result));
}

std::expected<ic::PerceptionResult, ic::BoothError>
MockPerceptionAdapter::detect(const ic::Frame& input) {
  ++calls_;
  if (unavailable_) {
    return std::unexpected(ic::BoothError::PerceptionUnavailable);
  }
  if (auto valid = validate_input(input); !valid) {
    return std::unexpected(valid.error());
  }
  if (queued_.empty()) return default_result_;
  ic::PerceptionResult next = std::move(queued_.front());
  queued_.pop_front();
  return next;
}

std::expected<void, ic::BoothError>
MockPerceptionAdapter::validate_input(const ic::Frame& input) const {
  if (input.empty()) {
    return std::unexpected(ic::BoothError::InvalidFrame);
  }
  return {};
}

ic::FaceObservation frontal_face_observation(std::uint32_t frame_width,
                                             std::uint32_t frame_height,
                                             const ic::LandmarkLayout& layout,
                                             const std::string& neutral_label) {
  const float fw = static_cast<float>(frame_width);
  const float fh = static_cast<float>(frame_height);
  const float bh = 0.45f * fh;
  const float bw = 0.75f * bh;
  const float bx = (fw - bw) * 0.5f;
  const float by = (fh - bh) * 0.5f;
  const auto at = [&](float rx, float ry) { return ic::Landmark{bx + rx * bw, by + ry * bh, 1.f}; };

  ic::FaceObservation face;
  face.bounding_box = ic::BBox{bx, by, bw, bh};
  face.landmarks.assign(layout.landmark_count, at(0.5f, 0.5f));
  auto& lm = face.landmarks;
  if (!lm.empty()) {
    lm[layout.left_eye.outer] = at(0.2f, 0.38f);
    lm[layout.left_eye.inner] = at(0.4f, 0.38f);
    lm[layout.left_eye.upper_lid] = at(0.3f, 0.35f);
    lm[layout.left_eye.lower_lid] = at(0.3f, 0.41f);
    lm[layout.right_eye.outer] = at(0.8f, 0.38f);
    lm[layout.right_eye.inner] = at(0.6f, 0.38f);
    lm[layout.right_eye.upper_lid] = at(0.7f, 0.35f);
    lm[layout.right_eye.lower_lid] = at(0.7f, 0.41f);
    lm[layout.nose_tip] = at(0.5f, 0.58f);
    lm[layout.mouth_left] = at(0.32f, 0.75f);
    lm[layout.mouth_right] = at(0.68f, 0.75f);
    lm[layout.inner_lip_top] = ic::Landmark{bx + 0.5f * bw, by + 0.75f * bh - 1.f, 1.f};
    lm[layout.inner_lip_bottom] = ic::Landmark{bx + 0.5f * bw, by + 0.75f * bh + 1.f, 1.f};
    lm[layout.chin] = at(0.5f, 0.98f);
  }
  face.expression_scores[neutral_label] = 0.95f;
  face.head_pose = ic::HeadPose{0.f, 0.f, 0.f};
  face.detection_confidence = 0.99f;
  return face;
}

}  // namespace idphoto::vision
