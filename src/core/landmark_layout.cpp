#include <idphoto/core/landmark_layout.hpp>

namespace idphoto::core {

LandmarkLayout LandmarkLayout::ibug68() {
  LandmarkLayout l;
  l.name = "ibug68";
  l.landmark_count = 68;
  l.left_eye = {36, 39, 37, 41};
  l.right_eye = {45, 42, 44, 46};
  l.inner_lip_top = 62;
  l.inner_lip_bottom = 66;
  l.mouth_left = 48;
  l.mouth_right = 54;
  l.nose_tip = 30;
  l.chin = 8;
  return l;
}

LandmarkLayout LandmarkLayout::mediapipe468() {
  LandmarkLayout l;
  l.name = "mediapipe468";
  l.landmark_count = 468;
  l.left_eye = {33, 133, 159, 145};
  l.right_eye = {263, 362, 386, 374};
  l.inner_lip_top = 13;
  l.inner_lip_bottom = 14;
  l.mouth_left = 61;
  l.mouth_right = 291;
  l.nose_tip = 1;
  l.chin = 152;
  return l;
}

std::optional<LandmarkLayout> LandmarkLayout::by_name(std::string_view name) {
  if (name == "ibug68") return ibug68();
  if (name == "mediapipe468") return mediapipe468();
  return std::nullopt;
}

}  // namespace idphoto::core
