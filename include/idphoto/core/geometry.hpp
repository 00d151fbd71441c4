#pragma once

namespace idphoto::core {

/// Axis-aligned box in frame pixel coordinates (x, y = top-left corner).
struct BBox {
  float x{0.f};
  float y{0.f};
  float w{0.f};
  float h{0.f};

  [[nodiscard]] float center_x() const noexcept { return x + w * 0.5f; }
  [[nodiscard]] float center_y() const noexcept { return y + h * 0.5f; }
  [[nodiscard]] bool empty() const noexcept { return w <= 0.f || h <= 0.f; }

  bool operator==(const BBox&) const = default;
};

/// Facial landmark in frame pixel coordinates.
/// visibility is the model's confidence that the point is visible (not occluded), in [0,1].
struct Landmark {
  float x{0.f};
  float y{0.f};
  float visibility{1.f};

  bool operator==(const Landmark&) const = default;
};

/// Head orientation in degrees; 0/0/0 is a frontal face.
struct HeadPose {
  float yaw{0.f};
  float pitch{0.f};
  float roll{0.f};

  bool operator==(const HeadPose&) const = default;
};

}  // namespace idphoto::core
