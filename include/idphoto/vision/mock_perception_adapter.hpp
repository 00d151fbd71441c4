#pragma once

#include <idphoto/core/landmark_layout.hpp>
#include <idphoto/core/perception_adapter.hpp>
#include <cstddef>
#include <cstdint>
#include <deque>
#include <string>

namespace idphoto::vision {

/// Scripted adapter for tests and the demo: returns queued results in order,
/// then the default result. Can simulate an unavailable model.
class MockPerceptionAdapter : public idphoto::core::IPerceptionAdapter {
 public:
  MockPerceptionAdapter() = default;
  explicit MockPerceptionAdapter(idphoto::core::PerceptionResult result);

  /// Result returned whenever the queue is empty. Initially NoFaceDetected.
  void set_result(idphoto::core::PerceptionResult result);

  /// Result returned by the next detect() call (FIFO).
  void enqueue(idphoto::core::PerceptionResult result);

  /// While set, detect() fails with PerceptionUnavailable.
  void set_unavailable(bool unavailable) noexcept { unavailable_ = unavailable; }

  [[nodiscard]] std::size_t call_count() const noexcept { return calls_; }

  [[nodiscard]] std::expected<idphoto::core::PerceptionResult, idphoto::core::BoothError>
  detect(const idphoto::core::Frame& input) override;

  [[nodiscard]] std::expected<void, idphoto::core::BoothError>
  validate_input(const idphoto::core::Frame& input) const override;

 private:
  idphoto::core::PerceptionResult default_result_{idphoto::core::NoFaceDetected{}};
  std::deque<idphoto::core::PerceptionResult> queued_;
  bool unavailable_{false};
  std::size_t calls_{0};
};

/// Frontal, neutral, centered face for a frame of the given size: the box is
/// 45% of the frame height, eyes open, lips closed, head pose 0/0/0 and
/// expression {neutral_label: 0.95}. Landmarks the layout does not name sit
/// at the box center.
[[nodiscard]] idphoto::core::FaceObservation frontal_face_observation(
    std::uint32_t frame_width,
    std::uint32_t frame_height,
    const idphoto::core::LandmarkLayout& layout = idphoto::core::LandmarkLayout::ibug68(),
    const std::string& neutral_label = "neutral");

}  // namespace idphoto::vision
