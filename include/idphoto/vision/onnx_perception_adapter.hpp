#pragma once

#include <idphoto/core/landmark_layout.hpp>
#include <idphoto/core/perception_adapter.hpp>
#include <memory>
#include <string>
#include <vector>

namespace idphoto::vision {

struct OnnxPerceptionOptions {
  /// Landmark model (.onnx). Required.
  std::string landmark_model_path;
  /// Expression classifier (.onnx). Optional; without it expression_scores stay empty.
  std::string expression_model_path;
  idphoto::core::LandmarkLayout layout{idphoto::core::LandmarkLayout::ibug68()};
  /// Class labels of the expression model, in output order (FER+ order by default).
  std::vector<std::string> expression_labels{"neutral", "happiness", "surprise", "sadness",
                                             "anger",   "disgust",   "fear",     "contempt"};
  /// Face score (after sigmoid) below which the frame counts as NoFaceDetected.
  float face_score_threshold{0.5f};
};

/// ONNX Runtime perception: landmark model plus optional expression model.
///
/// Landmark model contract: one float image input, RGB in [0,1], [1,3,H,W] or
/// [1,H,W,3]. First output holds landmarks in model-input pixels as [1,N,2|3|4]
/// or [1,N*3]; a 4th component is a visibility logit. An optional second output
/// is a face-presence logit.
///
/// Expression model contract: grayscale face crop [1,1,h,w] with raw 0-255
/// values; one output of logits, one per configured label (softmaxed here).
///
/// The bounding box is the landmark extents padded by 10%; head pose comes from
/// estimate_head_pose(). The constructor throws (std::runtime_error,
/// Ort::Exception) when a model cannot be loaded or has an unexpected shape.
class OnnxPerceptionAdapter : public idphoto::core::IPerceptionAdapter {
 public:
  explicit OnnxPerceptionAdapter(OnnxPerceptionOptions options);

  ~OnnxPerceptionAdapter() override;

  OnnxPerceptionAdapter(const OnnxPerceptionAdapter&) = delete;
  OnnxPerceptionAdapter& operator=(const OnnxPerceptionAdapter&) = delete;

  [[nodiscard]] std::expected<idphoto::core::PerceptionResult, idphoto::core::BoothError>
  detect(const idphoto::core::Frame& input) override;

  /// Accepts any non-empty 8-bit image frame; the adapter resizes internally.
  [[nodiscard]] std::expected<void, idphoto::core::BoothError>
  validate_input(const idphoto::core::Frame& input) const override;

  void warmup() override;

 private:
  struct Impl;
  std::unique_ptr<Impl> impl_;
};

}  // namespace idphoto::vision
