#include <idphoto/vision/onnx_perception_adapter.hpp>
#include "frame_cv_utils.hpp"
#include <idphoto/vision/head_pose.hpp>
#include <onnxruntime_cxx_api.h>
#include <opencv2/core.hpp>
#include <opencv2/imgproc.hpp>
#include <algorithm>
#include <array>
#include <cmath>
#include <cstdint>
#include <limits>
#include <map>
#include <stdexcept>
#include <string>
#include <utility>
#include <vector>

namespace idphoto::vision {

namespace ic = idphoto::core;

namespace {

constexpr int64_t kNumChannels = 3;
constexpr float kBoxPadding = 0.1f;

Ort::MemoryInfo CpuMemoryInfo() {
  return Ort::MemoryInfo::CreateCpu(OrtArenaAllocator, OrtMemTypeDefault);
}

float sigmoid(float x) { return 1.f / (1.f + std::exp(-x)); }

void softmax(std::vector<float>& v) {
  if (v.empty()) return;
  const float max = *std::max_element(v.begin(), v.end());
  float sum = 0.f;
  for (float& x : v) {
    x = std::exp(x - max);
    sum += x;
  }
  for (float& x : v) x /= sum;
}

/// Copy HWC float buffer to NCHW.
void HwcToNchw(const float* hwc, int h, int w, float* nchw) {
  const std::size_t hw = static_cast<std::size_t>(h) * w;
  for (int y = 0; y < h; ++y) {
    for (int x = 0; x < w; ++x) {
      const std::size_t px = static_cast<std::size_t>(y) * w + x;
      nchw[0 * hw + px] = hwc[px * kNumChannels + 0];
      nchw[1 * hw + px] = hwc[px * kNumChannels + 1];
      nchw[2 * hw + px] = hwc[px * kNumChannels + 2];
    }
  }
}

/// Landmark extents padded by kBoxPadding, clipped to the frame.
ic::BBox landmark_box(const std::vector<ic::Landmark>& lm, float frame_w, float frame_h) {
  float x0 = std::numeric_limits<float>::max();
  float y0 = std::numeric_limits<float>::max();
  float x1 = std::numeric_limits<float>::lowest();
  float y1 = std::numeric_limits<float>::lowest();
  for (const auto& p : lm) {
    x0 = std::min(x0, p.x);
    y0 = std::min(y0, p.y);
    x1 = std::max(x1, p.x);
    y1 = std::max(y1, p.y);
  }
  const float pad_x = (x1 - x0) * kBoxPadding;
  const float pad_y = (y1 - y0) * kBoxPadding;
  x0 = std::clamp(x0 - pad_x, 0.f, frame_w);
  y0 = std::clamp(y0 - pad_y, 0.f, frame_h);
  x1 = std::clamp(x1 + pad_x, 0.f, frame_w);
  y1 = std::clamp(y1 + pad_y, 0.f, frame_h);
  return ic::BBox{x0, y0, x1 - x0, y1 - y0};
}

}  // namespace

struct OnnxPerceptionAdapter::Impl {
  Ort::Env env{ORT_LOGGING_LEVEL_WARNING, "idphoto"};
  Ort::SessionOptions session_options;
  OnnxPerceptionOptions options;

  Ort::Session landmark_session{nullptr};
  std::string landmark_input_name;
  std::vector<std::string> landmark_output_names;
  std::vector<const char*> landmark_output_ptrs;
  int input_height{0};
  int input_width{0};
  bool input_is_nchw{true};

  Ort::Session expression_session{nullptr};
  bool has_expression{false};
  std::string expression_input_name;
  std::string expression_output_name;
  int expression_height{0};
  int expression_width{0};

  std::vector<float> nchw_buffer;

  explicit Impl(OnnxPerceptionOptions opts) : options(std::move(opts)) {
    session_options.SetIntraOpNumThreads(1);
    session_options.SetGraphOptimizationLevel(GraphOptimizationLevel::ORT_ENABLE_EXTENDED);
  }

  void load_landmark_model() {
    landmark_session =
        Ort::Session(env, options.landmark_model_path.c_str(), session_options);
    Ort::AllocatorWithDefaultOptions allocator;
    if (landmark_session.GetInputCount() == 0) {
      throw std::runtime_error("OnnxPerceptionAdapter: landmark model has no inputs");
    }
    landmark_input_name = landmark_session.GetInputNameAllocated(0, allocator).get();

    const std::vector<int64_t> dims =
        landmark_session.GetInputTypeInfo(0).GetTensorTypeAndShapeInfo().GetShape();
    if (dims.size() != 4u) {
      throw std::runtime_error("OnnxPerceptionAdapter: expected 4D landmark model input");
    }
    if (dims[1] == kNumChannels) {
      input_is_nchw = true;
      input_height = static_cast<int>(dims[2]);
      input_width = static_cast<int>(dims[3]);
    } else if (dims[3] == kNumChannels) {
      input_is_nchw = false;
      input_height = static_cast<int>(dims[1]);
      input_width = static_cast<int>(dims[2]);
    } else {
      throw std::runtime_error(
          "OnnxPerceptionAdapter: expected landmark input [1,3,H,W] or [1,H,W,3]");
    }
    if (input_height <= 0 || input_width <= 0) {
      throw std::runtime_error("OnnxPerceptionAdapter: landmark input needs fixed H and W");
    }

    const std::size_t num_outputs = landmark_session.GetOutputCount();
    if (num_outputs == 0) {
      throw std::runtime_error("OnnxPerceptionAdapter: landmark model has no outputs");
    }
    // Landmarks, then the optional face score.
    for (std::size_t i = 0; i < std::min<std::size_t>(num_outputs, 2u); ++i) {
      landmark_output_names.emplace_back(
          landmark_session.GetOutputNameAllocated(i, allocator).get());
    }
    for (const auto& n : landmark_output_names) landmark_output_ptrs.push_back(n.c_str());
  }

  void load_expression_model() {
    expression_session =
        Ort::Session(env, options.expression_model_path.c_str(), session_options);
    Ort::AllocatorWithDefaultOptions allocator;
    if (expression_session.GetInputCount() == 0 || expression_session.GetOutputCount() == 0) {
      throw std::runtime_error("OnnxPerceptionAdapter: expression model needs an input and output");
    }
    expression_input_name = expression_session.GetInputNameAllocated(0, allocator).get();
    expression_output_name = expression_session.GetOutputNameAllocated(0, allocator).get();

    const std::vector<int64_t> dims =
        expression_session.GetInputTypeInfo(0).GetTensorTypeAndShapeInfo().GetShape();
    if (dims.size() != 4u || dims[1] != 1 || dims[2] <= 0 || dims[3] <= 0) {
      throw std::runtime_error("OnnxPerceptionAdapter: expected expression input [1,1,H,W]");
    }
    expression_height = static_cast<int>(dims[2]);
    expression_width = static_cast<int>(dims[3]);

    const std::vector<int64_t> out =
        expression_session.GetOutputTypeInfo(0).GetTensorTypeAndShapeInfo().GetShape();
    if (out.empty() || out.back() != static_cast<int64_t>(options.expression_labels.size())) {
      throw std::runtime_error(
          "OnnxPerceptionAdapter: expression output size differs from the label count");
    }
    has_expression = true;
  }

  /// Landmarks in frame pixels and the face score (1 when the model has no score output).
  /// Throws Ort::Exception on inference failure.
  std::pair<std::vector<ic::Landmark>, float> run_landmarks(const cv::Mat& bgr) {
    cv::Mat resized;
    cv::resize(bgr, resized, cv::Size(input_width, input_height), 0, 0, cv::INTER_LINEAR);
    cv::Mat rgb;
    cv::cvtColor(resized, rgb, cv::COLOR_BGR2RGB);
    cv::Mat hwc;
    rgb.convertTo(hwc, CV_32FC3, 1.0 / 255.0);

    Ort::MemoryInfo mem_info = CpuMemoryInfo();
    const std::size_t num_floats =
        static_cast<std::size_t>(input_height) * input_width * kNumChannels;
    Ort::Value input_tensor{nullptr};
    if (input_is_nchw) {
      nchw_buffer.resize(num_floats);
      HwcToNchw(hwc.ptr<float>(), input_height, input_width, nchw_buffer.data());
      const std::array<int64_t, 4> shape{1, kNumChannels, input_height, input_width};
      input_tensor = Ort::Value::CreateTensor<float>(mem_info, nchw_buffer.data(), num_floats,
                                                     shape.data(), shape.size());
    } else {
      const std::array<int64_t, 4> shape{1, input_height, input_width, kNumChannels};
      input_tensor = Ort::Value::CreateTensor<float>(mem_info, hwc.ptr<float>(), num_floats,
                                                     shape.data(), shape.size());
    }

    const char* input_names_c[] = {landmark_input_name.c_str()};
    std::vector<Ort::Value> outputs =
        landmark_session.Run(Ort::RunOptions{}, input_names_c, &input_tensor, 1,
                             landmark_output_ptrs.data(), landmark_output_ptrs.size());

    const auto shape = outputs[0].GetTensorTypeAndShapeInfo().GetShape();
    const float* data = outputs[0].GetTensorData<float>();
    int64_t n = 0;
    int64_t components = 0;
    if (shape.size() == 3u && shape[0] == 1 && shape[2] >= 2 && shape[2] <= 4) {
      n = shape[1];
      components = shape[2];
    } else if (shape.size() == 2u && shape[0] == 1 && shape[1] % 3 == 0) {
      n = shape[1] / 3;
      components = 3;
    }
    if (n <= 0) {
      throw std::runtime_error("OnnxPerceptionAdapter: unexpected landmark output shape");
    }

    const float sx = static_cast<float>(bgr.cols) / static_cast<float>(input_width);
    const float sy = static_cast<float>(bgr.rows) / static_cast<float>(input_height);
    std::vector<ic::Landmark> landmarks;
    landmarks.reserve(static_cast<std::size_t>(n));
    for (int64_t i = 0; i < n; ++i) {
      const float* row = data + i * components;
      const float visibility = components == 4 ? sigmoid(row[3]) : 1.f;
      landmarks.push_back(ic::Landmark{row[0] * sx, row[1] * sy, visibility});
    }

    float score = 1.f;
    if (outputs.size() > 1u && outputs[1].GetTensorTypeAndShapeInfo().GetElementCount() > 0) {
      score = sigmoid(outputs[1].GetTensorData<float>()[0]);
    }
    return {std::move(landmarks), score};
  }

  /// Label -> probability for the face crop. Throws Ort::Exception on inference failure.
  std::map<std::string, float> run_expression(const cv::Mat& bgr, const ic::BBox& box) {
    const cv::Rect roi = detail::clip_to_image(box, bgr.size());
    if (roi.area() == 0) return {};
    cv::Mat gray;
    cv::cvtColor(bgr(roi), gray, cv::COLOR_BGR2GRAY);
    cv::Mat resized;
    cv::resize(gray, resized, cv::Size(expression_width, expression_height), 0, 0,
               cv::INTER_AREA);
    cv::Mat input;
    resized.convertTo(input, CV_32FC1);

    Ort::MemoryInfo mem_info = CpuMemoryInfo();
    const std::array<int64_t, 4> shape{1, 1, expression_height, expression_width};
    Ort::Value input_tensor = Ort::Value::CreateTensor<float>(
        mem_info, input.ptr<float>(), input.total(), shape.data(), shape.size());

    const char* input_names_c[] = {expression_input_name.c_str()};
    const char* output_names_c[] = {expression_output_name.c_str()};
    std::vector<Ort::Value> outputs = expression_session.Run(
        Ort::RunOptions{}, input_names_c, &input_tensor, 1, output_names_c, 1);

    const float* logits = outputs[0].GetTensorData<float>();
    std::vector<float> probs(logits, logits + options.expression_labels.size());
    softmax(probs);
    std::map<std::string, float> scores;
    for (std::size_t i = 0; i < probs.size(); ++i) {
      scores[options.expression_labels[i]] = probs[i];
    }
    return scores;
  }
};

OnnxPerceptionAdapter::OnnxPerceptionAdapter(OnnxPerceptionOptions options)
    : impl_(std::make_unique<Impl>(std::move(options))) {
  if (impl_->options.landmark_model_path.empty()) {
    throw std::runtime_error("OnnxPerceptionAdapter: landmark model path is empty");
  }
  impl_->load_landmark_model();
  if (!impl_->options.expression_model_path.empty()) {
    impl_->load_expression_model();
  }
}

OnnxPerceptionAdapter::~OnnxPerceptionAdapter() = default;

std::expected<void, ic::BoothError>
OnnxPerceptionAdapter::validate_input(const ic::Frame& input) const {
  if (input.empty() || !input.is_well_formed() || input.format() == ic::PixelFormat::Float32Planar) {
    return std::unexpected(ic::BoothError::InvalidFrame);
  }
  return {};
}

std::expected<ic::PerceptionResult, ic::BoothError>
OnnxPerceptionAdapter::detect(const ic::Frame& input) {
  auto valid = validate_input(input);
  if (!valid) {
    return std::unexpected(valid.error());
  }
  auto bgr = detail::to_bgr(input);
  if (!bgr) {
    return std::unexpected(ic::BoothError::InvalidFrame);
  }

  ic::FaceObservation face;
  try {
    auto [landmarks, score] = impl_->run_landmarks(*bgr);
    if (score < impl_->options.face_score_threshold) {
      return ic::NoFaceDetected{};
    }
    face.landmarks = std::move(landmarks);
    face.detection_confidence = score;
    face.bounding_box = landmark_box(face.landmarks, static_cast<float>(input.width()),
                                     static_cast<float>(input.height()));
    if (face.bounding_box.empty()) {
      return ic::NoFaceDetected{};
    }
    if (impl_->has_expression) {
      face.expression_scores = impl_->run_expression(*bgr, face.bounding_box);
    }
  } catch (const Ort::Exception&) {
    return std::unexpected(ic::BoothError::PerceptionUnavailable);
  } catch (const cv::Exception&) {
    return std::unexpected(ic::BoothError::PerceptionUnavailable);
  } catch (const std::runtime_error&) {
    return std::unexpected(ic::BoothError::PerceptionUnavailable);
  }

  if (auto pose = estimate_head_pose(face.landmarks, impl_->options.layout, input.width(),
                                     input.height())) {
    face.head_pose = *pose;
  }
  return face;
}

void OnnxPerceptionAdapter::warmup() {
  const auto w = static_cast<std::uint32_t>(impl_->input_width);
  const auto h = static_cast<std::uint32_t>(impl_->input_height);
  std::vector<std::byte> buffer(ic::Frame::min_bytes(w, h, ic::PixelFormat::BGR8), std::byte{0});
  ic::Frame frame(w, h, ic::PixelFormat::BGR8, std::move(buffer));
  (void)detect(frame);
}

}  // namespace idphoto::vision
