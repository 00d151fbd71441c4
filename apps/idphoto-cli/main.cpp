/**
 * idphoto-cli: validate passport-photo frames and simulate a booth session.
 * Build: cmake -B build && cmake --build build
 * Run:   ./build/idphoto-cli [--config path] [--input path]... [--simulate]
 * With --input: also writes results to output/<basename>.txt (same content as terminal).
 */

#include <idphoto/app/booth_factory.hpp>
#include <idphoto/app/capture_loop.hpp>
#include <idphoto/app/config.hpp>
#include <idphoto/app/storage.hpp>
#include <idphoto/core/error.hpp>
#include <idphoto/core/feedback.hpp>
#include <idphoto/core/frame.hpp>
#include <idphoto/core/orchestrator.hpp>
#include <idphoto/core/report_format.hpp>
#include <idphoto/vision/load_image.hpp>
#include <idphoto/vision/mock_perception_adapter.hpp>

#include <charconv>
#include <cstddef>
#include <cstdint>
#include <exception>
#include <filesystem>
#include <fstream>
#include <iostream>
#include <memory>
#include <sstream>
#include <string>
#include <string_view>
#include <system_error>
#include <vector>

namespace {

namespace ia = idphoto::app;
namespace ic = idphoto::core;

/// Mid-gray frame used when no --input is given.
ic::Frame make_dummy_frame(std::uint32_t w, std::uint32_t h, ic::Timestamp t) {
  const std::size_t bytes = static_cast<std::size_t>(w) * h * 3;
  std::vector<std::byte> buffer(bytes, std::byte{128});
  return ic::Frame(w, h, ic::PixelFormat::BGR8, std::move(buffer), t);
}

/// The mock backend plays a centered frontal face so the demo exercises every validator.
std::unique_ptr<ic::IPerceptionAdapter> build_adapter(const ia::BoothConfig& cfg,
                                                      std::uint32_t w, std::uint32_t h) {
  auto adapter = ia::make_perception_adapter(cfg);
  if (cfg.backend_type == ia::PerceptionBackendType::Mock) {
    auto* mock = static_cast<idphoto::vision::MockPerceptionAdapter*>(adapter.get());
    mock->set_result(idphoto::vision::frontal_face_observation(
        w, h, cfg.validators.landmark_layout, cfg.validators.expression.neutral_label));
  } else {
    adapter->warmup();
  }
  return adapter;
}

void write_output(const std::string& input_path, const std::string& out_dir,
                  const std::string& text) {
  std::filesystem::path p(input_path);
  std::filesystem::path dir(out_dir);
  std::error_code ec;
  std::filesystem::create_directories(dir, ec);
  std::filesystem::path out_file = dir / (p.stem().string() + ".txt");
  std::ofstream f(out_file);
  if (f) {
    f << text;
  } else {
    std::cerr << "Warning: could not write " << out_file << "\n";
  }
}

}  // namespace

int main(int argc, char* argv[]) {
  std::string config_path;
  std::vector<std::string> inputs;
  std::string backend_override;  // "mock" or "onnx"
  std::string model_override;
  std::string expression_model_override;
  std::string output_dir = "output";
  bool simulate = false;
  bool strict = false;
  bool timing = false;
  long long frame_interval_ms = 100;

  for (int i = 1; i < argc; ++i) {
    const std::string arg = argv[i];
    if (arg == "--config" && i + 1 < argc) {
      config_path = argv[++i];
    } else if (arg == "--input" && i + 1 < argc) {
      inputs.emplace_back(argv[++i]);
    } else if (arg == "--backend" && i + 1 < argc) {
      backend_override = argv[++i];
    } else if (arg == "--model" && i + 1 < argc) {
      model_override = argv[++i];
    } else if (arg == "--expression-model" && i + 1 < argc) {
      expression_model_override = argv[++i];
    } else if (arg == "--output-dir" && i + 1 < argc) {
      output_dir = argv[++i];
    } else if (arg == "--frame-interval-ms" && i + 1 < argc) {
      const std::string_view value = argv[++i];
      const auto [ptr, ec] =
          std::from_chars(value.data(), value.data() + value.size(), frame_interval_ms);
      if (ec != std::errc{} || ptr != value.data() + value.size() || frame_interval_ms < 0) {
        std::cerr << "Invalid --frame-interval-ms " << value << "\n";
        return 1;
      }
    } else if (arg == "--simulate") {
      simulate = true;
    } else if (arg == "--strict") {
      strict = true;
    } else if (arg == "--timing") {
      timing = true;
    } else if (arg == "--help" || arg == "-h") {
      std::cout
          << "Usage: idphoto-cli [options] [--input <path>]...\n"
          << "  --config <path>            Booth config (key=value file); default: built-in (mock)\n"
          << "  --strict                   Require every threshold key in the config file\n"
          << "  --backend <type>           Override backend: mock | onnx (default from config)\n"
          << "  --model <path>             Override landmark model path (required for onnx)\n"
          << "  --expression-model <path>  Override expression model path (optional)\n"
          << "  --input <path>             Image path; repeat for several (default: synthetic frame)\n"
          << "  --simulate                 Feed the inputs as one capture session\n"
          << "  --frame-interval-ms <ms>   Timestamp step between simulated frames (default 100)\n"
          << "  --output-dir <dir>         Reports and captures (default: output)\n"
          << "  --timing                   Print per-validator durations\n";
      return 0;
    } else {
      std::cerr << "Unknown argument " << arg << " (see --help)\n";
      return 1;
    }
  }

  ia::BoothConfig cfg = ia::default_config();
  if (!config_path.empty()) {
    ia::KeyValueConfigSource source(config_path, strict);
    auto loaded = source.load_thresholds();
    if (!loaded) {
      std::cerr << "Config error (" << config_path << "): " << ic::to_string(loaded.error())
                << "\n";
      return 1;
    }
    cfg = std::move(*loaded);
  }
  if (!backend_override.empty()) {
    if (backend_override == "mock") {
      cfg.backend_type = ia::PerceptionBackendType::Mock;
    } else if (backend_override == "onnx") {
      cfg.backend_type = ia::PerceptionBackendType::Onnx;
    } else {
      std::cerr << "Unknown --backend " << backend_override << " (use mock or onnx)\n";
      return 1;
    }
  }
  if (!model_override.empty()) cfg.landmark_model_path = model_override;
  if (!expression_model_override.empty()) cfg.expression_model_path = expression_model_override;
  if (cfg.backend_type == ia::PerceptionBackendType::Onnx && cfg.landmark_model_path.empty()) {
    std::cerr << "backend onnx requires landmark_model_path in config or --model\n";
    return 1;
  }

  std::vector<ic::Frame> frames;
  for (std::size_t i = 0; i < inputs.size(); ++i) {
    const ic::Timestamp t{static_cast<long long>(i) * frame_interval_ms};
    auto loaded = idphoto::vision::load_frame_from_image(inputs[i], t);
    if (!loaded) {
      std::cerr << "Failed to load image: " << inputs[i] << "\n";
      return 1;
    }
    frames.push_back(std::move(*loaded));
  }
  if (frames.empty()) frames.push_back(make_dummy_frame(480, 640, ic::Timestamp{0}));

  std::unique_ptr<ic::ValidationOrchestrator> orchestrator;
  try {
    auto adapter = build_adapter(cfg, frames.front().width(), frames.front().height());
    auto built = ia::make_orchestrator(cfg, std::move(adapter));
    if (!built) {
      std::cerr << "Cannot build validators: " << ic::to_string(built.error()) << "\n";
      return 1;
    }
    orchestrator = std::move(*built);
  } catch (const std::exception& e) {
    std::cerr << "Perception backend failed to load: " << e.what() << "\n";
    return 1;
  }

  ic::FeedbackTranslator translator(cfg.feedback);

  if (simulate) {
    ia::ImageDirectoryStorage storage(output_dir);
    ia::CaptureLoop loop(*orchestrator, storage, translator, cfg.stability,
                         ia::CaptureLoopOptions{cfg.evaluate_every_kth_frame,
                                                cfg.storage_retry_count});
    loop.set_tick_callback([](const ia::LoopTick& tick) {
      std::cout << "frame=" << tick.frame_index << " state=" << ic::to_string(tick.decision.state);
      if (tick.report) {
        std::cout << " overall_passed=" << (tick.report->overall_passed() ? "true" : "false");
      }
      if (!tick.guidance.empty()) std::cout << " hint=" << tick.guidance.front().key;
      if (tick.record) std::cout << " captured=" << tick.record->value;
      if (tick.error) std::cout << " error=" << ic::to_string(*tick.error);
      std::cout << "\n";
    });

    for (const auto& frame : frames) {
      const auto tick = loop.on_frame(frame);
      if (ic::is_terminal(tick.decision.state)) break;
    }
    const auto& session = loop.state_machine().session();
    std::cout << "session_state=" << ic::to_string(session.state)
              << " consecutive_passes=" << session.consecutive_pass_count << "\n";
    if (loop.has_pending_capture()) {
      std::cerr << "Capture could not be stored in " << output_dir << "\n";
      return 1;
    }
    return session.state == ic::CaptureState::Captured ? 0 : 2;
  }

  ic::ValidatorTimingCallback timing_cb = [](std::size_t index, std::string_view name,
                                             double ms) {
    std::cout << "  timing[" << index << "] " << name << " " << ms << " ms\n";
  };

  bool all_passed = true;
  for (std::size_t i = 0; i < frames.size(); ++i) {
    auto report = orchestrator->run(frames[i], timing ? &timing_cb : nullptr);
    if (!report) {
      std::cerr << "Validation error: " << ic::to_string(report.error()) << "\n";
      return 1;
    }
    all_passed = all_passed && report->overall_passed();

    std::ostringstream out;
    if (i < inputs.size()) out << "input=" << inputs[i] << "\n";
    out << ic::format_report(*report);
    const auto guidance = translator.translate(*report);
    if (!guidance.empty()) {
      out << "guidance:\n" << ic::format_guidance(guidance);
    }
    const std::string text = out.str();
    std::cout << text;

    if (i < inputs.size()) write_output(inputs[i], output_dir, text);
  }
  return all_passed ? 0 : 2;
}
