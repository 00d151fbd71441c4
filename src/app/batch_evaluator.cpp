#include <idphoto/app/batch_evaluator.hpp>
#include <algorithm>
#include <atomic>
#include <optional>
#include <thread>
#include <vector>

namespace idphoto::app {

namespace ic = idphoto::core;

std::vector<BatchResult> evaluate_batch(ic::ValidationOrchestrator& orchestrator,
                                        const std::vector<ic::Frame>& frames) {
  std::vector<BatchResult> results;
  results.reserve(frames.size());
  for (const auto& frame : frames) {
    results.push_back(orchestrator.run(frame));
  }
  return results;
}

namespace {

std::size_t effective_workers(std::size_t num_workers) {
  if (num_workers > 0) return num_workers;
  const unsigned hw = std::thread::hardware_concurrency();
  return hw > 0 ? static_cast<std::size_t>(hw) : 1;
}

}  // namespace

std::vector<BatchResult> evaluate_batch_parallel(ic::ValidationOrchestrator& orchestrator,
                                                 const std::vector<ic::Frame>& frames,
                                                 std::size_t num_workers) {
  const std::size_t n = frames.size();
  std::vector<BatchResult> results(n, std::unexpected(ic::BoothError::None));
  if (n == 0) return results;

  std::vector<std::optional<ic::PerceptionResult>> perceptions(n);
  for (std::size_t i = 0; i < n; ++i) {
    auto p = orchestrator.perceive(frames[i]);
    if (p) {
      perceptions[i] = std::move(*p);
    } else {
      results[i] = std::unexpected(p.error());
    }
  }

  const ic::ValidationOrchestrator& evaluator = orchestrator;
  std::atomic<std::size_t> next{0};
  auto worker = [&]() {
    for (std::size_t i = next++; i < n; i = next++) {
      if (perceptions[i]) results[i] = evaluator.evaluate(frames[i], *perceptions[i]);
    }
  };

  const std::size_t workers = std::min(effective_workers(num_workers), n);
  if (workers <= 1) {
    worker();
    return results;
  }
  std::vector<std::thread> threads;
  threads.reserve(workers);
  for (std::size_t i = 0; i < workers; ++i) {
    threads.emplace_back(worker);
  }
  for (auto& t : threads) {
    t.join();
  }
  return results;
}

}  // namespace idphoto::app
