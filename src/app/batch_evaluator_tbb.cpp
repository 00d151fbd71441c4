#include <idphoto/app/batch_evaluator_tbb.hpp>

#ifdef IDPHOTO_HAS_TBB

#include <tbb/blocked_range.h>
#include <tbb/parallel_for.h>
#include <cstddef>
#include <optional>
#include <vector>

namespace idphoto::app {

namespace ic = idphoto::core;

std::vector<BatchResult> evaluate_batch_tbb(ic::ValidationOrchestrator& orchestrator,
                                            const std::vector<ic::Frame>& frames) {
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
  tbb::parallel_for(
      tbb::blocked_range<std::size_t>(0, n),
      [&](const tbb::blocked_range<std::size_t>& range) {
        for (std::size_t i = range.begin(); i != range.end(); ++i) {
          if (perceptions[i]) results[i] = evaluator.evaluate(frames[i], *perceptions[i]);
        }
      });
  return results;
}

}  // namespace idphoto::app

#endif  // IDPHOTO_HAS_TBB
