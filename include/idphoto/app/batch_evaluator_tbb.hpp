#pragma once

#include <idphoto/app/batch_evaluator.hpp>
#include <idphoto/core/frame.hpp>
#include <idphoto/core/orchestrator.hpp>
#include <vector>

#ifdef IDPHOTO_HAS_TBB

namespace idphoto::app {

/// As evaluate_batch_parallel(), with the evaluate() step scheduled by
/// tbb::parallel_for. Perception stays sequential on the calling thread.
[[nodiscard]] std::vector<BatchResult> evaluate_batch_tbb(
    idphoto::core::ValidationOrchestrator& orchestrator,
    const std::vector<idphoto::core::Frame>& frames);

}  // namespace idphoto::app

#endif  // IDPHOTO_HAS_TBB
