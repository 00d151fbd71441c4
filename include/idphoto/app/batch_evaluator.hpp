#pragma once

#include <idphoto/core/error.hpp>
#include <idphoto/core/frame.hpp>
#include <idphoto/core/orchestrator.hpp>
#include <idphoto/core/validation_report.hpp>
#include <cstddef>
#include <expected>
#include <vector>

namespace idphoto::app {

using BatchResult = std::expected<idphoto::core::ValidationReport, idphoto::core::BoothError>;

/// Runs the orchestrator on each frame in order (offline checks of stored photos).
/// Result i belongs to frames[i].
[[nodiscard]] std::vector<BatchResult> evaluate_batch(
    idphoto::core::ValidationOrchestrator& orchestrator,
    const std::vector<idphoto::core::Frame>& frames);

/// Perception runs sequentially on the calling thread (adapters need not be
/// thread-safe); the pure evaluate() step runs on a pool of std::thread
/// workers. num_workers 0 = hardware concurrency. Result i belongs to frames[i].
[[nodiscard]] std::vector<BatchResult> evaluate_batch_parallel(
    idphoto::core::ValidationOrchestrator& orchestrator,
    const std::vector<idphoto::core::Frame>& frames,
    std::size_t num_workers = 0);

}  // namespace idphoto::app
