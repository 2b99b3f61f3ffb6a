#pragma once

/**
 * @file checkpoint.hpp
 * @brief Progress reporting, cooperative yielding and cancellation.
 */

#include "scrub/types.hpp"
#include <functional>
#include <utility>

namespace scrub {

/// @brief Receives a percentage in [0, 100] that never decreases during a call.
using ProgressCallback = std::function<void(f32 percent)>;

/**
 * @brief Host hook for cooperative scheduling.
 *
 * The pipeline is a single task broken into checkpoints. At each checkpoint
 * it calls yield() so a host (typically a UI event loop) can run other work,
 * then asks cancelRequested(). The host must not touch the buffer being
 * processed from inside yield().
 */
class Scheduler {
public:
    virtual ~Scheduler() = default;

    /// @brief Give the host a chance to run. Default does nothing.
    virtual void yield() {}

    /// @brief Return true to stop the pipeline at the current checkpoint.
    virtual bool cancelRequested() const { return false; }
};

/**
 * @brief Progress and yield bookkeeping for one pipeline run.
 *
 * Either hook may be absent. Reported values are clamped to [0, 100] and
 * held monotonic, so a stage that re-reports a lower value is ignored.
 */
class Checkpoint {
public:
    Checkpoint() = default;
    Checkpoint(ProgressCallback progress, Scheduler* scheduler)
        : progress_(std::move(progress)), scheduler_(scheduler) {}

    /// @brief Forward a progress value if it advances the last one.
    void report(f32 percent);

    /// @brief Yield to the host.
    /// @return False when the host asked to cancel.
    bool yield();

    /// @brief Last value passed to the callback (0 before the first report).
    f32 lastReported() const { return last_; }

    /// @brief Number of yields performed so far.
    i32 yieldCount() const { return yields_; }

private:
    ProgressCallback progress_;
    Scheduler* scheduler_ = nullptr;
    f32 last_ = 0.0f;
    bool reported_ = false;
    i32 yields_ = 0;
};

} // namespace scrub
