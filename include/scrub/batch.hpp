#pragma once

/**
 * @file batch.hpp
 * @brief Queue of images to inpaint, with per-image status tracking.
 */

#include "scrub/types.hpp"
#include "scrub/pixmap.hpp"
#include "scrub/selection.hpp"
#include "scrub/options.hpp"
#include "scrub/inpainter.hpp"
#include <functional>
#include <memory>
#include <optional>
#include <string>
#include <vector>

namespace scrub {

/// @brief Lifecycle of a queued image.
enum class JobStatus : u8 {
    Pending,
    Processing,
    Completed,
    Error,
};

/// @brief Human-readable job status name.
const char* toString(JobStatus status);

/// @brief One queued image.
struct BatchJob {
    u64 id = 0;
    std::string label;                    ///< Caller-chosen name, usually the input path.
    Pixmap pixmap;                        ///< Decoded pixels, rewritten in place on success.
    std::optional<Selection> selection;   ///< Region to erase; empty until set or auto-detected.
    JobStatus status = JobStatus::Pending;
    f32 progress = 0.0f;                  ///< Last reported percentage.
    InpaintStatus lastStatus = InpaintStatus::Processed;
    std::string error;                    ///< Set when status is Error.
};

/// @brief Number of jobs in each status.
struct BatchStats {
    i32 total = 0;
    i32 pending = 0;
    i32 processing = 0;
    i32 completed = 0;
    i32 failed = 0;
};

/**
 * BatchQueue - Runs the inpainter over a list of images.
 *
 * Jobs run one at a time on the calling thread. A job finishes Completed
 * when the inpainter returned normally (including the soft skips for a
 * degenerate selection or an empty texture bank, visible in lastStatus) and
 * Error when it had no pixels or was cancelled.
 */
class BatchQueue {
public:
    /// @brief Called after each job-level progress update.
    using JobProgressCallback = std::function<void(const BatchJob& job)>;

    explicit BatchQueue(std::unique_ptr<Inpainter> inpainter = Inpainters::MakeLocal(),
                        ProcessingOptions options = {});

    /// @brief Queue an image; returns its id.
    u64 add(std::string label, Pixmap pixmap,
            std::optional<Selection> selection = std::nullopt);

    /// @brief Drop a job. Returns false for unknown ids.
    bool remove(u64 id);

    /// @brief Replace a pending job's selection. Returns false when the id is
    ///        unknown or the job already left Pending.
    bool setSelection(u64 id, std::optional<Selection> selection);

    /// @brief Give every pending job without a selection the auto-detect guess.
    /// @return Number of jobs updated.
    i32 autoDetectMissing();

    /// @brief Run one pending job that has a selection.
    /// @return False when the job is unknown, not pending, or has no selection.
    bool process(u64 id, const InpaintContext& context = {});

    /// @brief Run every pending job that has a selection, in insertion order.
    /// @return Number of jobs run.
    i32 processAll(const InpaintContext& context = {});

    /// @brief Look up a job; nullptr for unknown ids.
    const BatchJob* job(u64 id) const;
    /// @copydoc job()
    BatchJob* job(u64 id);

    const std::vector<BatchJob>& jobs() const { return jobs_; }

    BatchStats stats() const;

    void setOptions(const ProcessingOptions& options) { options_ = options; }
    const ProcessingOptions& options() const { return options_; }

    void setJobProgressCallback(JobProgressCallback cb) { onJobProgress_ = std::move(cb); }

private:
    std::unique_ptr<Inpainter> inpainter_;
    ProcessingOptions options_;
    std::vector<BatchJob> jobs_;
    u64 nextId_ = 1;
    JobProgressCallback onJobProgress_;
};

} // namespace scrub
