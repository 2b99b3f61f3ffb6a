#include "scrub/batch.hpp"
#include <algorithm>
#include <cstdio>
#include <utility>

namespace scrub {

const char* toString(JobStatus status) {
    switch (status) {
    case JobStatus::Pending: return "pending";
    case JobStatus::Processing: return "processing";
    case JobStatus::Completed: return "completed";
    case JobStatus::Error: return "error";
    }
    return "unknown";
}

BatchQueue::BatchQueue(std::unique_ptr<Inpainter> inpainter, ProcessingOptions options)
    : inpainter_(std::move(inpainter)),
      options_(options) {
    if (!inpainter_) inpainter_ = Inpainters::MakeLocal();
}

u64 BatchQueue::add(std::string label, Pixmap pixmap, std::optional<Selection> selection) {
    BatchJob j;
    j.id = nextId_++;
    j.label = std::move(label);
    j.pixmap = std::move(pixmap);
    j.selection = selection;
    jobs_.push_back(std::move(j));
    return jobs_.back().id;
}

bool BatchQueue::remove(u64 id) {
    auto it = std::find_if(jobs_.begin(), jobs_.end(),
                           [id](const BatchJob& j) { return j.id == id; });
    if (it == jobs_.end()) return false;
    jobs_.erase(it);
    return true;
}

bool BatchQueue::setSelection(u64 id, std::optional<Selection> selection) {
    BatchJob* j = job(id);
    if (!j || j->status != JobStatus::Pending) return false;
    j->selection = selection;
    return true;
}

i32 BatchQueue::autoDetectMissing() {
    i32 updated = 0;
    for (auto& j : jobs_) {
        if (j.status != JobStatus::Pending || j.selection || !j.pixmap.valid()) continue;
        j.selection = Selection::AutoDetect(j.pixmap.width(), j.pixmap.height());
        ++updated;
    }
    return updated;
}

bool BatchQueue::process(u64 id, const InpaintContext& context) {
    BatchJob* j = job(id);
    if (!j || j->status != JobStatus::Pending || !j->selection) return false;

    j->status = JobStatus::Processing;
    j->progress = 0.0f;
    j->error.clear();
    if (onJobProgress_) onJobProgress_(*j);

    if (!j->pixmap.valid()) {
        j->status = JobStatus::Error;
        j->error = "no decoded pixels";
        std::fprintf(stderr, "scrub BatchQueue: %s: %s\n", j->label.c_str(), j->error.c_str());
        if (onJobProgress_) onJobProgress_(*j);
        return true;
    }

    // Chain the caller's progress hook behind the job bookkeeping. The job
    // pointer stays valid: nothing mutates jobs_ while the inpainter runs.
    InpaintContext ctx = context;
    ctx.progress = [this, j, outer = context.progress](f32 percent) {
        j->progress = percent;
        if (outer) outer(percent);
        if (onJobProgress_) onJobProgress_(*j);
    };

    j->lastStatus = inpainter_->inpaint(j->pixmap, *j->selection, options_, ctx);
    switch (j->lastStatus) {
    case InpaintStatus::Processed:
    case InpaintStatus::DegenerateSelection:
    case InpaintStatus::EmptyTextureBank:
        j->status = JobStatus::Completed;
        j->progress = 100.0f;
        break;
    case InpaintStatus::Cancelled:
    case InpaintStatus::AllocationFailed:
        j->status = JobStatus::Error;
        j->error = toString(j->lastStatus);
        std::fprintf(stderr, "scrub BatchQueue: %s: %s\n", j->label.c_str(), j->error.c_str());
        break;
    }
    if (onJobProgress_) onJobProgress_(*j);
    return true;
}

i32 BatchQueue::processAll(const InpaintContext& context) {
    // Collect ids first; callbacks may inspect the queue while jobs run
    std::vector<u64> ready;
    for (const auto& j : jobs_) {
        if (j.status == JobStatus::Pending && j.selection) ready.push_back(j.id);
    }
    i32 run = 0;
    for (u64 id : ready) {
        if (process(id, context)) ++run;
    }
    return run;
}

const BatchJob* BatchQueue::job(u64 id) const {
    for (const auto& j : jobs_) {
        if (j.id == id) return &j;
    }
    return nullptr;
}

BatchJob* BatchQueue::job(u64 id) {
    for (auto& j : jobs_) {
        if (j.id == id) return &j;
    }
    return nullptr;
}

BatchStats BatchQueue::stats() const {
    BatchStats s;
    s.total = i32(jobs_.size());
    for (const auto& j : jobs_) {
        switch (j.status) {
        case JobStatus::Pending: ++s.pending; break;
        case JobStatus::Processing: ++s.processing; break;
        case JobStatus::Completed: ++s.completed; break;
        case JobStatus::Error: ++s.failed; break;
        }
    }
    return s;
}

} // namespace scrub
