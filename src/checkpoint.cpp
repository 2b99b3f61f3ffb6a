#include "scrub/checkpoint.hpp"

namespace scrub {

void Checkpoint::report(f32 percent) {
    if (!(percent >= 0.0f)) percent = 0.0f;
    if (percent > 100.0f) percent = 100.0f;
    if (reported_ && percent < last_) return;

    last_ = percent;
    reported_ = true;
    if (progress_) progress_(percent);
}

bool Checkpoint::yield() {
    ++yields_;
    if (!scheduler_) return true;
    scheduler_->yield();
    return !scheduler_->cancelRequested();
}

} // namespace scrub
