#include <animation/frame_scheduler.hpp>
#include <algorithm>
#include <utility>

namespace animation {

FrameQueue::FrameQueue(double start_ms)
    : now_ms_(start_ms)
{
}

FrameHandle FrameQueue::schedule(FrameCallback callback) {
    if (!callback) return null_frame_handle;
    const FrameHandle handle = next_handle_++;
    pending_.push_back(Entry{ handle, std::move(callback) });
    return handle;
}

void FrameQueue::cancel(FrameHandle handle) {
    if (handle == null_frame_handle) return;
    pending_.erase(std::remove_if(pending_.begin(), pending_.end(),
        [handle](const Entry& e) { return e.handle == handle; }), pending_.end());
    // Cancelled from inside a callback of the current frame.
    for (auto& e : running_) {
        if (e.handle == handle) e.callback = nullptr;
    }
}

void FrameQueue::run_frame(double now_ms) {
    now_ms_ = now_ms;
    running_.swap(pending_);
    pending_.clear();
    for (std::size_t i = 0; i < running_.size(); ++i) {
        FrameCallback callback = std::move(running_[i].callback);
        running_[i].callback = nullptr;
        if (callback) callback(now_ms);
    }
    running_.clear();
}

void FrameQueue::advance(double ms, double frame_ms) {
    if (frame_ms <= 0.0) frame_ms = 16.0;
    const double end = now_ms_ + ms;
    while (now_ms_ < end) {
        run_frame(std::min(end, now_ms_ + frame_ms));
    }
}

} // namespace animation
