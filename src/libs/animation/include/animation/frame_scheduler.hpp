#pragma once

#include <cstddef>
#include <cstdint>
#include <functional>
#include <vector>

namespace animation {

// Invoked once per frame with the frame timestamp in milliseconds.
using FrameCallback = std::function<void(double now_ms)>;
using FrameHandle = std::uint64_t;

constexpr FrameHandle null_frame_handle = 0;

// Cooperative per-frame scheduling: a callback runs on the next frame only;
// loops reschedule themselves from inside the callback.
class FrameScheduler {
public:
    virtual ~FrameScheduler() = default;

    virtual FrameHandle schedule(FrameCallback callback) = 0;
    // No-op for unknown, cancelled or already-run handles.
    virtual void cancel(FrameHandle handle) = 0;
    virtual double now() const = 0;
};

// Frame queue driven by an external clock: the application feeds it real
// time, tests feed it a virtual clock.
class FrameQueue : public FrameScheduler {
public:
    explicit FrameQueue(double start_ms = 0.0);

    FrameHandle schedule(FrameCallback callback) override;
    void cancel(FrameHandle handle) override;
    double now() const override { return now_ms_; }

    // Runs the callbacks pending at entry; ones scheduled meanwhile wait for
    // the next frame.
    void run_frame(double now_ms);

    // Steps the clock by `ms` in frames of `frame_ms`, running a frame per step.
    void advance(double ms, double frame_ms = 16.0);

    // Moves the clock without running callbacks.
    void set_time(double now_ms) { now_ms_ = now_ms; }

    std::size_t pending() const { return pending_.size(); }

private:
    struct Entry {
        FrameHandle handle = null_frame_handle;
        FrameCallback callback;
    };

    std::vector<Entry> pending_;
    std::vector<Entry> running_;
    FrameHandle next_handle_ = 1;
    double now_ms_ = 0.0;
};

} // namespace animation
