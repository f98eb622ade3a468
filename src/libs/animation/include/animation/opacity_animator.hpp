#pragma once

#include <animation/frame_scheduler.hpp>
#include <functional>
#include <string>
#include <unordered_map>

namespace animation {

// Per-key opacity easing toward a target, on its own frame loop so it can
// overlap the view transform animation.
class OpacityAnimator {
public:
    explicit OpacityAnimator(FrameScheduler& scheduler);
    ~OpacityAnimator();

    OpacityAnimator(const OpacityAnimator&) = delete;
    OpacityAnimator& operator=(const OpacityAnimator&) = delete;

    void set_duration(double ms) { duration_ms_ = ms; }
    double duration() const { return duration_ms_; }
    void set_on_update(std::function<void()> on_update) { on_update_ = std::move(on_update); }

    // Unknown keys start at the target (nothing to animate).
    void set_target(const std::string& key, double target);
    void set_immediate(const std::string& key, double value);
    // Starts the frame loop if any key is away from its target.
    void start();

    // Advances every key by `dt_ms`; returns true when all keys have settled.
    bool tick(double dt_ms);

    double get_current(const std::string& key, double fallback = 0.0) const;
    double get_target(const std::string& key, double fallback = 0.0) const;
    bool is_animating() const { return frame_ != null_frame_handle; }
    bool settled() const;

    void clear();

    static constexpr double epsilon = 0.001;

private:
    struct State {
        double current = 0;
        double target = 0;
    };

    void on_frame(double now_ms);

    FrameScheduler& scheduler_;
    std::function<void()> on_update_;
    std::unordered_map<std::string, State> state_;
    double duration_ms_ = 300.0;
    double last_frame_ms_ = 0.0;
    FrameHandle frame_ = null_frame_handle;
};

} // namespace animation
