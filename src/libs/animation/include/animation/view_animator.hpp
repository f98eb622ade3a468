#pragma once

#include <animation/frame_scheduler.hpp>
#include <geometry/types.hpp>
#include <functional>
#include <optional>

namespace animation {

// Partial CanvasState: unset fields keep their current value.
struct ViewTarget {
    std::optional<double> scale;
    std::optional<double> translate_x;
    std::optional<double> translate_y;

    static ViewTarget from_state(const geometry::CanvasState& s) {
        return ViewTarget{ s.scale, s.translate_x, s.translate_y };
    }
};

struct AnimationJob {
    geometry::CanvasState start;
    ViewTarget target;
    double start_time_ms = 0;
    double duration_ms = 0;
};

// State the job ends at.
geometry::CanvasState job_end_state(const AnimationJob& job);

// Ease-out-cubic interpolation of the job at `now_ms`; exactly the end state
// once `now_ms >= start + duration`.
geometry::CanvasState interpolate(const AnimationJob& job, double now_ms);

// Drives at most one AnimationJob on a live CanvasState. Starting a job
// replaces the in-flight one, starting from the current interpolated state.
class ViewAnimator {
public:
    ViewAnimator(FrameScheduler& scheduler, geometry::CanvasState& state);
    ~ViewAnimator();

    ViewAnimator(const ViewAnimator&) = delete;
    ViewAnimator& operator=(const ViewAnimator&) = delete;

    // Called after every write to the state.
    void set_on_update(std::function<void()> on_update) { on_update_ = std::move(on_update); }

    void animate_to(const ViewTarget& target, double duration_ms);
    // Leaves the state at its last interpolated value.
    void cancel();
    bool is_animating() const { return job_.has_value(); }

    // End state of the in-flight job, nullopt when idle.
    std::optional<geometry::CanvasState> target_state() const;

private:
    void on_frame(double now_ms);

    FrameScheduler& scheduler_;
    geometry::CanvasState& state_;
    std::function<void()> on_update_;
    std::optional<AnimationJob> job_;
    FrameHandle frame_ = null_frame_handle;
};

} // namespace animation
