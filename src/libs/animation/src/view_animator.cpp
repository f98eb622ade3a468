#include <animation/view_animator.hpp>
#include <animation/easing.hpp>

namespace animation {

geometry::CanvasState job_end_state(const AnimationJob& job) {
    geometry::CanvasState end = job.start;
    if (job.target.scale) end.scale = *job.target.scale;
    if (job.target.translate_x) end.translate_x = *job.target.translate_x;
    if (job.target.translate_y) end.translate_y = *job.target.translate_y;
    return end;
}

geometry::CanvasState interpolate(const AnimationJob& job, double now_ms) {
    const double elapsed = now_ms - job.start_time_ms;
    const double progress = job.duration_ms > 0.0 ? clamp01(elapsed / job.duration_ms) : 1.0;
    if (progress >= 1.0) return job_end_state(job);

    const double eased = ease_out_cubic(progress);
    geometry::CanvasState out = job.start;
    if (job.target.scale) out.scale = lerp(job.start.scale, *job.target.scale, eased);
    if (job.target.translate_x) out.translate_x = lerp(job.start.translate_x, *job.target.translate_x, eased);
    if (job.target.translate_y) out.translate_y = lerp(job.start.translate_y, *job.target.translate_y, eased);
    return out;
}

ViewAnimator::ViewAnimator(FrameScheduler& scheduler, geometry::CanvasState& state)
    : scheduler_(scheduler)
    , state_(state)
{
}

ViewAnimator::~ViewAnimator() {
    cancel();
}

void ViewAnimator::animate_to(const ViewTarget& target, double duration_ms) {
    cancel();

    AnimationJob job;
    job.start = state_;
    job.target = target;
    job.start_time_ms = scheduler_.now();
    job.duration_ms = duration_ms;

    if (duration_ms <= 0.0) {
        state_ = job_end_state(job);
        if (on_update_) on_update_();
        return;
    }

    job_ = job;
    frame_ = scheduler_.schedule([this](double now_ms) { on_frame(now_ms); });
}

void ViewAnimator::cancel() {
    if (frame_ != null_frame_handle) {
        scheduler_.cancel(frame_);
        frame_ = null_frame_handle;
    }
    job_.reset();
}

std::optional<geometry::CanvasState> ViewAnimator::target_state() const {
    if (!job_) return std::nullopt;
    return job_end_state(*job_);
}

void ViewAnimator::on_frame(double now_ms) {
    frame_ = null_frame_handle;
    if (!job_) return;

    state_ = interpolate(*job_, now_ms);
    const bool done = now_ms - job_->start_time_ms >= job_->duration_ms;
    if (done)
        job_.reset();
    else
        frame_ = scheduler_.schedule([this](double t) { on_frame(t); });

    if (on_update_) on_update_();
}

} // namespace animation
