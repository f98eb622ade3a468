#include <animation/opacity_animator.hpp>
#include <animation/easing.hpp>
#include <algorithm>
#include <cmath>

namespace animation {

OpacityAnimator::OpacityAnimator(FrameScheduler& scheduler)
    : scheduler_(scheduler)
{
}

OpacityAnimator::~OpacityAnimator() {
    if (frame_ != null_frame_handle)
        scheduler_.cancel(frame_);
}

void OpacityAnimator::set_target(const std::string& key, double target) {
    auto it = state_.find(key);
    if (it == state_.end()) {
        state_[key] = State{ target, target };
    } else {
        it->second.target = target;
    }
}

void OpacityAnimator::set_immediate(const std::string& key, double value) {
    state_[key] = State{ value, value };
}

void OpacityAnimator::start() {
    if (frame_ != null_frame_handle || settled()) return;
    last_frame_ms_ = scheduler_.now();
    frame_ = scheduler_.schedule([this](double now_ms) { on_frame(now_ms); });
}

bool OpacityAnimator::tick(double dt_ms) {
    if (dt_ms <= 0.0) return settled();
    double step = duration_ms_ > 0.0 ? std::min(1.0, dt_ms / duration_ms_) : 1.0;
    step = ease_out_cubic(step);
    bool all_settled = true;
    for (auto& [key, s] : state_) {
        s.current += (s.target - s.current) * step;
        if (std::abs(s.current - s.target) < epsilon)
            s.current = s.target;
        else
            all_settled = false;
    }
    return all_settled;
}

double OpacityAnimator::get_current(const std::string& key, double fallback) const {
    auto it = state_.find(key);
    if (it == state_.end()) return fallback;
    return it->second.current;
}

double OpacityAnimator::get_target(const std::string& key, double fallback) const {
    auto it = state_.find(key);
    if (it == state_.end()) return fallback;
    return it->second.target;
}

bool OpacityAnimator::settled() const {
    for (const auto& [key, s] : state_)
        if (s.current != s.target) return false;
    return true;
}

void OpacityAnimator::clear() {
    if (frame_ != null_frame_handle) {
        scheduler_.cancel(frame_);
        frame_ = null_frame_handle;
    }
    state_.clear();
}

void OpacityAnimator::on_frame(double now_ms) {
    frame_ = null_frame_handle;
    const double dt = now_ms - last_frame_ms_;
    last_frame_ms_ = now_ms;

    const bool done = tick(dt);
    if (!done)
        frame_ = scheduler_.schedule([this](double t) { on_frame(t); });

    if (on_update_) on_update_();
}

} // namespace animation
