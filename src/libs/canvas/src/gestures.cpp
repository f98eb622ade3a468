#include <canvas/gestures.hpp>
#include <geometry/transform.hpp>
#include <cmath>

namespace canvas {

namespace {

double distance_between(const geometry::Point& a, const geometry::Point& b) {
    return std::hypot(b.x - a.x, b.y - a.y);
}

} // namespace

DragState begin_drag(const geometry::Point& p, double time_ms) {
    DragState d;
    d.active = true;
    d.last = p;
    d.last_time_ms = time_ms;
    return d;
}

DragStep drag_move(const DragState& drag, const geometry::CanvasState& view,
    const geometry::Point& p, double time_ms, double smoothing)
{
    DragStep out{ drag, view };
    if (!drag.active) return out;

    const double dx = p.x - drag.last.x;
    const double dy = p.y - drag.last.y;
    out.view.translate_x += dx;
    out.view.translate_y += dy;
    out.drag.distance += std::hypot(dx, dy);
    out.drag.pending.x += dx;
    out.drag.pending.y += dy;

    // Samples sharing a timestamp fold into the next timed one.
    const double dt = time_ms - drag.last_time_ms;
    if (dt > 0.0) {
        out.drag.velocity.x = drag.velocity.x * (1.0 - smoothing) + (out.drag.pending.x / dt) * smoothing;
        out.drag.velocity.y = drag.velocity.y * (1.0 - smoothing) + (out.drag.pending.y / dt) * smoothing;
        out.drag.pending = geometry::Point{};
        out.drag.last_time_ms = time_ms;
    }
    out.drag.last = p;
    return out;
}

std::optional<geometry::CanvasState> momentum_target(const DragState& drag,
    const geometry::CanvasState& view, double release_time_ms, const MomentumConfig& config)
{
    if (release_time_ms - drag.last_time_ms > config.release_idle_ms) return std::nullopt;
    const double speed = std::hypot(drag.velocity.x, drag.velocity.y);
    if (speed <= config.velocity_threshold) return std::nullopt;
    return pan_by(view, drag.velocity.x * config.multiplier, drag.velocity.y * config.multiplier);
}

bool is_tap(const DragState& drag, double drag_threshold) {
    return drag.distance < drag_threshold;
}

PinchState begin_pinch(const geometry::Point& a, const geometry::Point& b) {
    PinchState p;
    p.active = true;
    p.distance = distance_between(a, b);
    return p;
}

PinchStep pinch_move(const PinchState& pinch, const geometry::CanvasState& view,
    const geometry::Point& a, const geometry::Point& b, const ZoomConfig& config)
{
    PinchStep out{ pinch, view };
    const double d = distance_between(a, b);
    if (!pinch.active || pinch.distance <= 0.0 || d <= 0.0) {
        out.pinch.distance = d;
        return out;
    }
    const geometry::Point mid{ (a.x + b.x) * 0.5, (a.y + b.y) * 0.5 };
    out.view = zoom_by(view, mid, d / pinch.distance, config);
    out.pinch.distance = d;
    return out;
}

geometry::CanvasState zoom_by(const geometry::CanvasState& view, const geometry::Point& anchor,
    double factor, const ZoomConfig& config)
{
    const double new_scale = geometry::clamp_scale(view.scale * factor, config.min_scale, config.max_scale);
    return geometry::zoom_at(view, anchor, new_scale);
}

geometry::CanvasState wheel_zoom(const geometry::CanvasState& view, const geometry::Point& anchor,
    double delta_y, const ZoomConfig& config)
{
    if (delta_y == 0.0) return view;
    return zoom_by(view, anchor, delta_y > 0.0 ? config.wheel_out : config.wheel_in, config);
}

geometry::CanvasState pan_by(const geometry::CanvasState& view, double dx, double dy) {
    geometry::CanvasState out = view;
    out.translate_x += dx;
    out.translate_y += dy;
    return out;
}

} // namespace canvas
