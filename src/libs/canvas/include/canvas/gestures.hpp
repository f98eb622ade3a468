#pragma once

#include <canvas/view_config.hpp>
#include <geometry/types.hpp>
#include <optional>

namespace canvas {

// Pure gesture transitions: (state, event) -> state.

struct DragState {
    bool active = false;
    geometry::Point last;
    double last_time_ms = 0;
    double distance = 0;        // accumulated pointer travel since the press
    geometry::Point velocity;   // smoothed, px per ms
    geometry::Point pending;    // travel since last_time_ms not yet in velocity
};

struct DragStep {
    DragState drag;
    geometry::CanvasState view;
};

DragState begin_drag(const geometry::Point& p, double time_ms);

// Pans the view by the pointer delta and updates the velocity estimate
// (exponential moving average with weight `smoothing` on the new sample).
DragStep drag_move(const DragState& drag, const geometry::CanvasState& view,
    const geometry::Point& p, double time_ms, double smoothing);

// View to coast to after release, nullopt when the release is too slow or
// the pointer had rested.
std::optional<geometry::CanvasState> momentum_target(const DragState& drag,
    const geometry::CanvasState& view, double release_time_ms, const MomentumConfig& config);

bool is_tap(const DragState& drag, double drag_threshold);

struct PinchState {
    bool active = false;
    double distance = 0;
};

struct PinchStep {
    PinchState pinch;
    geometry::CanvasState view;
};

PinchState begin_pinch(const geometry::Point& a, const geometry::Point& b);

// Scales by the finger distance ratio since the previous step, anchored at
// the finger midpoint.
PinchStep pinch_move(const PinchState& pinch, const geometry::CanvasState& view,
    const geometry::Point& a, const geometry::Point& b, const ZoomConfig& config);

// Scale multiplied by `factor`, clamped, anchored at `anchor`.
geometry::CanvasState zoom_by(const geometry::CanvasState& view, const geometry::Point& anchor,
    double factor, const ZoomConfig& config);

// One wheel notch: wheel_in when scrolling up, wheel_out when scrolling down.
geometry::CanvasState wheel_zoom(const geometry::CanvasState& view, const geometry::Point& anchor,
    double delta_y, const ZoomConfig& config);

geometry::CanvasState pan_by(const geometry::CanvasState& view, double dx, double dy);

} // namespace canvas
