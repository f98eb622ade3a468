#pragma once

#include <geometry/types.hpp>
#include <cstdint>
#include <vector>

namespace canvas {

// Positions are in surface pixels, times in the frame scheduler's clock.
struct PointerEvent {
    geometry::Point position;
    double time_ms = 0;
};

struct WheelEvent {
    geometry::Point position;
    double delta_y = 0; // > 0 scrolls down (zoom out)
};

struct TouchPoint {
    std::int64_t id = 0;
    geometry::Point position;
};

// `touches` lists the fingers still down after the event.
struct TouchEvent {
    std::vector<TouchPoint> touches;
    double time_ms = 0;
};

enum class Key {
    ArrowLeft,
    ArrowRight,
    ArrowUp,
    ArrowDown,
    Plus,
    Minus,
    Zero,
    Escape,
    Tab,
    Other
};

struct KeyEvent {
    Key key = Key::Other;
    bool shift = false;
};

} // namespace canvas
