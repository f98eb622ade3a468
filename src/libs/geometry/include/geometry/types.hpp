#pragma once

namespace geometry {

struct Point {
    double x = 0;
    double y = 0;
};

// Axis-aligned rectangle, (x, y) is the top-left corner.
struct Rect {
    double x = 0;
    double y = 0;
    double width = 0;
    double height = 0;

    double left() const { return x; }
    double right() const { return x + width; }
    double top() const { return y; }
    double bottom() const { return y + height; }
    Point center() const { return { x + width * 0.5, y + height * 0.5 }; }
};

// Current view transform: screen = world * scale + translate.
struct CanvasState {
    double scale = 1.0;
    double translate_x = 0;
    double translate_y = 0;
};

} // namespace geometry
