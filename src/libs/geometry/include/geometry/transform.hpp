#pragma once

#include <geometry/types.hpp>

namespace geometry {

Point screen_to_world(const Point& screen, const CanvasState& state);
Point world_to_screen(const Point& world, const CanvasState& state);

double clamp_scale(double scale, double min_scale, double max_scale);

// Returns the state at new_scale that keeps the world point currently under
// `anchor` (screen space) under `anchor`.
CanvasState zoom_at(const CanvasState& state, const Point& anchor, double new_scale);

// Rectangle of width x height centred on `center`.
Rect rect_around(const Point& center, double width, double height);

bool intersects(const Rect& a, const Rect& b);
bool contains(const Rect& r, const Point& p);

// Smallest rectangle containing both points.
Rect bounding_rect(const Point& a, const Point& b);

// World-space rectangle visible on a screen of the given size, grown by
// `screen_padding` pixels on every side.
Rect visible_world_rect(const CanvasState& state, double screen_width, double screen_height,
    double screen_padding = 0.0);

} // namespace geometry
