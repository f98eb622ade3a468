#include <geometry/transform.hpp>
#include <algorithm>

namespace geometry {

Point screen_to_world(const Point& screen, const CanvasState& state) {
    return { (screen.x - state.translate_x) / state.scale,
             (screen.y - state.translate_y) / state.scale };
}

Point world_to_screen(const Point& world, const CanvasState& state) {
    return { world.x * state.scale + state.translate_x,
             world.y * state.scale + state.translate_y };
}

double clamp_scale(double scale, double min_scale, double max_scale) {
    return std::max(min_scale, std::min(max_scale, scale));
}

CanvasState zoom_at(const CanvasState& state, const Point& anchor, double new_scale) {
    const Point world = screen_to_world(anchor, state);
    CanvasState out;
    out.scale = new_scale;
    out.translate_x = anchor.x - world.x * new_scale;
    out.translate_y = anchor.y - world.y * new_scale;
    return out;
}

Rect rect_around(const Point& center, double width, double height) {
    return { center.x - width * 0.5, center.y - height * 0.5, width, height };
}

bool intersects(const Rect& a, const Rect& b) {
    return !(a.right() < b.left() || a.left() > b.right() ||
             a.bottom() < b.top() || a.top() > b.bottom());
}

bool contains(const Rect& r, const Point& p) {
    return p.x >= r.left() && p.x <= r.right() && p.y >= r.top() && p.y <= r.bottom();
}

Rect bounding_rect(const Point& a, const Point& b) {
    const double min_x = std::min(a.x, b.x);
    const double min_y = std::min(a.y, b.y);
    return { min_x, min_y, std::max(a.x, b.x) - min_x, std::max(a.y, b.y) - min_y };
}

Rect visible_world_rect(const CanvasState& state, double screen_width, double screen_height,
    double screen_padding)
{
    const Point top_left = screen_to_world({ -screen_padding, -screen_padding }, state);
    const Point bottom_right = screen_to_world(
        { screen_width + screen_padding, screen_height + screen_padding }, state);
    return bounding_rect(top_left, bottom_right);
}

} // namespace geometry
