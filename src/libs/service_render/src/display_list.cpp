#include <service_render/display_list.hpp>
#include <algorithm>
#include <cmath>

namespace service_render {

Color with_alpha(Color c, double factor) {
    const double f = std::max(0.0, std::min(1.0, factor));
    c.a = static_cast<std::uint8_t>(std::lround(c.a * f));
    return c;
}

Color from_rgb_hex(std::uint32_t rgb, std::uint8_t alpha) {
    return Color{ static_cast<std::uint8_t>((rgb >> 16) & 0xFF),
                  static_cast<std::uint8_t>((rgb >> 8) & 0xFF),
                  static_cast<std::uint8_t>(rgb & 0xFF),
                  alpha };
}

void DisplayList::clear(Color background) {
    commands_.clear();
    background_ = background;
    global_alpha_ = 1.0;
    ++clear_count_;
}

void DisplayList::set_global_alpha(double alpha) {
    global_alpha_ = std::max(0.0, std::min(1.0, alpha));
}

void DisplayList::draw_line(geometry::Point a, geometry::Point b, Color color, double thickness) {
    DrawCommand cmd;
    cmd.kind = DrawCommandKind::Line;
    cmd.a = a;
    cmd.b = b;
    cmd.color = with_alpha(color, global_alpha_);
    cmd.thickness = thickness;
    commands_.push_back(std::move(cmd));
}

void DisplayList::fill_rect_gradient(geometry::Point min, geometry::Point max, Color start, Color end,
    double rounding)
{
    DrawCommand cmd;
    cmd.kind = DrawCommandKind::RectGradient;
    cmd.a = min;
    cmd.b = max;
    cmd.color = with_alpha(start, global_alpha_);
    cmd.color_end = with_alpha(end, global_alpha_);
    cmd.rounding = rounding;
    commands_.push_back(std::move(cmd));
}

void DisplayList::stroke_rect(geometry::Point min, geometry::Point max, Color color, double rounding,
    double thickness)
{
    DrawCommand cmd;
    cmd.kind = DrawCommandKind::RectStroke;
    cmd.a = min;
    cmd.b = max;
    cmd.color = with_alpha(color, global_alpha_);
    cmd.rounding = rounding;
    cmd.thickness = thickness;
    commands_.push_back(std::move(cmd));
}

void DisplayList::draw_text(geometry::Point top_left, Color color, const std::string& text,
    double font_size)
{
    DrawCommand cmd;
    cmd.kind = DrawCommandKind::Text;
    cmd.a = top_left;
    cmd.color = with_alpha(color, global_alpha_);
    cmd.font_size = font_size;
    cmd.text = text;
    commands_.push_back(std::move(cmd));
}

void DisplayList::draw_text_centered(geometry::Point center, Color color, const std::string& text,
    double font_size)
{
    DrawCommand cmd;
    cmd.kind = DrawCommandKind::TextCentered;
    cmd.a = center;
    cmd.color = with_alpha(color, global_alpha_);
    cmd.font_size = font_size;
    cmd.text = text;
    commands_.push_back(std::move(cmd));
}

std::size_t DisplayList::count(DrawCommandKind kind) const {
    return static_cast<std::size_t>(std::count_if(commands_.begin(), commands_.end(),
        [kind](const DrawCommand& c) { return c.kind == kind; }));
}

GradientSpan split_rounded_gradient(const DrawCommand& cmd) {
    const double w = std::abs(cmd.b.x - cmd.a.x);
    const double h = std::abs(cmd.b.y - cmd.a.y);
    GradientSpan span;
    span.rounding = std::max(0.0, std::min({ cmd.rounding, w * 0.5, h * 0.5 }));
    span.inner_min_x = std::min(cmd.a.x, cmd.b.x) + span.rounding;
    span.inner_max_x = std::max(cmd.a.x, cmd.b.x) - span.rounding;
    return span;
}

DisplayListSurface::DisplayListSurface(double width, double height)
    : width_(width)
    , height_(height)
{
}

void DisplayListSurface::resize(double width, double height) {
    width_ = width;
    height_ = height;
}

} // namespace service_render
