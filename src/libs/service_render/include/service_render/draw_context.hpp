#pragma once

#include <geometry/types.hpp>
#include <cstdint>
#include <string>

namespace service_render {

struct Color {
    std::uint8_t r = 0;
    std::uint8_t g = 0;
    std::uint8_t b = 0;
    std::uint8_t a = 255;
};

// Alpha multiplied by `factor` (clamped to [0, 1]).
Color with_alpha(Color c, double factor);
Color from_rgb_hex(std::uint32_t rgb, std::uint8_t alpha = 255);

// Screen-space 2D drawing primitives. Coordinates are pixels relative to the
// surface's top-left corner.
class DrawContext {
public:
    virtual ~DrawContext() = default;

    virtual void clear(Color background) = 0;
    // Multiplies the alpha of everything drawn afterwards.
    virtual void set_global_alpha(double alpha) = 0;

    virtual void draw_line(geometry::Point a, geometry::Point b, Color color, double thickness) = 0;
    // Left-to-right gradient from `start` to `end`.
    virtual void fill_rect_gradient(geometry::Point min, geometry::Point max, Color start, Color end,
        double rounding) = 0;
    virtual void stroke_rect(geometry::Point min, geometry::Point max, Color color, double rounding,
        double thickness) = 0;
    virtual void draw_text(geometry::Point top_left, Color color, const std::string& text,
        double font_size) = 0;
    virtual void draw_text_centered(geometry::Point center, Color color, const std::string& text,
        double font_size) = 0;
};

// Something that can be drawn on. `context()` returns nullptr when no 2D
// context can be obtained.
class DrawSurface {
public:
    virtual ~DrawSurface() = default;

    virtual DrawContext* context() = 0;
    virtual double width() const = 0;
    virtual double height() const = 0;
};

} // namespace service_render
