#pragma once

#include <service_render/draw_context.hpp>
#include <functional>
#include <string>
#include <vector>

namespace service_render {

enum class DrawCommandKind {
    Line,
    RectGradient,
    RectStroke,
    Text,
    TextCentered
};

struct DrawCommand {
    DrawCommandKind kind = DrawCommandKind::Line;
    geometry::Point a;          // line start / rect min / text anchor
    geometry::Point b;          // line end / rect max
    Color color;                // line, stroke, text, gradient start
    Color color_end;            // gradient end
    double thickness = 1.0;
    double rounding = 0.0;
    double font_size = 0.0;
    std::string text;
};

// How a backend without rounded gradient fills draws a rounded
// RectGradient: solid rounded caps of width `rounding` in the start and end
// colours at the sides, a square gradient over [inner_min_x, inner_max_x].
struct GradientSpan {
    double rounding = 0;
    double inner_min_x = 0;
    double inner_max_x = 0;
};

GradientSpan split_rounded_gradient(const DrawCommand& cmd);

// Retained DrawContext: every frame `clear()` drops the previous commands,
// a backend replays the list. Global alpha is baked into the recorded colours.
class DisplayList : public DrawContext {
public:
    void clear(Color background) override;
    void set_global_alpha(double alpha) override;
    void draw_line(geometry::Point a, geometry::Point b, Color color, double thickness) override;
    void fill_rect_gradient(geometry::Point min, geometry::Point max, Color start, Color end,
        double rounding) override;
    void stroke_rect(geometry::Point min, geometry::Point max, Color color, double rounding,
        double thickness) override;
    void draw_text(geometry::Point top_left, Color color, const std::string& text,
        double font_size) override;
    void draw_text_centered(geometry::Point center, Color color, const std::string& text,
        double font_size) override;

    const std::vector<DrawCommand>& commands() const { return commands_; }
    Color background() const { return background_; }
    double global_alpha() const { return global_alpha_; }
    std::size_t clear_count() const { return clear_count_; }

    std::size_t count(DrawCommandKind kind) const;

private:
    std::vector<DrawCommand> commands_;
    Color background_;
    double global_alpha_ = 1.0;
    std::size_t clear_count_ = 0;
};

// Fixed-size surface backed by a DisplayList; resized by the host window.
class DisplayListSurface : public DrawSurface {
public:
    DisplayListSurface(double width, double height);

    DrawContext* context() override { return &list_; }
    double width() const override { return width_; }
    double height() const override { return height_; }

    void resize(double width, double height);
    const DisplayList& display_list() const { return list_; }

private:
    DisplayList list_;
    double width_ = 0;
    double height_ = 0;
};

} // namespace service_render
