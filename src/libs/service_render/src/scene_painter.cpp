#include <service_render/scene_painter.hpp>
#include <service_render/style.hpp>

namespace service_render {

void paint_connection(DrawContext& ctx, geometry::Point from, geometry::Point to,
    double opacity, bool highlighted, double scale)
{
    const double width = highlighted ? style::connection_width_highlighted : style::connection_width_normal;
    ctx.draw_line(from, to, with_alpha(style::connection, opacity), width * scale);
}

void paint_node(DrawContext& ctx, const NodeVisual& node) {
    const double half_w = node.width * node.scale * 0.5;
    const double half_h = node.height * node.scale * 0.5;
    const geometry::Point min{ node.center.x - half_w, node.center.y - half_h };
    const geometry::Point max{ node.center.x + half_w, node.center.y + half_h };
    const double rounding = style::node_rounding * node.scale;
    const bool active = node.selected || node.hovered;

    // Drop shadow, offset downwards.
    const double shadow_dy = (active ? style::shadow_offset_active : style::shadow_offset_normal) * node.scale;
    ctx.fill_rect_gradient({ min.x, min.y + shadow_dy }, { max.x, max.y + shadow_dy },
        style::shadow, style::shadow, rounding);

    const GradientColors colors = category_colors(node.category);
    ctx.fill_rect_gradient(min, max, colors.start, colors.end, rounding);

    if (node.selected) {
        ctx.stroke_rect(min, max, style::border_selected, rounding, style::border_width_selected * node.scale);
    } else if (node.hovered) {
        ctx.stroke_rect(min, max, style::border_hovered, rounding, style::border_width_hovered * node.scale);
    }

    if (!node.label.empty())
        ctx.draw_text_centered(node.center, style::text, node.label, style::font_size * node.scale);
}

void paint_category_heading(DrawContext& ctx, geometry::Point group_top_left,
    const std::string& label, double scale)
{
    if (label.empty()) return;
    ctx.draw_text({ group_top_left.x, group_top_left.y - style::heading_offset * scale },
        style::heading_text, label, style::heading_font_size * scale);
}

} // namespace service_render
