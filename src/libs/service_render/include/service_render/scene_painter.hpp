#pragma once

#include <service_render/draw_context.hpp>
#include <string>

namespace service_render {

// Screen-space description of one node.
struct NodeVisual {
    geometry::Point center;
    double width = 0;    // world units
    double height = 0;   // world units
    double scale = 1.0;
    std::string label;
    std::string category;
    bool selected = false;
    bool hovered = false;
};

void paint_connection(DrawContext& ctx, geometry::Point from, geometry::Point to,
    double opacity, bool highlighted, double scale);

void paint_node(DrawContext& ctx, const NodeVisual& node);

// `group_top_left` in screen space.
void paint_category_heading(DrawContext& ctx, geometry::Point group_top_left,
    const std::string& label, double scale);

} // namespace service_render
