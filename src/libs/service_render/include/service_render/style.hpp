#pragma once

#include <service_render/draw_context.hpp>
#include <string>

namespace service_render {

struct GradientColors {
    Color start;
    Color end;
};

// Node gradient for a category id; grey for unknown categories.
GradientColors category_colors(const std::string& category);

// Visual constants, world units unless noted.
namespace style {

constexpr double node_rounding = 8.0;
constexpr double font_size = 13.0;
constexpr double heading_font_size = 15.0;
constexpr double heading_offset = 26.0;   // heading baseline above its group

constexpr double connection_width_normal = 1.5;
constexpr double connection_width_highlighted = 3.0;

constexpr double border_width_selected = 3.0;
constexpr double border_width_hovered = 2.0;

constexpr double shadow_offset_normal = 4.0;
constexpr double shadow_offset_active = 6.0;

constexpr Color background = { 26, 26, 31, 255 };
constexpr Color text = { 255, 255, 255, 255 };
constexpr Color heading_text = { 200, 200, 210, 255 };
constexpr Color border_selected = { 255, 255, 255, 255 };
constexpr Color border_hovered = { 255, 255, 255, 153 };
constexpr Color shadow = { 0, 0, 0, 77 };
constexpr Color connection = { 139, 92, 246, 255 };

} // namespace style

} // namespace service_render
