#pragma once

#include <service_render/display_list.hpp>
#include <string>

struct ImDrawList;
struct ImVec2;

namespace service_render {

// Replays a recorded frame into an ImGui draw list: the background fills
// `size` at `origin` (screen position of the surface's top-left corner).
void replay_display_list(ImDrawList* draw_list, const DisplayList& list, const ImVec2& origin,
    const ImVec2& size);

// Label width in pixels with the current ImGui font. Call only when an ImGui
// context is active.
double measure_label_width(const std::string& text);

} // namespace service_render
