#include <service_render/imgui_replay.hpp>
#include "imgui.h"
#include <cfloat>

namespace service_render {

namespace {

ImU32 to_imgui(Color c) {
    return IM_COL32(c.r, c.g, c.b, c.a);
}

ImVec2 offset(const ImVec2& origin, geometry::Point p) {
    return ImVec2(origin.x + (float)p.x, origin.y + (float)p.y);
}

} // namespace

void replay_display_list(ImDrawList* draw_list, const DisplayList& list, const ImVec2& origin,
    const ImVec2& size)
{
    if (!draw_list) return;

    draw_list->AddRectFilled(origin, ImVec2(origin.x + size.x, origin.y + size.y), to_imgui(list.background()));
    draw_list->PushClipRect(origin, ImVec2(origin.x + size.x, origin.y + size.y), true);

    ImFont* font = ImGui::GetFont();
    for (const auto& cmd : list.commands()) {
        switch (cmd.kind) {
        case DrawCommandKind::Line:
            draw_list->AddLine(offset(origin, cmd.a), offset(origin, cmd.b), to_imgui(cmd.color), (float)cmd.thickness);
            break;
        case DrawCommandKind::RectGradient: {
            // AddRectFilledMultiColor cannot round: rounded solid caps, gradient between.
            const ImU32 left = to_imgui(cmd.color);
            const ImU32 right = to_imgui(cmd.color_end);
            const ImVec2 min = offset(origin, cmd.a);
            const ImVec2 max = offset(origin, cmd.b);
            const GradientSpan span = split_rounded_gradient(cmd);
            if (span.rounding <= 0.0) {
                draw_list->AddRectFilledMultiColor(min, max, left, right, right, left);
                break;
            }
            const float inner_min = origin.x + (float)span.inner_min_x;
            const float inner_max = origin.x + (float)span.inner_max_x;
            const float r = (float)span.rounding;
            draw_list->AddRectFilled(min, ImVec2(inner_min, max.y), left, r, ImDrawFlags_RoundCornersLeft);
            draw_list->AddRectFilled(ImVec2(inner_max, min.y), max, right, r, ImDrawFlags_RoundCornersRight);
            if (inner_max > inner_min)
                draw_list->AddRectFilledMultiColor(ImVec2(inner_min, min.y), ImVec2(inner_max, max.y),
                    left, right, right, left);
            break;
        }
        case DrawCommandKind::RectStroke:
            draw_list->AddRect(offset(origin, cmd.a), offset(origin, cmd.b), to_imgui(cmd.color),
                (float)cmd.rounding, 0, (float)cmd.thickness);
            break;
        case DrawCommandKind::Text:
            draw_list->AddText(font, (float)cmd.font_size, offset(origin, cmd.a), to_imgui(cmd.color), cmd.text.c_str());
            break;
        case DrawCommandKind::TextCentered: {
            const ImVec2 size = font->CalcTextSizeA((float)cmd.font_size, FLT_MAX, 0.0f, cmd.text.c_str());
            const ImVec2 center = offset(origin, cmd.a);
            draw_list->AddText(font, (float)cmd.font_size, ImVec2(center.x - size.x * 0.5f, center.y - size.y * 0.5f),
                to_imgui(cmd.color), cmd.text.c_str());
            break;
        }
        }
    }
    draw_list->PopClipRect();
}

double measure_label_width(const std::string& text) {
    return ImGui::CalcTextSize(text.c_str()).x;
}

} // namespace service_render
