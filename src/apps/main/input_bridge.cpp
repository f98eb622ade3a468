#include "input_bridge.hpp"
#include "imgui.h"
#include <SDL3/SDL.h>
#include <algorithm>

namespace app {

namespace {

struct KeyBinding {
    ImGuiKey key;
    canvas::Key canvas_key;
};

const KeyBinding key_bindings[] = {
    { ImGuiKey_LeftArrow, canvas::Key::ArrowLeft },
    { ImGuiKey_RightArrow, canvas::Key::ArrowRight },
    { ImGuiKey_UpArrow, canvas::Key::ArrowUp },
    { ImGuiKey_DownArrow, canvas::Key::ArrowDown },
    { ImGuiKey_Equal, canvas::Key::Plus },
    { ImGuiKey_KeypadAdd, canvas::Key::Plus },
    { ImGuiKey_Minus, canvas::Key::Minus },
    { ImGuiKey_KeypadSubtract, canvas::Key::Minus },
    { ImGuiKey_0, canvas::Key::Zero },
    { ImGuiKey_Keypad0, canvas::Key::Zero },
    { ImGuiKey_Escape, canvas::Key::Escape },
    { ImGuiKey_Tab, canvas::Key::Tab },
};

} // namespace

void InputBridge::process_imgui_frame(float origin_x, float origin_y, float width, float height, double now_ms) {
    const ImGuiIO& io = ImGui::GetIO();
    const geometry::Point mouse{ io.MousePos.x - origin_x, io.MousePos.y - origin_y };
    const bool inside = ImGui::IsWindowHovered() && mouse.x >= 0 && mouse.y >= 0 && mouse.x < width && mouse.y < height;

    // Touch gestures own the canvas while fingers are down.
    if (!touches_.empty()) return;

    if (inside && ImGui::IsMouseClicked(ImGuiMouseButton_Left)) {
        pressed_ = true;
        canvas_.on_pointer_down({ mouse, now_ms });
    }

    const bool moved = mouse.x != last_mouse_.x || mouse.y != last_mouse_.y;
    if (moved && (inside || pressed_))
        canvas_.on_pointer_move({ mouse, now_ms });
    last_mouse_ = mouse;

    if (pressed_ && ImGui::IsMouseReleased(ImGuiMouseButton_Left)) {
        pressed_ = false;
        canvas_.on_pointer_up({ mouse, now_ms });
        if (inside) canvas_.on_click({ mouse, now_ms });
    }

    if (hovered_ && !inside && !pressed_)
        canvas_.on_pointer_leave({ mouse, now_ms });
    hovered_ = inside;

    if (inside && io.MouseWheel != 0.0f)
        canvas_.on_wheel({ mouse, -io.MouseWheel });

    // Called inside the canvas child; focus usually sits on its parent window.
    if (!ImGui::IsWindowFocused(ImGuiFocusedFlags_RootAndChildWindows)) return;
    for (const auto& binding : key_bindings) {
        if (ImGui::IsKeyPressed(binding.key))
            canvas_.on_key_down({ binding.canvas_key, io.KeyShift });
    }
}

void InputBridge::process_sdl_event(const SDL_Event& event, float origin_x, float origin_y,
    float window_width, float window_height, double now_ms)
{
    if (event.type != SDL_EVENT_FINGER_DOWN && event.type != SDL_EVENT_FINGER_MOTION &&
        event.type != SDL_EVENT_FINGER_UP && event.type != SDL_EVENT_FINGER_CANCELED)
        return;

    const auto id = static_cast<std::int64_t>(event.tfinger.fingerID);
    const geometry::Point position{ event.tfinger.x * window_width - origin_x,
                                    event.tfinger.y * window_height - origin_y };
    auto it = std::find_if(touches_.begin(), touches_.end(),
        [id](const canvas::TouchPoint& t) { return t.id == id; });

    switch (event.type) {
    case SDL_EVENT_FINGER_DOWN:
        if (it == touches_.end())
            touches_.push_back({ id, position });
        else
            it->position = position;
        canvas_.on_touch_start(touch_event(now_ms));
        break;
    case SDL_EVENT_FINGER_MOTION:
        if (it == touches_.end()) return;
        it->position = position;
        canvas_.on_touch_move(touch_event(now_ms));
        break;
    default:
        if (it == touches_.end()) return;
        touches_.erase(it);
        canvas_.on_touch_end(touch_event(now_ms));
        break;
    }
}

canvas::TouchEvent InputBridge::touch_event(double now_ms) const {
    canvas::TouchEvent e;
    e.touches = touches_;
    e.time_ms = now_ms;
    return e;
}

} // namespace app
