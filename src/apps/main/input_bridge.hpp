#pragma once

#include <canvas/canvas.hpp>
#include <canvas/input_events.hpp>
#include <cstdint>
#include <vector>

union SDL_Event;

namespace app {

// Turns ImGui mouse/keyboard state and SDL finger events into canvas input
// events. Positions are translated into surface coordinates.
class InputBridge {
public:
    explicit InputBridge(canvas::ServiceCanvas& canvas)
        : canvas_(canvas)
    {
    }

    // Call once per frame from inside the canvas child window, before the
    // canvas is replayed. `origin`/`size` describe the surface on screen.
    void process_imgui_frame(float origin_x, float origin_y, float width, float height, double now_ms);

    // Finger events; the others are ignored. Window size is in logical pixels.
    void process_sdl_event(const SDL_Event& event, float origin_x, float origin_y,
        float window_width, float window_height, double now_ms);

private:
    canvas::TouchEvent touch_event(double now_ms) const;

    canvas::ServiceCanvas& canvas_;
    bool hovered_ = false;
    bool pressed_ = false;
    geometry::Point last_mouse_;
    std::vector<canvas::TouchPoint> touches_;
};

} // namespace app
