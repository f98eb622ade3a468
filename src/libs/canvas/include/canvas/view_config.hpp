#pragma once

namespace canvas {

struct ZoomConfig {
    double min_scale = 0.3;
    double max_scale = 3.0;
    double max_fit_content = 1.5;  // upper bound when fitting content to the view
    double wheel_in = 1.1;
    double wheel_out = 0.9;
    double keyboard_step = 0.1;
    double focus_scale = 1.3;
};

// Distances in screen pixels.
struct InteractionConfig {
    double drag_threshold = 5.0;       // below this a press-release is a click
    double pan_step = 50.0;
    double view_padding = 80.0;
    double culling_padding = 100.0;
    double navigation_threshold = 10.0;
    double perpendicular_weight = 0.5;
};

struct MomentumConfig {
    double velocity_threshold = 0.15;  // px per ms
    double multiplier = 180.0;
    double smoothing = 0.3;            // weight of the newest sample
    double release_idle_ms = 100.0;    // no momentum after the pointer rested this long
};

// Milliseconds.
struct AnimationDurations {
    double fade_in = 800.0;
    double connection = 300.0;
    double wheel_zoom = 120.0;
    double keyboard_zoom = 150.0;
    double keyboard_pan = 150.0;
    double view_transition = 400.0;
    double momentum = 600.0;
};

struct ConnectionOpacity {
    double normal = 0.3;
    double highlighted = 0.8;
    double dimmed = 0.1;
};

struct ViewConfig {
    ZoomConfig zoom;
    InteractionConfig interaction;
    MomentumConfig momentum;
    AnimationDurations durations;
    ConnectionOpacity opacity;
    double node_height = 40.0;
    double default_node_width = 120.0;
};

} // namespace canvas
