#pragma once

#include <animation/frame_scheduler.hpp>
#include <animation/opacity_animator.hpp>
#include <animation/view_animator.hpp>
#include <canvas/gestures.hpp>
#include <canvas/input_events.hpp>
#include <canvas/navigation.hpp>
#include <canvas/view_config.hpp>
#include <geometry/types.hpp>
#include <service_layout/types.hpp>
#include <service_model/types.hpp>
#include <service_render/draw_context.hpp>
#include <cstddef>
#include <functional>
#include <optional>
#include <string>
#include <vector>

namespace canvas {

// Invoked with (key, service) on selection, ("", empty service) on deselection.
using ServiceClickCallback = std::function<void(const std::string& key, const service_model::Service& service)>;

// Pannable, zoomable view of positioned services and their connections.
// Owns the view transform, selection, hover and gesture state; all mutation
// happens synchronously in the input handlers and in frame callbacks.
class ServiceCanvas {
public:
    // Throws std::runtime_error when the surface has no drawing context.
    ServiceCanvas(service_render::DrawSurface& surface,
        animation::FrameScheduler& scheduler,
        std::vector<service_model::PositionedService> services,
        std::vector<service_model::Connection> connections,
        service_layout::NodeWidthMap node_widths = {},
        std::vector<service_layout::CategoryGroup> category_groups = {},
        ViewConfig config = {});
    ~ServiceCanvas();

    ServiceCanvas(const ServiceCanvas&) = delete;
    ServiceCanvas& operator=(const ServiceCanvas&) = delete;

    void render();

    geometry::CanvasState get_state() const { return state_; }
    // Cancels any view animation; scale is clamped.
    void set_state(const animation::ViewTarget& partial);

    void center_view_on_content(bool animate = true);
    void focus_on_service(const std::string& key, bool animate = true);
    // nullopt deselects; unknown keys are ignored.
    void select_service(const std::optional<std::string>& key);
    void reset_view();

    void set_on_service_click(ServiceClickCallback callback) { on_service_click_ = std::move(callback); }
    const service_layout::NodeWidthMap& get_node_widths() const { return node_widths_; }
    bool is_animating() const { return view_animator_.is_animating(); }

    void navigate_to_next_service();
    void navigate_to_previous_service();
    // Selects the nearest service in `direction`; pans when there is none.
    // Returns true when a service was selected.
    bool navigate_to_service_in_direction(Direction direction);

    void on_pointer_down(const PointerEvent& e);
    void on_pointer_move(const PointerEvent& e);
    void on_pointer_up(const PointerEvent& e);
    void on_pointer_leave(const PointerEvent& e);
    void on_click(const PointerEvent& e);
    void on_wheel(const WheelEvent& e);
    void on_touch_start(const TouchEvent& e);
    void on_touch_move(const TouchEvent& e);
    void on_touch_end(const TouchEvent& e);
    // Returns true when the key was consumed.
    bool on_key_down(const KeyEvent& e);
    void on_resize();

    const std::string& selected_service() const { return selected_; }
    const std::string& hovered_service() const { return hovered_; }
    std::optional<std::string> service_at(const geometry::Point& screen) const;
    double connection_opacity(const std::string& a, const std::string& b) const;
    bool is_connection_animating() const { return opacity_animator_.is_animating(); }
    double fade_alpha() const { return fade_alpha_; }
    bool is_dragging() const { return drag_.active; }
    bool is_pinching() const { return pinch_.active; }
    std::size_t drawn_node_count() const { return drawn_nodes_; }
    std::size_t drawn_connection_count() const { return drawn_connections_; }
    std::size_t valid_connection_count() const { return resolved_connections_.size(); }
    const ViewConfig& config() const { return config_; }

private:
    struct ResolvedConnection {
        std::size_t from = 0;
        std::size_t to = 0;
        std::string key;
    };

    std::optional<std::size_t> index_of(const std::string& key) const;
    double width_of(const std::string& key) const;
    geometry::Point surface_center() const;
    geometry::CanvasState content_view() const;
    geometry::CanvasState pending_state() const;

    void apply_view(const geometry::CanvasState& target, bool animate, double duration_ms);
    void begin_pointer_drag(const geometry::Point& p, double time_ms);
    void release_drag(double time_ms);
    void select_at(const geometry::Point& screen);
    void select_and_focus(std::size_t index);
    void notify_selection();
    void update_connection_targets();
    void update_hover(const geometry::Point& screen);
    void start_fade_in();
    void on_fade_frame(double now_ms);
    void log_overlaps() const;

    service_render::DrawSurface& surface_;
    service_render::DrawContext* context_ = nullptr;
    animation::FrameScheduler& scheduler_;
    std::vector<service_model::PositionedService> services_;
    std::vector<service_model::Connection> connections_;
    service_layout::NodeWidthMap node_widths_;
    std::vector<service_layout::CategoryGroup> category_groups_;
    ViewConfig config_;

    std::vector<geometry::Rect> node_rects_;
    std::vector<geometry::Point> node_centers_;
    std::vector<ResolvedConnection> resolved_connections_;
    std::vector<std::size_t> tab_order_;

    geometry::CanvasState state_;
    animation::ViewAnimator view_animator_;
    animation::OpacityAnimator opacity_animator_;

    std::string selected_;
    std::string hovered_;
    DragState drag_;
    PinchState pinch_;
    bool touch_tap_candidate_ = false;
    ServiceClickCallback on_service_click_;

    double fade_alpha_ = 1.0;
    double fade_start_ms_ = 0.0;
    animation::FrameHandle fade_frame_ = animation::null_frame_handle;

    std::size_t drawn_nodes_ = 0;
    std::size_t drawn_connections_ = 0;
};

} // namespace canvas
