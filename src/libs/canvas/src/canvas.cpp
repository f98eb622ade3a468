#include <canvas/canvas.hpp>
#include <canvas/hit_test.hpp>
#include <animation/easing.hpp>
#include <geometry/transform.hpp>
#include <service_layout/layout_engine.hpp>
#include <service_model/categories.hpp>
#include <service_render/scene_painter.hpp>
#include <service_render/style.hpp>
#include <spdlog/sinks/basic_file_sink.h>
#include <spdlog/spdlog.h>
#include <algorithm>
#include <filesystem>
#include <memory>
#include <stdexcept>
#include <unordered_map>

namespace {

std::filesystem::path find_project_root() {
    std::filesystem::path p = std::filesystem::current_path();
    for (int i = 0; i < 8; ++i) {
        if (std::filesystem::exists(p / "CMakeLists.txt") && std::filesystem::exists(p / "src")) {
            return p;
        }
        if (!p.has_parent_path()) break;
        p = p.parent_path();
    }
    return std::filesystem::current_path();
}

std::shared_ptr<spdlog::logger> canvas_logger() {
    static std::shared_ptr<spdlog::logger> logger;
    if (logger) return logger;

    try {
        const std::filesystem::path logs_dir = find_project_root() / "logs";
        std::filesystem::create_directories(logs_dir);
        const std::filesystem::path log_file = logs_dir / "service_canvas_latest.log";
        logger = spdlog::basic_logger_mt("service_canvas", log_file.string(), true);
        logger->set_level(spdlog::level::debug);
        logger->flush_on(spdlog::level::warn);
        logger->set_pattern("[%Y-%m-%d %H:%M:%S.%e] [%l] %v");
        logger->info("Canvas logger initialized. file={}", log_file.string());
    } catch (const spdlog::spdlog_ex&) {
        logger = spdlog::default_logger();
    } catch (const std::filesystem::filesystem_error&) {
        logger = spdlog::default_logger();
    }
    return logger;
}

std::string pair_key(const std::string& a, const std::string& b) {
    if (a < b) return a + "|" + b;
    return b + "|" + a;
}

const service_model::Service& empty_service() {
    static const service_model::Service empty;
    return empty;
}

} // namespace

namespace canvas {

ServiceCanvas::ServiceCanvas(service_render::DrawSurface& surface,
    animation::FrameScheduler& scheduler,
    std::vector<service_model::PositionedService> services,
    std::vector<service_model::Connection> connections,
    service_layout::NodeWidthMap node_widths,
    std::vector<service_layout::CategoryGroup> category_groups,
    ViewConfig config)
    : surface_(surface)
    , context_(surface.context())
    , scheduler_(scheduler)
    , services_(std::move(services))
    , connections_(std::move(connections))
    , node_widths_(std::move(node_widths))
    , category_groups_(std::move(category_groups))
    , config_(config)
    , view_animator_(scheduler, state_)
    , opacity_animator_(scheduler)
{
    if (!context_) {
        throw std::runtime_error("Could not get a 2D drawing context from the surface");
    }

    auto logger = canvas_logger();

    node_rects_.reserve(services_.size());
    node_centers_.reserve(services_.size());
    std::unordered_map<std::string, std::size_t> index;
    for (std::size_t i = 0; i < services_.size(); ++i) {
        const auto& s = services_[i];
        const geometry::Point center{ s.x, s.y };
        node_centers_.push_back(center);
        node_rects_.push_back(geometry::rect_around(center, width_of(s.service.key), config_.node_height));
        index.emplace(s.service.key, i);
    }

    for (const auto& c : connections_) {
        auto from = index.find(c.from);
        auto to = index.find(c.to);
        if (from == index.end() || to == index.end()) {
            logger->warn("connection_skipped from={} to={} reason=unknown_service", c.from, c.to);
            continue;
        }
        resolved_connections_.push_back(ResolvedConnection{ from->second, to->second, pair_key(c.from, c.to) });
    }

    tab_order_ = tab_order(services_);
    log_overlaps();

    view_animator_.set_on_update([this] { render(); });
    opacity_animator_.set_on_update([this] { render(); });
    opacity_animator_.set_duration(config_.durations.connection);
    for (const auto& rc : resolved_connections_)
        opacity_animator_.set_immediate(rc.key, config_.opacity.normal);

    logger->info("canvas_created services={} connections={} skipped_connections={} groups={}",
        services_.size(), resolved_connections_.size(),
        connections_.size() - resolved_connections_.size(), category_groups_.size());

    state_ = content_view();
    start_fade_in();
    render();
}

ServiceCanvas::~ServiceCanvas() {
    if (fade_frame_ != animation::null_frame_handle)
        scheduler_.cancel(fade_frame_);
}

std::optional<std::size_t> ServiceCanvas::index_of(const std::string& key) const {
    for (std::size_t i = 0; i < services_.size(); ++i) {
        if (services_[i].service.key == key) return i;
    }
    return std::nullopt;
}

double ServiceCanvas::width_of(const std::string& key) const {
    auto it = node_widths_.find(key);
    if (it != node_widths_.end()) return it->second;
    return config_.default_node_width;
}

geometry::Point ServiceCanvas::surface_center() const {
    return { surface_.width() * 0.5, surface_.height() * 0.5 };
}

geometry::CanvasState ServiceCanvas::content_view() const {
    const geometry::Point center = surface_center();
    geometry::CanvasState view;
    if (node_rects_.empty()) {
        view.scale = 1.0;
        view.translate_x = center.x;
        view.translate_y = center.y;
        return view;
    }

    double min_x = node_rects_.front().left();
    double max_x = node_rects_.front().right();
    double min_y = node_rects_.front().top();
    double max_y = node_rects_.front().bottom();
    for (const auto& r : node_rects_) {
        min_x = std::min(min_x, r.left());
        max_x = std::max(max_x, r.right());
        min_y = std::min(min_y, r.top());
        max_y = std::max(max_y, r.bottom());
    }

    const double content_w = std::max(1.0, max_x - min_x);
    const double content_h = std::max(1.0, max_y - min_y);
    const double avail_w = std::max(1.0, surface_.width() - 2.0 * config_.interaction.view_padding);
    const double avail_h = std::max(1.0, surface_.height() - 2.0 * config_.interaction.view_padding);

    double scale = std::min({ avail_w / content_w, avail_h / content_h, config_.zoom.max_fit_content });
    scale = geometry::clamp_scale(scale, config_.zoom.min_scale, config_.zoom.max_scale);

    view.scale = scale;
    view.translate_x = center.x - (min_x + max_x) * 0.5 * scale;
    view.translate_y = center.y - (min_y + max_y) * 0.5 * scale;
    return view;
}

// Where the view is heading: the in-flight job's end state, else the live state.
geometry::CanvasState ServiceCanvas::pending_state() const {
    auto target = view_animator_.target_state();
    return target ? *target : state_;
}

void ServiceCanvas::apply_view(const geometry::CanvasState& target, bool animate, double duration_ms) {
    if (animate) {
        view_animator_.animate_to(animation::ViewTarget::from_state(target), duration_ms);
        return;
    }
    view_animator_.cancel();
    state_ = target;
    render();
}

void ServiceCanvas::render() {
    service_render::DrawContext* ctx = context_;
    if (!ctx) return;

    ctx->clear(service_render::style::background);
    ctx->set_global_alpha(fade_alpha_);

    const geometry::Rect view = geometry::visible_world_rect(state_, surface_.width(), surface_.height(),
        config_.interaction.culling_padding);

    for (const auto& group : category_groups_) {
        const geometry::Point top_left = geometry::world_to_screen({ group.rect.x, group.rect.y }, state_);
        service_render::paint_category_heading(*ctx, top_left,
            service_model::category_label(group.category), state_.scale);
    }

    drawn_connections_ = 0;
    for (const auto& rc : resolved_connections_) {
        const geometry::Point a = node_centers_[rc.from];
        const geometry::Point b = node_centers_[rc.to];
        if (!geometry::intersects(geometry::bounding_rect(a, b), view)) continue;

        const bool highlighted = !selected_.empty() &&
            (services_[rc.from].service.key == selected_ || services_[rc.to].service.key == selected_);
        service_render::paint_connection(*ctx,
            geometry::world_to_screen(a, state_), geometry::world_to_screen(b, state_),
            opacity_animator_.get_current(rc.key, config_.opacity.normal), highlighted, state_.scale);
        ++drawn_connections_;
    }

    drawn_nodes_ = 0;
    for (std::size_t i : visible_nodes(node_rects_, view)) {
        const auto& s = services_[i].service;
        service_render::NodeVisual node;
        node.center = geometry::world_to_screen(node_centers_[i], state_);
        node.width = node_rects_[i].width;
        node.height = node_rects_[i].height;
        node.scale = state_.scale;
        node.label = s.name;
        node.category = s.category;
        node.selected = s.key == selected_;
        node.hovered = s.key == hovered_;
        service_render::paint_node(*ctx, node);
        ++drawn_nodes_;
    }
}

void ServiceCanvas::set_state(const animation::ViewTarget& partial) {
    view_animator_.cancel();
    if (partial.scale)
        state_.scale = geometry::clamp_scale(*partial.scale, config_.zoom.min_scale, config_.zoom.max_scale);
    if (partial.translate_x) state_.translate_x = *partial.translate_x;
    if (partial.translate_y) state_.translate_y = *partial.translate_y;
    render();
}

void ServiceCanvas::center_view_on_content(bool animate) {
    apply_view(content_view(), animate, config_.durations.view_transition);
}

void ServiceCanvas::focus_on_service(const std::string& key, bool animate) {
    const auto index = index_of(key);
    if (!index) return;

    selected_ = key;
    update_connection_targets();

    const double scale = geometry::clamp_scale(config_.zoom.focus_scale, config_.zoom.min_scale, config_.zoom.max_scale);
    const geometry::Point center = surface_center();
    geometry::CanvasState target;
    target.scale = scale;
    target.translate_x = center.x - node_centers_[*index].x * scale;
    target.translate_y = center.y - node_centers_[*index].y * scale;
    apply_view(target, animate, config_.durations.view_transition);
    if (animate) render();
}

void ServiceCanvas::select_service(const std::optional<std::string>& key) {
    if (key && !index_of(*key)) return;
    const std::string next = key ? *key : std::string();
    if (next != selected_)
        canvas_logger()->debug("selection_changed from={} to={}", selected_, next);
    selected_ = next;
    update_connection_targets();
    render();
}

void ServiceCanvas::reset_view() {
    selected_.clear();
    hovered_.clear();
    update_connection_targets();
    center_view_on_content(true);
    render();
}

void ServiceCanvas::update_connection_targets() {
    for (const auto& rc : resolved_connections_) {
        double target = config_.opacity.normal;
        if (!selected_.empty()) {
            const bool touches = services_[rc.from].service.key == selected_ ||
                                 services_[rc.to].service.key == selected_;
            target = touches ? config_.opacity.highlighted : config_.opacity.dimmed;
        }
        opacity_animator_.set_target(rc.key, target);
    }
    opacity_animator_.start();
}

double ServiceCanvas::connection_opacity(const std::string& a, const std::string& b) const {
    return opacity_animator_.get_current(pair_key(a, b), config_.opacity.normal);
}

std::optional<std::string> ServiceCanvas::service_at(const geometry::Point& screen) const {
    const auto hit = hit_test(node_rects_, geometry::screen_to_world(screen, state_));
    if (!hit) return std::nullopt;
    return services_[*hit].service.key;
}

void ServiceCanvas::notify_selection() {
    if (!on_service_click_) return;
    if (selected_.empty()) {
        on_service_click_(std::string(), empty_service());
        return;
    }
    const auto index = index_of(selected_);
    if (index) on_service_click_(selected_, services_[*index].service);
}

void ServiceCanvas::select_at(const geometry::Point& screen) {
    const auto key = service_at(screen);
    if (key)
        select_service(*key);
    else
        select_service(std::nullopt);
    notify_selection();
}

void ServiceCanvas::select_and_focus(std::size_t index) {
    const std::string& key = services_[index].service.key;
    canvas_logger()->debug("selection_changed from={} to={}", selected_, key);
    focus_on_service(key, true);
    notify_selection();
}

void ServiceCanvas::navigate_to_next_service() {
    if (tab_order_.empty()) return;
    std::size_t pos = 0;
    if (const auto current = index_of(selected_)) {
        auto it = std::find(tab_order_.begin(), tab_order_.end(), *current);
        pos = (static_cast<std::size_t>(it - tab_order_.begin()) + 1) % tab_order_.size();
    }
    select_and_focus(tab_order_[pos]);
}

void ServiceCanvas::navigate_to_previous_service() {
    if (tab_order_.empty()) return;
    std::size_t pos = tab_order_.size() - 1;
    if (const auto current = index_of(selected_)) {
        auto it = std::find(tab_order_.begin(), tab_order_.end(), *current);
        const auto at = static_cast<std::size_t>(it - tab_order_.begin());
        pos = (at + tab_order_.size() - 1) % tab_order_.size();
    }
    select_and_focus(tab_order_[pos]);
}

bool ServiceCanvas::navigate_to_service_in_direction(Direction direction) {
    if (const auto current = index_of(selected_)) {
        const auto found = find_in_direction(node_centers_, *current, direction,
            config_.interaction.navigation_threshold, config_.interaction.perpendicular_weight);
        if (found) {
            select_and_focus(*found);
            return true;
        }
    }
    const geometry::Point delta = pan_delta(direction, config_.interaction.pan_step);
    apply_view(pan_by(pending_state(), delta.x, delta.y), true, config_.durations.keyboard_pan);
    return false;
}

void ServiceCanvas::begin_pointer_drag(const geometry::Point& p, double time_ms) {
    view_animator_.cancel();
    drag_ = begin_drag(p, time_ms);
}

void ServiceCanvas::release_drag(double time_ms) {
    if (!drag_.active) return;
    drag_.active = false;
    const auto target = momentum_target(drag_, state_, time_ms, config_.momentum);
    if (target)
        view_animator_.animate_to(animation::ViewTarget::from_state(*target), config_.durations.momentum);
}

void ServiceCanvas::update_hover(const geometry::Point& screen) {
    const auto key = service_at(screen);
    const std::string next = key ? *key : std::string();
    if (next == hovered_) return;
    hovered_ = next;
    render();
}

void ServiceCanvas::on_pointer_down(const PointerEvent& e) {
    begin_pointer_drag(e.position, e.time_ms);
}

void ServiceCanvas::on_pointer_move(const PointerEvent& e) {
    if (!drag_.active) {
        update_hover(e.position);
        return;
    }
    const DragStep step = drag_move(drag_, state_, e.position, e.time_ms, config_.momentum.smoothing);
    drag_ = step.drag;
    state_ = step.view;
    render();
}

void ServiceCanvas::on_pointer_up(const PointerEvent& e) {
    release_drag(e.time_ms);
}

void ServiceCanvas::on_pointer_leave(const PointerEvent& e) {
    release_drag(e.time_ms);
    if (!hovered_.empty()) {
        hovered_.clear();
        render();
    }
}

void ServiceCanvas::on_click(const PointerEvent& e) {
    if (!is_tap(drag_, config_.interaction.drag_threshold)) return;
    select_at(e.position);
}

void ServiceCanvas::on_wheel(const WheelEvent& e) {
    // A gesture owns state_ frame by frame; zoom in place so its deltas are kept.
    if (drag_.active || pinch_.active) {
        state_ = wheel_zoom(state_, e.position, e.delta_y, config_.zoom);
        render();
        return;
    }
    // Retarget from the in-flight end state so rapid notches accumulate.
    const geometry::CanvasState target = wheel_zoom(pending_state(), e.position, e.delta_y, config_.zoom);
    view_animator_.animate_to(animation::ViewTarget::from_state(target), config_.durations.wheel_zoom);
}

void ServiceCanvas::on_touch_start(const TouchEvent& e) {
    view_animator_.cancel();
    if (e.touches.size() == 1) {
        drag_ = begin_drag(e.touches[0].position, e.time_ms);
        pinch_ = PinchState{};
        touch_tap_candidate_ = true;
    } else if (e.touches.size() >= 2) {
        drag_.active = false;
        pinch_ = begin_pinch(e.touches[0].position, e.touches[1].position);
        touch_tap_candidate_ = false;
    }
}

void ServiceCanvas::on_touch_move(const TouchEvent& e) {
    if (pinch_.active && e.touches.size() >= 2) {
        const PinchStep step = pinch_move(pinch_, state_, e.touches[0].position, e.touches[1].position, config_.zoom);
        pinch_ = step.pinch;
        state_ = step.view;
        render();
        return;
    }
    if (drag_.active && e.touches.size() == 1) {
        const DragStep step = drag_move(drag_, state_, e.touches[0].position, e.time_ms, config_.momentum.smoothing);
        drag_ = step.drag;
        state_ = step.view;
        render();
    }
}

void ServiceCanvas::on_touch_end(const TouchEvent& e) {
    if (pinch_.active) {
        if (e.touches.size() >= 2) return;
        pinch_ = PinchState{};
        if (e.touches.size() == 1)
            drag_ = begin_drag(e.touches[0].position, e.time_ms);
        return;
    }
    if (!drag_.active || !e.touches.empty()) return;

    const geometry::Point last = drag_.last;
    release_drag(e.time_ms);
    if (touch_tap_candidate_ && is_tap(drag_, config_.interaction.drag_threshold))
        select_at(last);
    touch_tap_candidate_ = false;
}

bool ServiceCanvas::on_key_down(const KeyEvent& e) {
    const geometry::Point center = surface_center();
    switch (e.key) {
    case Key::ArrowLeft:
        navigate_to_service_in_direction(Direction::Left);
        return true;
    case Key::ArrowRight:
        navigate_to_service_in_direction(Direction::Right);
        return true;
    case Key::ArrowUp:
        navigate_to_service_in_direction(Direction::Up);
        return true;
    case Key::ArrowDown:
        navigate_to_service_in_direction(Direction::Down);
        return true;
    case Key::Plus:
        apply_view(zoom_by(pending_state(), center, 1.0 + config_.zoom.keyboard_step, config_.zoom),
            true, config_.durations.keyboard_zoom);
        return true;
    case Key::Minus:
        apply_view(zoom_by(pending_state(), center, 1.0 - config_.zoom.keyboard_step, config_.zoom),
            true, config_.durations.keyboard_zoom);
        return true;
    case Key::Zero:
        center_view_on_content(true);
        return true;
    case Key::Escape:
        if (selected_.empty()) return false;
        select_service(std::nullopt);
        notify_selection();
        return true;
    case Key::Tab:
        if (e.shift)
            navigate_to_previous_service();
        else
            navigate_to_next_service();
        return true;
    case Key::Other:
        break;
    }
    return false;
}

void ServiceCanvas::on_resize() {
    render();
}

void ServiceCanvas::start_fade_in() {
    if (config_.durations.fade_in <= 0.0) {
        fade_alpha_ = 1.0;
        return;
    }
    fade_alpha_ = 0.0;
    fade_start_ms_ = scheduler_.now();
    fade_frame_ = scheduler_.schedule([this](double now_ms) { on_fade_frame(now_ms); });
}

void ServiceCanvas::on_fade_frame(double now_ms) {
    fade_frame_ = animation::null_frame_handle;
    const double progress = animation::clamp01((now_ms - fade_start_ms_) / config_.durations.fade_in);
    fade_alpha_ = animation::ease_out_cubic(progress);
    if (progress < 1.0)
        fade_frame_ = scheduler_.schedule([this](double t) { on_fade_frame(t); });
    render();
}

void ServiceCanvas::log_overlaps() const {
    std::vector<service_layout::PositionedNode> nodes;
    nodes.reserve(services_.size());
    for (std::size_t i = 0; i < services_.size(); ++i) {
        service_layout::PositionedNode n;
        n.id = services_[i].service.key;
        n.category = services_[i].service.category;
        n.x = node_centers_[i].x;
        n.y = node_centers_[i].y;
        n.width = node_rects_[i].width;
        nodes.push_back(std::move(n));
    }

    auto logger = canvas_logger();
    for (const auto& [a, b] : service_layout::validate_all(nodes, config_.node_height)) {
        const auto& ra = node_rects_[*index_of(a)];
        const auto& rb = node_rects_[*index_of(b)];
        logger->warn(
            "overlap_detected pair={} a={} b={} "
            "a_rect=({}, {}, {}, {}) b_rect=({}, {}, {}, {})",
            pair_key(a, b), a, b,
            ra.x, ra.y, ra.width, ra.height,
            rb.x, rb.y, rb.width, rb.height);
    }
}

} // namespace canvas
