// Service map viewer: ImGui + SDL3 + OpenGL3 (C++20)
#define SDL_MAIN_HANDLED

#include "imgui.h"
#include "imgui_impl_sdl3.h"
#include "imgui_impl_opengl3.h"
#include "input_bridge.hpp"
#include <animation/frame_scheduler.hpp>
#include <canvas/canvas.hpp>
#include <service_layout/layout_engine.hpp>
#include <service_layout/node_widths.hpp>
#include <service_loaders/builtin_catalog.hpp>
#include <service_loaders/json_loader.hpp>
#include <service_render/display_list.hpp>
#include <service_render/imgui_replay.hpp>
#include <SDL3/SDL.h>
#include <SDL3/SDL_main.h>
#include <SDL3/SDL_opengl.h>
#include <spdlog/spdlog.h>
#include <cstdio>
#include <optional>
#include <stdexcept>
#include <string>
#include <vector>

namespace {

service_model::ServiceCatalog load_catalog(const std::string& data_path) {
    std::vector<std::string> paths;
    if (!data_path.empty()) paths.push_back(data_path);
    paths.push_back("data/services.json");

    for (const auto& path : paths) {
        auto loaded = service_loaders::load_catalog_from_json_file(path);
        if (loaded) {
            spdlog::info("Loaded catalog '{}' from {} ({} services, {} connections)",
                loaded->name, path, loaded->services.size(), loaded->connections.size());
            return std::move(*loaded);
        }
        spdlog::warn("Could not load catalog from {}", path);
    }
    spdlog::info("Using built-in catalog");
    return service_loaders::generate_builtin_catalog();
}

// Without a font atlas: an average glyph advance of the default UI font.
double estimate_label_width(const std::string& text) {
    return static_cast<double>(text.size()) * 7.5;
}

int run_self_test(const service_model::ServiceCatalog& catalog) {
    const service_layout::LayoutConfig config;
    const auto widths = service_layout::compute_node_widths(catalog.services, estimate_label_width);
    const auto layout = service_layout::compute_layout(service_layout::make_layout_nodes(catalog, widths, config), config);
    const auto overlaps = service_layout::validate_all(layout.nodes, config.node_height);
    for (const auto& [a, b] : overlaps)
        spdlog::error("[self-test] overlap {} / {}", a, b);
    (void)fprintf(stderr, "[self-test] nodes=%zu groups=%zu overlap_count=%zu\n",
        layout.nodes.size(), layout.groups.size(), overlaps.size());
    return overlaps.empty() ? 0 : 2;
}

void draw_selection_panel(const service_model::ServiceCatalog& catalog, const std::string& selected) {
    const service_model::Service* service = catalog.find(selected);
    if (!service) return;

    ImGui::SetNextWindowPos(ImVec2(16, 16), ImGuiCond_Always);
    ImGui::SetNextWindowSize(ImVec2(340, 0), ImGuiCond_Always);
    ImGui::SetNextWindowBgAlpha(0.85f);
    ImGui::Begin("##service_info", nullptr,
        ImGuiWindowFlags_NoDecoration | ImGuiWindowFlags_NoMove | ImGuiWindowFlags_NoFocusOnAppearing
        | ImGuiWindowFlags_NoNav | ImGuiWindowFlags_AlwaysAutoResize);
    ImGui::TextUnformatted(service->name.c_str());
    ImGui::Separator();
    ImGui::TextWrapped("%s", service->description.c_str());
    for (const auto& point : service->key_points)
        ImGui::BulletText("%s", point.c_str());
    ImGui::End();
}

// Service the "Focus networking" button jumps to.
constexpr const char* networking_focus_key = "vpc";

void draw_view_controls(canvas::ServiceCanvas& service_canvas, const service_model::ServiceCatalog& catalog,
    const ImVec2& display_size)
{
    ImGui::SetNextWindowPos(ImVec2(display_size.x - 16, 16), ImGuiCond_Always, ImVec2(1, 0));
    ImGui::SetNextWindowBgAlpha(0.85f);
    ImGui::Begin("##view_controls", nullptr,
        ImGuiWindowFlags_NoDecoration | ImGuiWindowFlags_NoMove | ImGuiWindowFlags_NoFocusOnAppearing
        | ImGuiWindowFlags_NoNav | ImGuiWindowFlags_AlwaysAutoResize);
    bool clicked = false;
    if (ImGui::Button("Reset view")) {
        service_canvas.reset_view();
        clicked = true;
    }
    if (catalog.find(networking_focus_key)) {
        ImGui::SameLine();
        if (ImGui::Button("Focus networking")) {
            service_canvas.focus_on_service(networking_focus_key);
            clicked = true;
        }
    }
    ImGui::End();
    // Keyboard input goes to the canvas only while its window has focus.
    if (clicked)
        ImGui::SetWindowFocus("Service Map");
}

} // namespace

int main(int argc, char* argv[])
{
    bool self_test = false;
    std::string data_path;
    for (int i = 1; i < argc; ++i) {
        const std::string arg(argv[i]);
        if (arg == "--self-test") {
            self_test = true;
        } else if (arg == "--data" && i + 1 < argc) {
            data_path = argv[++i];
        }
    }

    const service_model::ServiceCatalog catalog = load_catalog(data_path);
    if (self_test)
        return run_self_test(catalog);

    SDL_SetMainReady();
    // Finger events drive the canvas directly; no synthetic mouse events.
    SDL_SetHint(SDL_HINT_TOUCH_MOUSE_EVENTS, "0");
    // SDL3: SDL_Init returns true on success, false on failure
    if (!SDL_Init(SDL_INIT_VIDEO | SDL_INIT_EVENTS)) {
        (void)fprintf(stderr, "SDL_Init failed: %s\n", SDL_GetError());
        return 1;
    }

    SDL_GL_SetAttribute(SDL_GL_CONTEXT_MAJOR_VERSION, 3);
    SDL_GL_SetAttribute(SDL_GL_CONTEXT_MINOR_VERSION, 0);
    SDL_GL_SetAttribute(SDL_GL_CONTEXT_PROFILE_MASK, SDL_GL_CONTEXT_PROFILE_CORE);

    // Default fallback if display bounds are unavailable.
    int window_width = 1280;
    int window_height = 720;
    {
        SDL_Rect bounds{};
        if (SDL_GetDisplayUsableBounds(SDL_GetPrimaryDisplay(), &bounds)) {
            window_width = bounds.w * 2 / 3;
            window_height = bounds.h * 2 / 3;
        }
    }
    const SDL_WindowFlags window_flags = SDL_WINDOW_OPENGL | SDL_WINDOW_RESIZABLE
        | SDL_WINDOW_HIGH_PIXEL_DENSITY;
    SDL_Window* window = SDL_CreateWindow(catalog.name.empty() ? "Service Map" : catalog.name.c_str(),
        window_width, window_height, window_flags);
    if (!window) {
        (void)fprintf(stderr, "SDL_CreateWindow failed: %s\n", SDL_GetError());
        SDL_Quit();
        return 1;
    }

    SDL_GLContext gl_context = SDL_GL_CreateContext(window);
    if (!gl_context) {
        (void)fprintf(stderr, "SDL_GL_CreateContext failed: %s\n", SDL_GetError());
        SDL_DestroyWindow(window);
        SDL_Quit();
        return 1;
    }

    IMGUI_CHECKVERSION();
    ImGui::CreateContext();
    ImGuiIO& io = ImGui::GetIO();
    // Keyboard navigation stays off: arrows and Tab belong to the canvas.
    io.ConfigFlags |= ImGuiConfigFlags_DpiEnableScaleFonts;
    io.ConfigFlags |= ImGuiConfigFlags_DpiEnableScaleViewports;

    ImGui::StyleColorsDark();

    ImFontConfig font_cfg;
    font_cfg.OversampleH = 2;
    font_cfg.OversampleV = 2;
    font_cfg.PixelSnapH = true;
    const float font_size_px = 14.0f;
    const char* font_paths[] = {
        "/usr/share/fonts/truetype/dejavu/DejaVuSans.ttf",
        "/usr/share/fonts/truetype/liberation/LiberationSans-Regular.ttf",
        "/usr/share/fonts/TTF/DejaVuSans.ttf",
    };
    for (const char* path : font_paths) {
        if (io.Fonts->AddFontFromFileTTF(path, font_size_px, &font_cfg) != nullptr)
            break;
    }

    ImGui_ImplSDL3_InitForOpenGL(window, gl_context);
    ImGui_ImplOpenGL3_Init("#version 130");

    // Text measurement needs a current font, which only exists inside a frame.
    ImGui_ImplOpenGL3_NewFrame();
    ImGui_ImplSDL3_NewFrame();
    ImGui::NewFrame();
    const auto widths = service_layout::compute_node_widths(catalog.services, service_render::measure_label_width);
    ImGui::EndFrame();

    const service_layout::LayoutConfig layout_config;
    const auto layout = service_layout::compute_layout(
        service_layout::make_layout_nodes(catalog, widths, layout_config), layout_config);

    service_render::DisplayListSurface surface(window_width, window_height);
    animation::FrameQueue frames(static_cast<double>(SDL_GetTicks()));

    std::optional<canvas::ServiceCanvas> service_canvas;
    try {
        service_canvas.emplace(surface, frames, service_layout::apply_layout(catalog, layout),
            catalog.connections, widths, layout.groups);
    } catch (const std::runtime_error& e) {
        (void)fprintf(stderr, "Canvas creation failed: %s\n", e.what());
        ImGui_ImplOpenGL3_Shutdown();
        ImGui_ImplSDL3_Shutdown();
        ImGui::DestroyContext();
        SDL_GL_DestroyContext(gl_context);
        SDL_DestroyWindow(window);
        SDL_Quit();
        return 1;
    }
    service_canvas->set_on_service_click([](const std::string& key, const service_model::Service& service) {
        if (key.empty())
            spdlog::info("Selection cleared");
        else
            spdlog::info("Selected {} ({})", service.name, key);
    });

    app::InputBridge input(*service_canvas);
    ImVec2 canvas_origin(0, 0);

    bool running = true;
    while (running) {
        const double now_ms = static_cast<double>(SDL_GetTicks());

        SDL_Event event;
        while (SDL_PollEvent(&event)) {
            ImGui_ImplSDL3_ProcessEvent(&event);
            if (event.type == SDL_EVENT_QUIT)
                running = false;
            if (event.type == SDL_EVENT_WINDOW_CLOSE_REQUESTED &&
                event.window.windowID == SDL_GetWindowID(window))
                running = false;
            input.process_sdl_event(event, canvas_origin.x, canvas_origin.y,
                io.DisplaySize.x, io.DisplaySize.y, now_ms);
        }

        frames.run_frame(now_ms);

        ImGui_ImplOpenGL3_NewFrame();
        ImGui_ImplSDL3_NewFrame();
        ImGui::NewFrame();

        ImGui::SetNextWindowPos(ImVec2(0, 0));
        ImGui::SetNextWindowSize(io.DisplaySize);
        ImGui::PushStyleVar(ImGuiStyleVar_WindowPadding, ImVec2(0, 0));
        ImGui::Begin("Service Map", nullptr,
            ImGuiWindowFlags_NoTitleBar | ImGuiWindowFlags_NoResize | ImGuiWindowFlags_NoMove
            | ImGuiWindowFlags_NoCollapse | ImGuiWindowFlags_NoBringToFrontOnFocus);
        ImVec2 canvas_size = ImGui::GetContentRegionAvail();
        if (canvas_size.x > 0 && canvas_size.y > 0) {
            ImGui::BeginChild("canvas", canvas_size, false, ImGuiWindowFlags_NoScrollbar | ImGuiWindowFlags_NoScrollWithMouse);
            canvas_origin = ImGui::GetCursorScreenPos();
            if (canvas_size.x != surface.width() || canvas_size.y != surface.height()) {
                surface.resize(canvas_size.x, canvas_size.y);
                service_canvas->on_resize();
            }
            input.process_imgui_frame(canvas_origin.x, canvas_origin.y, canvas_size.x, canvas_size.y, now_ms);
            service_render::replay_display_list(ImGui::GetWindowDrawList(), surface.display_list(),
                canvas_origin, canvas_size);
            ImGui::EndChild();
        }
        ImGui::End();
        ImGui::PopStyleVar();

        draw_selection_panel(catalog, service_canvas->selected_service());
        draw_view_controls(*service_canvas, catalog, io.DisplaySize);

        ImGui::Render();
        SDL_GL_MakeCurrent(window, gl_context);
        // HiDPI: use framebuffer size in pixels, not logical DisplaySize
        const int fb_w = (int)(io.DisplaySize.x * io.DisplayFramebufferScale.x);
        const int fb_h = (int)(io.DisplaySize.y * io.DisplayFramebufferScale.y);
        glViewport(0, 0, fb_w, fb_h);
        glClearColor(0.1f, 0.1f, 0.12f, 1.0f);
        glClear(GL_COLOR_BUFFER_BIT);
        ImGui_ImplOpenGL3_RenderDrawData(ImGui::GetDrawData());
        SDL_GL_SwapWindow(window);
    }

    service_canvas.reset();

    ImGui_ImplOpenGL3_Shutdown();
    ImGui_ImplSDL3_Shutdown();
    ImGui::DestroyContext();

    SDL_GL_DestroyContext(gl_context);
    SDL_DestroyWindow(window);
    SDL_Quit();
    return 0;
}
