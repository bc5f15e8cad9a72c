#include <SDL2/SDL.h>
#include <SDL2/SDL_opengl.h>
#include "imgui.h"
#include "imgui_impl_sdl2.h"
#include "imgui_impl_opengl3.h"

#include "app_state.hpp"
#include "cli_benchmark.hpp"
#include "config.hpp"
#include "cpu_renderer.hpp"
#include "export.hpp"
#include "mandelbrot_set.hpp"
#include "ui_panels.hpp"

#include <cstdio>
#include <exception>
#include <random>
#include <vector>

static const float PANEL_WIDTH   = 280.0f;
static const float STATUS_HEIGHT = 24.0f;

// Zoom factors for clicks and wheel steps (< 1 zooms in)
static const double CLICK_ZOOM_IN  = 0.5;
static const double CLICK_ZOOM_OUT = 2.0;
static const double WHEEL_ZOOM     = 1.25;

// ---------------------------------------------------------------------------
// --render: draw one frame at the configured size and write it out
// ---------------------------------------------------------------------------
static int render_to_file(const AppConfig& cfg)
{
    MandelbrotSet set(cfg.width, cfg.height, cfg.max_iter, cfg.seed);
    set.set_color_mode(cfg.color_mode);
    if (cfg.random_palette)
        set.randomize_palette();

    std::vector<uint8_t> frame(FrameBuffer::byte_size(cfg.width, cfg.height));
    set.draw(frame.data(), frame.size());

    const std::string err = export_image(cfg.output, set.frame());
    if (!err.empty()) {
        fprintf(stderr, "Export failed: %s\n", err.c_str());
        return 1;
    }
    printf("Wrote %s (%dx%d, %d iter, seed %u)\n", cfg.output.c_str(),
           cfg.width, cfg.height, cfg.max_iter, cfg.seed);
    return 0;
}

static int run_interactive(const AppConfig& cfg)
{
    if (SDL_Init(SDL_INIT_VIDEO) != 0) {
        fprintf(stderr, "SDL_Init error: %s\n", SDL_GetError());
        return 1;
    }

    SDL_GL_SetAttribute(SDL_GL_CONTEXT_PROFILE_MASK, SDL_GL_CONTEXT_PROFILE_CORE);
    SDL_GL_SetAttribute(SDL_GL_CONTEXT_MAJOR_VERSION, 3);
    SDL_GL_SetAttribute(SDL_GL_CONTEXT_MINOR_VERSION, 3);
    SDL_GL_SetAttribute(SDL_GL_DOUBLEBUFFER, 1);

    // Window sized so the render area starts at exactly cfg.width x cfg.height.
    SDL_Window* window = SDL_CreateWindow(
        "Mandel Vision",
        SDL_WINDOWPOS_CENTERED, SDL_WINDOWPOS_CENTERED,
        cfg.width + static_cast<int>(PANEL_WIDTH),
        cfg.height + static_cast<int>(STATUS_HEIGHT) + 20,
        SDL_WINDOW_OPENGL | SDL_WINDOW_RESIZABLE
    );
    if (!window) {
        fprintf(stderr, "SDL_CreateWindow error: %s\n", SDL_GetError());
        SDL_Quit();
        return 1;
    }

    SDL_GLContext gl_context = SDL_GL_CreateContext(window);
    if (!gl_context) {
        fprintf(stderr, "SDL_GL_CreateContext error: %s\n", SDL_GetError());
        SDL_DestroyWindow(window);
        SDL_Quit();
        return 1;
    }
    SDL_GL_MakeCurrent(window, gl_context);
    SDL_GL_SetSwapInterval(cfg.vsync ? 1 : 0);

    IMGUI_CHECKVERSION();
    ImGui::CreateContext();
    ImGuiIO& io = ImGui::GetIO();
    io.IniFilename = nullptr;   // no persisted window layout

    ImGui::StyleColorsDark();
    ImGuiStyle& style      = ImGui::GetStyle();
    style.WindowBorderSize = 0.0f;
    style.WindowPadding    = ImVec2(8.0f, 6.0f);

    ImGui_ImplSDL2_InitForOpenGL(window, gl_context);
    ImGui_ImplOpenGL3_Init("#version 330");

    {
        AppState app(cfg);

        auto update_title = [&]() {
            char tbuf[128];
            std::snprintf(tbuf, sizeof(tbuf), "Mandel Vision  [zoom: %.4gx  iter: %d]",
                          app.set.viewport().zoom_level(), app.set.max_iterations());
            SDL_SetWindowTitle(window, tbuf);
        };
        update_title();

        bool running = true;
        while (running) {
            // Block until an SDL event arrives or 50 ms elapses.
            SDL_Event event;
            if (SDL_WaitEventTimeout(&event, 50)) {
                ImGui_ImplSDL2_ProcessEvent(&event);
                if (event.type == SDL_QUIT)
                    running = false;
            }
            while (SDL_PollEvent(&event)) {
                ImGui_ImplSDL2_ProcessEvent(&event);
                if (event.type == SDL_QUIT)
                    running = false;
            }

            ImGui_ImplOpenGL3_NewFrame();
            ImGui_ImplSDL2_NewFrame();
            ImGui::NewFrame();

            int win_w, win_h;
            SDL_GetWindowSize(window, &win_w, &win_h);
            const float fw       = static_cast<float>(win_w);
            const float fh       = static_cast<float>(win_h);
            const float menu_h   = ImGui::GetFrameHeight();
            const float render_x = PANEL_WIDTH;
            const float render_y = menu_h;
            const float render_w = fw - PANEL_WIDTH;
            const float render_h = fh - menu_h - STATUS_HEIGHT;
            const int   irw      = static_cast<int>(render_w);
            const int   irh      = static_cast<int>(render_h);

            // Follow the render area size; a collapsed area keeps the last frame.
            const Viewport& view = app.set.viewport();
            if (irw > 0 && irh > 0 && (irw != view.width || irh != view.height)) {
                run_command(app, [irw, irh](MandelbrotSet& s) { s.resize(irw, irh); });
                app.frame.resize(FrameBuffer::byte_size(view.width, view.height));
            }

            // Main fractal draw
            if (app.set.dirty().state() != DirtyState::State::Clean) {
                const bool recompute = app.set.dirty().needs_recalc();
                try {
                    app.set.draw(app.frame.data(), app.frame.size());
                    const Viewport& v = app.set.viewport();
                    if (recompute) {
                        if (auto* cpu = dynamic_cast<CpuRenderer*>(&app.set.renderer()))
                            app.main_render_ms = cpu->last_render_ms;
                    }
                    app.render_tex.ensure(v.width, v.height);
                    app.render_tex.upload(app.frame, v.width, v.height);
                    update_title();
                } catch (const std::exception& e) {
                    app.last_error = e.what();
                    fprintf(stderr, "Draw failed: %s\n", e.what());
                }
            }

            // ---------------------------------------------------------------
            // Menu bar
            // ---------------------------------------------------------------
            if (ImGui::BeginMainMenuBar()) {
                if (ImGui::BeginMenu("File")) {
                    if (ImGui::MenuItem("Export Image", "Ctrl+S")) {
                        app.show_export = true;
                        app.exp_done    = false;
                        app.exp_msg.clear();
                    }
                    ImGui::Separator();
                    if (ImGui::MenuItem("Exit", "Esc")) running = false;
                    ImGui::EndMenu();
                }
                if (ImGui::BeginMenu("View")) {
                    if (ImGui::MenuItem("Reset View", "R"))
                        run_command(app, [](MandelbrotSet& s) { s.reset(); });
                    if (ImGui::MenuItem("Random Palette", "P"))
                        run_command(app, [](MandelbrotSet& s) { s.randomize_palette(); });
                    const bool hist = app.set.color_mode() == ColorMode::Histogram;
                    if (ImGui::MenuItem("Histogram Coloring", "H", hist)) {
                        const ColorMode m = hist ? ColorMode::Smooth : ColorMode::Histogram;
                        run_command(app, [m](MandelbrotSet& s) { s.set_color_mode(m); });
                    }
                    ImGui::EndMenu();
                }
                if (ImGui::BeginMenu("Help")) {
                    if (ImGui::MenuItem("About", "F1")) app.show_about = true;
                    ImGui::EndMenu();
                }
                ImGui::EndMainMenuBar();
            }

            // ---------------------------------------------------------------
            // Global keyboard shortcuts
            // ---------------------------------------------------------------
            if (ImGui::IsKeyPressed(ImGuiKey_S) && io.KeyCtrl) {
                app.show_export = true;
                app.exp_done    = false;
                app.exp_msg.clear();
            }
            if (ImGui::IsKeyPressed(ImGuiKey_F1))
                app.show_about = true;
            if (!io.WantTextInput && !ImGui::IsPopupOpen("", ImGuiPopupFlags_AnyPopupId)) {
                if (ImGui::IsKeyPressed(ImGuiKey_Escape))
                    running = false;
                if (ImGui::IsKeyPressed(ImGuiKey_R))
                    run_command(app, [](MandelbrotSet& s) { s.reset(); });
                if (ImGui::IsKeyPressed(ImGuiKey_P))
                    run_command(app, [](MandelbrotSet& s) { s.randomize_palette(); });
                if (ImGui::IsKeyPressed(ImGuiKey_H)) {
                    const ColorMode m = app.set.color_mode() == ColorMode::Histogram
                                      ? ColorMode::Smooth : ColorMode::Histogram;
                    run_command(app, [m](MandelbrotSet& s) { s.set_color_mode(m); });
                }
                // PageUp/Down: double or halve iteration count
                if (ImGui::IsKeyPressed(ImGuiKey_PageUp)) {
                    const int n = doubled_iterations(app.set.max_iterations());
                    run_command(app, [n](MandelbrotSet& s) { s.set_max_iterations(n); });
                }
                if (ImGui::IsKeyPressed(ImGuiKey_PageDown)) {
                    const int n = halved_iterations(app.set.max_iterations());
                    run_command(app, [n](MandelbrotSet& s) { s.set_max_iterations(n); });
                }
            }

            draw_side_panel(app, io, menu_h, fh);

            // ---------------------------------------------------------------
            // Render area
            // ---------------------------------------------------------------
            ImGui::SetNextWindowPos(ImVec2(render_x, render_y));
            ImGui::SetNextWindowSize(ImVec2(render_w, render_h));
            ImGui::PushStyleVar(ImGuiStyleVar_WindowPadding, ImVec2(0.0f, 0.0f));
            ImGui::Begin("##render", nullptr,
                ImGuiWindowFlags_NoTitleBar            |
                ImGuiWindowFlags_NoResize              |
                ImGuiWindowFlags_NoMove                |
                ImGuiWindowFlags_NoBringToFrontOnFocus |
                ImGuiWindowFlags_NoScrollbar);
            ImGui::PopStyleVar();

            if (app.render_tex.id)
                ImGui::Image(app.render_tex.imgui_id(),
                             ImVec2(static_cast<float>(app.render_tex.w),
                                    static_cast<float>(app.render_tex.h)));

            if (ImGui::IsWindowHovered()) {
                const PixelPoint at = { io.MousePos.x - render_x, io.MousePos.y - render_y };
                double factor = 0.0;
                if (ImGui::IsMouseClicked(ImGuiMouseButton_Left))
                    factor = CLICK_ZOOM_IN;
                else if (ImGui::IsMouseClicked(ImGuiMouseButton_Right))
                    factor = CLICK_ZOOM_OUT;
                else if (io.MouseWheel > 0.0f)
                    factor = 1.0 / WHEEL_ZOOM;
                else if (io.MouseWheel < 0.0f)
                    factor = WHEEL_ZOOM;
                if (factor > 0.0)
                    run_command(app, [at, factor](MandelbrotSet& s) { s.zoom(at, factor); });
            }

            ImGui::End();  // ##render

            draw_status_bar(app, fw, fh);
            draw_export_dialog(app);
            draw_about_dialog(app);

            // ---------------------------------------------------------------
            // Render
            // ---------------------------------------------------------------
            ImGui::Render();
            glViewport(0, 0, win_w, win_h);
            glClearColor(0.08f, 0.08f, 0.08f, 1.0f);
            glClear(GL_COLOR_BUFFER_BIT);
            ImGui_ImplOpenGL3_RenderDrawData(ImGui::GetDrawData());
            SDL_GL_SwapWindow(window);
        }
    }   // AppState (and its GL texture) released while the context is alive

    ImGui_ImplOpenGL3_Shutdown();
    ImGui_ImplSDL2_Shutdown();
    ImGui::DestroyContext();
    SDL_GL_DeleteContext(gl_context);
    SDL_DestroyWindow(window);
    SDL_Quit();

    return 0;
}

// ---------------------------------------------------------------------------
// main
// ---------------------------------------------------------------------------
int main(int argc, char* argv[])
{
    AppConfig cfg;
    try {
        cfg = parse_args(argc, argv);
    } catch (const std::exception& e) {
        fprintf(stderr, "Error: %s\n", e.what());
        fprintf(stderr, "Try '%s --help'\n", argv[0]);
        return 1;
    }
    if (cfg.show_help) {
        print_usage(argv[0]);
        return 0;
    }
    if (cfg.seed == 0)
        cfg.seed = std::random_device{}();

    try {
        if (cfg.benchmark)
            return run_cli_benchmark();
        if (!cfg.output.empty())
            return render_to_file(cfg);
        return run_interactive(cfg);
    } catch (const std::exception& e) {
        fprintf(stderr, "Error: %s\n", e.what());
        return 1;
    }
}
