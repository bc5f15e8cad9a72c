#include "ui_panels.hpp"
#include "app_state.hpp"
#include "export.hpp"
#include "imgui.h"

#include <algorithm>
#include <cstdio>
#include <ctime>
#include <string>

static const float PANEL_WIDTH   = 280.0f;
static const float STATUS_HEIGHT = 24.0f;

// ---------------------------------------------------------------------------
// Side panel: iterations, palette, coloring, view bounds
// ---------------------------------------------------------------------------
void draw_side_panel(AppState& app, const ImGuiIO& io, float menu_h, float fh)
{
    ImGui::SetNextWindowPos(ImVec2(0.0f, menu_h));
    ImGui::SetNextWindowSize(ImVec2(PANEL_WIDTH, fh - menu_h - STATUS_HEIGHT));
    ImGui::Begin("##panel", nullptr,
        ImGuiWindowFlags_NoTitleBar            |
        ImGuiWindowFlags_NoResize              |
        ImGuiWindowFlags_NoMove                |
        ImGuiWindowFlags_NoBringToFrontOnFocus |
        ImGuiWindowFlags_NoScrollbar           |
        ImGuiWindowFlags_NoScrollWithMouse);

    // --- Iteration count ---
    ImGui::TextDisabled("ITERATIONS");
    ImGui::Separator();
    {
        int iter = app.set.max_iterations();
        ImGui::SetNextItemWidth(-1.0f);
        if (ImGui::SliderInt("##iter", &iter, 64, 16384, "%d",
                             ImGuiSliderFlags_Logarithmic)) {
            run_command(app, [iter](MandelbrotSet& s) { s.set_max_iterations(iter); });
        }
        if (ImGui::IsItemHovered() && io.MouseWheel != 0.0f) {
            const int n = (io.MouseWheel > 0.0f) ? doubled_iterations(iter)
                                                  : halved_iterations(iter);
            run_command(app, [n](MandelbrotSet& s) { s.set_max_iterations(n); });
        }
    }

    // --- Palette ---
    ImGui::Spacing();
    ImGui::TextDisabled("PALETTE");
    ImGui::Separator();
    {
        const bool rainbow = app.set.palette_recipe() == PaletteRecipe::Rainbow;
        if (ImGui::RadioButton("Rainbow", rainbow) && !rainbow)
            run_command(app, [](MandelbrotSet& s) { s.use_rainbow_palette(); });
        ImGui::SameLine();
        if (ImGui::Button("Randomize  (P)"))
            run_command(app, [](MandelbrotSet& s) { s.randomize_palette(); });

        // Palette strip, interior color at the right end
        const Palette& pal   = app.set.palette();
        const ImVec2   tl    = ImGui::GetCursorScreenPos();
        const float    w     = ImGui::GetContentRegionAvail().x;
        const float    h     = 14.0f;
        const int      cols  = std::max(1, static_cast<int>(w));
        ImDrawList*    dl    = ImGui::GetWindowDrawList();
        for (int x = 0; x < cols; ++x) {
            const double v = static_cast<double>(x) * pal.max_iter() / cols;
            const Rgb    c = pal.color_at(v);
            dl->AddRectFilled(ImVec2(tl.x + x, tl.y), ImVec2(tl.x + x + 1.0f, tl.y + h),
                              IM_COL32(channel_byte(c.r), channel_byte(c.g),
                                       channel_byte(c.b), 255));
        }
        ImGui::Dummy(ImVec2(w, h));
    }

    // --- Coloring ---
    ImGui::Spacing();
    ImGui::TextDisabled("COLORING");
    ImGui::Separator();
    {
        static const char* names[] = { "Smooth iteration count", "Histogram equalized" };
        int m = static_cast<int>(app.set.color_mode());
        ImGui::SetNextItemWidth(-1.0f);
        if (ImGui::Combo("##mode", &m, names, COLOR_MODE_COUNT))
            run_command(app, [m](MandelbrotSet& s) { s.set_color_mode(static_cast<ColorMode>(m)); });
    }

    // --- View ---
    ImGui::Spacing();
    ImGui::TextDisabled("VIEW");
    ImGui::Separator();
    {
        const Viewport& v = app.set.viewport();
        ImGui::Text("x  %.12f", v.x_min);
        ImGui::Text("   %.12f", v.x_max);
        ImGui::Text("y  %.12f", v.y_min);
        ImGui::Text("   %.12f", v.y_max);
        ImGui::Text("%d x %d px", v.width, v.height);
        ImGui::Spacing();
        if (ImGui::Button("Reset  (R)", ImVec2(-1.0f, 0.0f)))
            run_command(app, [](MandelbrotSet& s) { s.reset(); });
    }

    ImGui::End();  // ##panel
}

// ---------------------------------------------------------------------------
// Status bar
// ---------------------------------------------------------------------------
void draw_status_bar(const AppState& app, float fw, float fh)
{
    ImGui::SetNextWindowPos(ImVec2(0.0f, fh - STATUS_HEIGHT));
    ImGui::SetNextWindowSize(ImVec2(fw, STATUS_HEIGHT));
    ImGui::PushStyleVar(ImGuiStyleVar_WindowPadding, ImVec2(6.0f, 4.0f));
    ImGui::Begin("##status", nullptr,
        ImGuiWindowFlags_NoTitleBar            |
        ImGuiWindowFlags_NoResize              |
        ImGuiWindowFlags_NoMove                |
        ImGuiWindowFlags_NoBringToFrontOnFocus |
        ImGuiWindowFlags_NoScrollbar);
    ImGui::PopStyleVar();

    const Viewport&  v = app.set.viewport();
    const PlanePoint c = v.center();
    ImGui::Text("x: %.10f   y: %.10f   zoom: %.4gx   iter: %d   %.0f ms   [%s]",
                c.x, c.y, v.zoom_level(), app.set.max_iterations(),
                app.main_render_ms, color_mode_name(app.set.color_mode()));
    if (!app.last_error.empty()) {
        ImGui::SameLine();
        ImGui::TextColored(ImVec4(1.0f, 0.3f, 0.3f, 1.0f), "  %s", app.last_error.c_str());
    }
    ImGui::End();
}

// ---------------------------------------------------------------------------
// Export dialog: writes the frame currently on screen
// ---------------------------------------------------------------------------
void draw_export_dialog(AppState& app)
{
    if (app.show_export) {
        ImGui::OpenPopup("Export Image##dlg");
        app.show_export = false;
    }
    if (ImGui::BeginPopupModal("Export Image##dlg", nullptr,
                               ImGuiWindowFlags_AlwaysAutoResize)) {
        ImGui::TextDisabled("FORMAT");
        ImGui::Separator();
        if (!jxl_available()) {
            ImGui::RadioButton("PNG", &app.exp_fmt, 0);
            ImGui::SameLine();
            ImGui::TextDisabled("JXL (not available)");
        } else {
            ImGui::RadioButton("PNG", &app.exp_fmt, 0);
            ImGui::SameLine();
            ImGui::RadioButton("JPEG XL (lossless)", &app.exp_fmt, 1);
        }

        ImGui::Spacing();
        ImGui::TextDisabled("OUTPUT");
        ImGui::Separator();
        {
            const char* ext = (app.exp_fmt == 1 && jxl_available()) ? "jxl" : "png";
            std::time_t t = std::time(nullptr);
            std::tm* tm = std::localtime(&t);
            char ts[32];
            std::strftime(ts, sizeof(ts), "%Y%m%d_%H%M%S", tm);
            const std::string filename = std::string("mandelbrot_") + ts + "." + ext;
            const FrameBuffer& frame = app.set.frame();
            ImGui::Text("%s   (%d x %d)", filename.c_str(), frame.width, frame.height);

            if (!app.exp_done) {
                ImGui::Spacing();
                if (ImGui::Button("Export", ImVec2(120.0f, 0.0f))) {
                    app.exp_saved_name = filename;
                    app.exp_msg  = export_image(app.exp_saved_name, frame);
                    app.exp_done = true;
                    if (!app.exp_msg.empty())
                        std::fprintf(stderr, "Export failed: %s\n", app.exp_msg.c_str());
                }
                ImGui::SameLine();
                if (ImGui::Button("Cancel", ImVec2(80.0f, 0.0f)))
                    ImGui::CloseCurrentPopup();
            } else {
                ImGui::Spacing();
                if (app.exp_msg.empty()) {
                    ImGui::TextColored(ImVec4(0.3f, 1.0f, 0.3f, 1.0f),
                                       "Saved: %s", app.exp_saved_name.c_str());
                } else {
                    ImGui::TextColored(ImVec4(1.0f, 0.3f, 0.3f, 1.0f),
                                       "Error: %s", app.exp_msg.c_str());
                }
                ImGui::Spacing();
                if (ImGui::Button("Close", ImVec2(80.0f, 0.0f)))
                    ImGui::CloseCurrentPopup();
            }
        }
        ImGui::EndPopup();
    }
}

// ---------------------------------------------------------------------------
// About dialog
// ---------------------------------------------------------------------------
void draw_about_dialog(AppState& app)
{
    if (app.show_about) {
        ImGui::OpenPopup("About##dlg");
        app.show_about = false;
    }
    if (ImGui::BeginPopupModal("About##dlg", nullptr,
                               ImGuiWindowFlags_AlwaysAutoResize)) {
        ImGui::Text("Mandel Vision");
        ImGui::Separator();
        ImGui::Spacing();
        ImGui::Text("Smooth-colored Mandelbrot explorer.");
        ImGui::Spacing();
        ImGui::TextDisabled("Cardioid / bulb and periodicity shortcuts");
        ImGui::TextDisabled("Rainbow and random gradient palettes");
        ImGui::TextDisabled("PNG and JPEG XL lossless export");
        ImGui::Spacing();
        ImGui::Separator();
        ImGui::Spacing();
        ImGui::TextDisabled("Built with Dear ImGui, SDL2, libpng, libjxl");
        ImGui::Spacing();
        ImGui::SetCursorPosX(
            (ImGui::GetContentRegionAvail().x - 120.0f) * 0.5f
            + ImGui::GetCursorPosX());
        if (ImGui::Button("Close", ImVec2(120.0f, 0.0f)))
            ImGui::CloseCurrentPopup();
        ImGui::EndPopup();
    }
}
