#pragma once

#include <SDL2/SDL_opengl.h>
#include "imgui.h"
#include "command.hpp"
#include "config.hpp"
#include "mandelbrot_set.hpp"

#include <cstdint>
#include <string>
#include <utility>
#include <vector>

// ---------------------------------------------------------------------------
// GL texture holding the last drawn frame
// ---------------------------------------------------------------------------
struct GlTex {
    GLuint id = 0;
    int    w  = 0;
    int    h  = 0;

    void ensure(int nw, int nh) {
        if (nw == w && nh == h && id != 0) return;
        if (id) glDeleteTextures(1, &id);
        glGenTextures(1, &id);
        glBindTexture(GL_TEXTURE_2D, id);
        glTexParameteri(GL_TEXTURE_2D, GL_TEXTURE_MIN_FILTER, GL_NEAREST);
        glTexParameteri(GL_TEXTURE_2D, GL_TEXTURE_MAG_FILTER, GL_NEAREST);
        glTexImage2D(GL_TEXTURE_2D, 0, GL_RGBA, nw, nh, 0,
                     GL_RGBA, GL_UNSIGNED_BYTE, nullptr);
        w = nw; h = nh;
    }

    void upload(const std::vector<uint8_t>& rgba, int fw, int fh) {
        glBindTexture(GL_TEXTURE_2D, id);
        glPixelStorei(GL_UNPACK_ALIGNMENT, 1);
        glTexSubImage2D(GL_TEXTURE_2D, 0, 0, 0, fw, fh,
                        GL_RGBA, GL_UNSIGNED_BYTE, rgba.data());
    }

    ImTextureID imgui_id() const {
        return reinterpret_cast<ImTextureID>(static_cast<uintptr_t>(id));
    }

    ~GlTex() { if (id) glDeleteTextures(1, &id); }
};

// ---------------------------------------------------------------------------
// All mutable application state
// ---------------------------------------------------------------------------
struct AppState {
    explicit AppState(const AppConfig& c)
        : cfg(c)
        , set(c.width, c.height, c.max_iter, c.seed)
        , frame(FrameBuffer::byte_size(c.width, c.height))
    {
        set.set_color_mode(c.color_mode);
        if (c.random_palette)
            set.randomize_palette();
    }

    AppConfig            cfg;
    MandelbrotSet        set;
    std::vector<uint8_t> frame;           // copy handed out by MandelbrotSet::draw
    double               main_render_ms = 0.0;
    std::string          last_error;      // last rejected command, shown in the status bar

    // Dialog flags
    bool        show_about  = false;
    bool        show_export = false;

    // Export dialog state
    int         exp_fmt  = 0;             // 0=PNG, 1=JXL
    bool        exp_done = false;
    std::string exp_msg;
    std::string exp_saved_name;

    GlTex render_tex;
};

// Apply a command to the set; failures are kept for the status bar.
template<typename F>
inline void run_command(AppState& app, F&& command)
{
    apply_command(app.set, app.last_error, std::forward<F>(command));
}
