#pragma once

#include "compositor.hpp"
#include "dirty_state.hpp"
#include "palette.hpp"
#include "renderer.hpp"
#include "viewport.hpp"

#include <cstddef>
#include <cstdint>
#include <memory>
#include <random>

// ---------------------------------------------------------------------------
// Owns the viewport, iteration field, palette and frame buffer, and rebuilds
// the derived artifacts lazily on draw(). Commands validate their input
// before touching any state, so a rejected command leaves the last frame
// intact.
// ---------------------------------------------------------------------------
class MandelbrotSet {
public:
    static constexpr int DEFAULT_MAX_ITER = 1000;
    static constexpr int MIN_STEP_ITER    = 16;        // floor for halving steps
    static constexpr int MAX_ITER_LIMIT   = 1 << 20;   // largest accepted cap

    MandelbrotSet(int width, int height, int max_iter = DEFAULT_MAX_ITER,
                  uint32_t seed = 0);

    // Uses `renderer` to fill the iteration field instead of a CpuRenderer.
    MandelbrotSet(int width, int height, int max_iter, uint32_t seed,
                  std::unique_ptr<IFieldRenderer> renderer);

    // Commands
    void zoom(PixelPoint at, double factor);
    void resize(int width, int height);
    void randomize_palette();
    void use_rainbow_palette();
    void reset();
    void set_max_iterations(int n);
    void set_color_mode(ColorMode m);

    // Copy the current RGBA8 frame into `out`, rebuilding the field and the
    // frame first if they are stale. `size` must be width * height * 4.
    void draw(uint8_t* out, size_t size);

    // Read-only views
    const Viewport&       viewport()       const { return view; }
    int                   max_iterations() const { return iter_cap; }
    const Palette&        palette()        const { return lut; }
    PaletteRecipe         palette_recipe() const { return recipe; }
    ColorMode             color_mode()     const { return mode; }
    const IterationField& field()          const { return iters; }
    const FrameBuffer&    frame()          const { return pixels; }
    const DirtyState&     dirty()          const { return flags; }
    IFieldRenderer&       renderer()             { return *engine; }

    uint64_t field_builds() const { return field_count; }
    uint64_t frame_builds() const { return frame_count; }

private:
    void set_gradient(const Gradient& g, PaletteRecipe r);

    Viewport                        view;
    int                             iter_cap;
    std::mt19937                    rng;
    Gradient                        gradient;
    PaletteRecipe                   recipe = PaletteRecipe::Rainbow;
    Palette                         lut;
    ColorMode                       mode   = ColorMode::Smooth;
    IterationField                  iters;
    FrameBuffer                     pixels;
    DirtyState                      flags;
    bool                            drawing = false;
    std::unique_ptr<IFieldRenderer> engine;
    uint64_t                        field_count = 0;
    uint64_t                        frame_count = 0;
};

// Iteration caps for the double / halve controls, kept within
// [MIN_STEP_ITER, MAX_ITER_LIMIT] without overflowing.
inline int doubled_iterations(int n)
{
    if (n >= MandelbrotSet::MAX_ITER_LIMIT / 2) return MandelbrotSet::MAX_ITER_LIMIT;
    return n * 2;
}

inline int halved_iterations(int n)
{
    return n / 2 > MandelbrotSet::MIN_STEP_ITER ? n / 2 : MandelbrotSet::MIN_STEP_ITER;
}
