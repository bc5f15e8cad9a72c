#include "mandelbrot_set.hpp"
#include "cpu_renderer.hpp"

#include <algorithm>
#include <exception>
#include <stdexcept>
#include <string>
#include <utility>

static int checked_iter_cap(int n)
{
    if (n < 1 || n > MandelbrotSet::MAX_ITER_LIMIT)
        throw std::invalid_argument("max_iterations must be in [1, "
                                    + std::to_string(MandelbrotSet::MAX_ITER_LIMIT) + "], got "
                                    + std::to_string(n));
    return n;
}

MandelbrotSet::MandelbrotSet(int width, int height, int max_iter, uint32_t seed)
    : MandelbrotSet(width, height, max_iter, seed, std::make_unique<CpuRenderer>())
{
}

MandelbrotSet::MandelbrotSet(int width, int height, int max_iter, uint32_t seed,
                             std::unique_ptr<IFieldRenderer> renderer)
    : view(width, height)
    , iter_cap(checked_iter_cap(max_iter))
    , rng(seed)
    , gradient(rainbow_gradient())
    , lut(gradient, iter_cap)
    , engine(std::move(renderer))
{
    if (!engine)
        throw std::invalid_argument("MandelbrotSet needs a field renderer");
    iters.resize(width, height);
    pixels.resize(width, height);
}

// -----------------------------------------------------------------------
// Commands
// -----------------------------------------------------------------------
void MandelbrotSet::zoom(PixelPoint at, double factor)
{
    view.zoom(at, factor);
    flags.mark_viewport_changed();
}

void MandelbrotSet::resize(int width, int height)
{
    view.resize(width, height);
    iters.resize(width, height);
    pixels.resize(width, height);
    flags.mark_viewport_changed();
}

void MandelbrotSet::randomize_palette()
{
    set_gradient(random_gradient(rng), PaletteRecipe::Random);
}

void MandelbrotSet::use_rainbow_palette()
{
    set_gradient(rainbow_gradient(), PaletteRecipe::Rainbow);
}

void MandelbrotSet::reset()
{
    view.reset();
    use_rainbow_palette();
    flags.mark_viewport_changed();
}

void MandelbrotSet::set_max_iterations(int n)
{
    checked_iter_cap(n);
    if (n == iter_cap) return;

    lut      = Palette(gradient, n);
    iter_cap = n;
    flags.mark_viewport_changed();
}

void MandelbrotSet::set_color_mode(ColorMode m)
{
    if (m == mode) return;
    mode = m;
    flags.mark_palette_changed();
}

void MandelbrotSet::set_gradient(const Gradient& g, PaletteRecipe r)
{
    lut      = Palette(g, iter_cap);
    gradient = g;
    recipe   = r;
    flags.mark_palette_changed();
}

// -----------------------------------------------------------------------
// Draw: field first, then frame, then copy. A draw that arrives while
// another is running only copies the last complete frame.
// -----------------------------------------------------------------------
void MandelbrotSet::draw(uint8_t* out, size_t size)
{
    const size_t expected = FrameBuffer::byte_size(view.width, view.height);
    if (out == nullptr || size != expected)
        throw std::invalid_argument("draw buffer must hold " + std::to_string(expected)
                                    + " bytes, got " + std::to_string(size));

    DrawGuard guard(drawing);
    if (!guard.nested()) {
        try {
            if (flags.take_recalc()) {
                engine->render(view, iter_cap, iters);
                ++field_count;
            }
            if (flags.take_redraw()) {
                composite(iters, lut, mode, pixels);
                ++frame_count;
            }
        } catch (const std::exception&) {
            // The field or frame may be half written; rebuild both next time.
            flags.mark_viewport_changed();
            throw;
        }
    }

    std::copy(pixels.bytes.begin(), pixels.bytes.end(), out);
}
