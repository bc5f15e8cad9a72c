#include "cpu_renderer.hpp"
#include "fractal.hpp"
#include "viewport.hpp"

#include <chrono>

// -----------------------------------------------------------------------
// Full-grid pass. Every pixel depends only on (x0, y0, max_iter), so the
// field is always rebuilt wholesale.
// -----------------------------------------------------------------------
void CpuRenderer::render(const Viewport& view, int max_iter, IterationField& field)
{
    using clock = std::chrono::steady_clock;
    const auto t0 = clock::now();

    const int W = view.width, H = view.height;
    if (field.width != W || field.height != H)
        field.resize(W, H);

    uint64_t steps    = 0;
    uint64_t interior = 0;
    const double limit = static_cast<double>(max_iter);

    for (int py = 0; py < H; ++py) {
        double* row = field.values.data() + static_cast<size_t>(py) * W;
        for (int px = 0; px < W; ++px) {
            const PlanePoint c = view.to_plane(px, py);
            const EscapeSample s = use_shortcuts
                ? escape_kernel<true,  true >(c.x, c.y, max_iter)
                : escape_kernel<false, false>(c.x, c.y, max_iter);
            row[px] = s.smooth;
            steps  += static_cast<uint64_t>(s.steps);
            if (s.smooth >= limit) ++interior;
        }
    }

    last_steps    = steps;
    last_interior = interior;
    ++render_count;
    last_render_ms = std::chrono::duration<double, std::milli>(
                         clock::now() - t0).count();
}
