#include "compositor.hpp"

#include <algorithm>
#include <cmath>
#include <vector>

const char* color_mode_name(ColorMode mode)
{
    switch (mode) {
        case ColorMode::Smooth:    return "Smooth";
        case ColorMode::Histogram: return "Histogram";
    }
    return "Unknown";
}

static void put_pixel(uint8_t* dst, const Rgb& c)
{
    dst[0] = channel_byte(c.r);
    dst[1] = channel_byte(c.g);
    dst[2] = channel_byte(c.b);
    dst[3] = 0xFF;
}

// ---------------------------------------------------------------------------
// Histogram equalization: cdf[i] is the fraction of escaped pixels whose
// integer count is below i, so cdf[0] == 0 and cdf[max_iter] == 1.
// ---------------------------------------------------------------------------
static std::vector<double> escape_cdf(const IterationField& field, int max_iter)
{
    std::vector<double> hist(static_cast<size_t>(max_iter) + 1, 0.0);
    double total = 0.0;
    for (double v : field.values) {
        if (v >= max_iter) continue;
        const int i = std::clamp(static_cast<int>(v), 0, max_iter - 1);
        hist[static_cast<size_t>(i)] += 1.0;
        total += 1.0;
    }

    std::vector<double> cdf(hist.size(), 0.0);
    double running = 0.0;
    for (int i = 0; i < max_iter; ++i) {
        cdf[static_cast<size_t>(i)] = (total > 0.0) ? running / total : 0.0;
        running += hist[static_cast<size_t>(i)];
    }
    cdf[static_cast<size_t>(max_iter)] = 1.0;
    return cdf;
}

void composite(const IterationField& field, const Palette& palette,
               ColorMode mode, FrameBuffer& frame)
{
    if (frame.width != field.width || frame.height != field.height)
        frame.resize(field.width, field.height);

    const int    max_iter = palette.max_iter();
    const double limit    = static_cast<double>(max_iter);
    uint8_t*     out      = frame.bytes.data();

    if (mode == ColorMode::Smooth) {
        for (double v : field.values) {
            put_pixel(out, palette.color_at(v));
            out += 4;
        }
        return;
    }

    const std::vector<double> cdf = escape_cdf(field, max_iter);
    for (double v : field.values) {
        if (v >= limit) {
            put_pixel(out, palette.interior());
        } else {
            const int    i = std::clamp(static_cast<int>(v), 0, max_iter - 1);
            const double f = std::clamp(v - i, 0.0, 1.0);
            const double h = cdf[static_cast<size_t>(i)]
                           + f * (cdf[static_cast<size_t>(i) + 1] - cdf[static_cast<size_t>(i)]);
            put_pixel(out, palette.color_at(h * limit));
        }
        out += 4;
    }
}
