#include "palette.hpp"
#include "viewport.hpp"

#include <algorithm>
#include <cmath>
#include <iterator>
#include <stdexcept>
#include <utility>

// ---------------------------------------------------------------------------
// Gradient
// ---------------------------------------------------------------------------
Gradient::Gradient(std::vector<ColorStop> s)
    : stops(std::move(s))
{
    if (stops.empty())
        throw std::invalid_argument("gradient needs at least one color stop");
    for (size_t k = 1; k < stops.size(); ++k) {
        if (stops[k].pos < stops[k - 1].pos)
            throw std::invalid_argument("gradient stop positions must be non-decreasing");
    }
}

Rgb Gradient::at(double pos) const
{
    if (!(pos > stops.front().pos)) return stops.front().color;
    if (pos >= stops.back().pos)  return stops.back().color;

    // Find the segment [stops[seg], stops[seg+1]] that contains pos.
    size_t seg = stops.size() - 2;
    for (size_t s = 0; s + 1 < stops.size(); ++s) {
        if (pos <= stops[s + 1].pos) { seg = s; break; }
    }
    const ColorStop& a = stops[seg];
    const ColorStop& b = stops[seg + 1];
    const double span = b.pos - a.pos;
    const double f    = (span > 0.0) ? (pos - a.pos) / span : 0.0;
    return lerp(a.color, b.color, static_cast<float>(std::clamp(f, 0.0, 1.0)));
}

// ---------------------------------------------------------------------------
// Recipes
// ---------------------------------------------------------------------------
Gradient rainbow_gradient()
{
    return Gradient({
        { 0.0, {1.0f, 0.0f, 0.0f}},
        { 2.5, {0.0f, 1.0f, 0.0f}},
        { 5.0, {0.0f, 0.0f, 1.0f}},
        { 7.5, {0.0f, 1.0f, 0.0f}},
        {10.0, {1.0f, 0.0f, 0.0f}},
    });
}

Gradient random_gradient(std::mt19937& rng)
{
    static const double positions[] = {0.0, 1.0, 3.0, 6.0, 10.0};

    std::uniform_real_distribution<float> channel(0.0f, 1.0f);
    std::vector<ColorStop> stops;
    stops.reserve(std::size(positions));
    for (double p : positions) {
        const float r = channel(rng);
        const float g = channel(rng);
        const float b = channel(rng);
        stops.push_back({p, {r, g, b}});
    }
    return Gradient(std::move(stops));
}

// ---------------------------------------------------------------------------
// Palette
// ---------------------------------------------------------------------------
Palette::Palette(const Gradient& gradient, int max_iter)
    : iter_cap(max_iter)
{
    if (max_iter < 1)
        throw std::invalid_argument("palette needs max_iter >= 1");

    lut.resize(static_cast<size_t>(max_iter) + 1);
    const double lo = gradient.first_pos();
    const double hi = gradient.last_pos();
    for (int i = 0; i <= max_iter; ++i)
        lut[static_cast<size_t>(i)] = gradient.at(remap(i, 0.0, max_iter, lo, hi));
}

Rgb Palette::color_at(double v) const
{
    if (!(v > 0.0))
        return lut.front();
    if (v >= static_cast<double>(iter_cap))
        return lut.back();

    // Rounding can leave v a hair below max_iter with floor(v) == max_iter.
    const int    i = std::min(static_cast<int>(std::floor(v)), iter_cap - 1);
    const double f = std::clamp(v - i, 0.0, 1.0);
    return lerp(lut[static_cast<size_t>(i)], lut[static_cast<size_t>(i) + 1],
                static_cast<float>(f));
}
