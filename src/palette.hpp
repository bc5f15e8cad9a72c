#pragma once

#include <cstdint>
#include <random>
#include <vector>

// sRGB (gamma-encoded) triple, channels in [0, 1].
struct Rgb { float r, g, b; };

inline Rgb lerp(const Rgb& a, const Rgb& b, float f)
{
    return { a.r + f * (b.r - a.r),
             a.g + f * (b.g - a.g),
             a.b + f * (b.b - a.b) };
}

inline uint8_t channel_byte(float c)
{
    if (!(c > 0.0f)) return 0;
    if (c >= 1.0f)   return 255;
    return static_cast<uint8_t>(c * 255.0f + 0.5f);
}

// ---------------------------------------------------------------------------
// Piecewise-linear gradient over (position, color) stops. Positions only need
// to be non-decreasing; they act as relative weights, not as [0, 1] fractions.
// Queries outside the stop range clamp to the first / last stop.
// ---------------------------------------------------------------------------
struct ColorStop { double pos; Rgb color; };

struct Gradient {
    std::vector<ColorStop> stops;

    explicit Gradient(std::vector<ColorStop> s);

    Rgb    at(double pos) const;
    double first_pos() const { return stops.front().pos; }
    double last_pos()  const { return stops.back().pos; }
};

enum class PaletteRecipe { Rainbow = 0, Random = 1 };

// red -> green -> blue -> green -> red
Gradient rainbow_gradient();

// Fixed stop positions, every channel uniform in [0, 1).
Gradient random_gradient(std::mt19937& rng);

// ---------------------------------------------------------------------------
// Lookup table of max_iter + 1 colors sampled evenly across a gradient.
// Entry max_iter is the interior color.
// ---------------------------------------------------------------------------
class Palette {
public:
    Palette(const Gradient& gradient, int max_iter);

    int size()     const { return static_cast<int>(lut.size()); }
    int max_iter() const { return iter_cap; }

    const Rgb& operator[](int i) const { return lut[static_cast<size_t>(i)]; }
    const Rgb& interior() const { return lut.back(); }

    // Color for a smoothed iteration value: blends entries floor(v) and
    // floor(v)+1 by the fractional part.
    Rgb color_at(double v) const;

private:
    std::vector<Rgb> lut;
    int              iter_cap = 0;
};
