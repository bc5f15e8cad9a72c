#pragma once

#include <algorithm>
#include <cmath>

// Snapshot interval for periodicity checking.
constexpr int PERIOD_CHECK_INTERVAL = 20;

// Closed-form interior tests for the two largest components of the set.
inline bool in_main_cardioid(double x0, double y0)
{
    const double xq = x0 - 0.25;
    const double p  = std::sqrt(xq*xq + y0*y0);
    return x0 <= p - 2.0*p*p + 0.25;
}

inline bool in_period2_bulb(double x0, double y0)
{
    const double xp = x0 + 1.0;
    return xp*xp + y0*y0 <= 1.0 / 16.0;
}

// smooth: continuous iteration count, exactly max_iter for non-escaping points.
// steps:  recurrence steps actually performed (0 when short-circuited).
struct EscapeSample { double smooth; int steps; };

// Escape-time kernel for z -> z^2 + c, z0 = 0, bailout |z|^2 > 4.
// Returns smooth iteration count for escaped points, or max_iter for interior.
// Smooth coloring: i + 1 - log2(log2(|z|^2)).
template<bool ShortCircuit, bool PeriodCheck>
inline EscapeSample escape_kernel(double x0, double y0, int max_iter)
{
    if constexpr (ShortCircuit) {
        if (in_main_cardioid(x0, y0) || in_period2_bulb(x0, y0))
            return {static_cast<double>(max_iter), 0};
    }

    double x = 0.0, y = 0.0;
    double x2 = 0.0, y2 = 0.0;
    double x_old = 0.0, y_old = 0.0;
    int period = 0;
    int i = 0;

    while (x2 + y2 <= 4.0 && i < max_iter) {
        y  = 2.0*x*y + y0;
        x  = x2 - y2 + x0;
        x2 = x*x;
        y2 = y*y;
        ++i;

        if constexpr (PeriodCheck) {
            if (x == x_old && y == y_old)
                return {static_cast<double>(max_iter), i};
            if (++period == PERIOD_CHECK_INTERVAL) {
                period = 0;
                x_old  = x;
                y_old  = y;
            }
        }
    }

    if (i >= max_iter)
        return {static_cast<double>(max_iter), i};

    // Renormalized on |z|^2; can dip below 0 for points far outside the set.
    const double nu     = std::log2(std::log2(x2 + y2));
    const double smooth = static_cast<double>(i) + 1.0 - nu;
    // Escaped points must stay distinguishable from interior ones.
    const double below_max = std::nextafter(static_cast<double>(max_iter), 0.0);
    return {std::clamp(smooth, 0.0, below_max), i};
}

inline EscapeSample mandelbrot_sample(double x0, double y0, int max_iter)
    { return escape_kernel<true, true>(x0, y0, max_iter); }

inline double mandelbrot_iter(double x0, double y0, int max_iter)
    { return escape_kernel<true, true>(x0, y0, max_iter).smooth; }

// Plain escape time without shortcuts; reference for tests and benchmarks.
inline double mandelbrot_iter_plain(double x0, double y0, int max_iter)
    { return escape_kernel<false, false>(x0, y0, max_iter).smooth; }
