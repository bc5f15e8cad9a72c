#include "viewport.hpp"

#include <cmath>
#include <stdexcept>
#include <string>

static void check_dimensions(int w, int h)
{
    if (w <= 0 || h <= 0)
        throw std::invalid_argument("viewport dimensions must be positive, got "
                                    + std::to_string(w) + "x" + std::to_string(h));
}

Viewport::Viewport(int w, int h)
{
    check_dimensions(w, h);
    width  = w;
    height = h;
}

PlanePoint Viewport::to_plane(double px, double py) const
{
    // A single-pixel axis has no span to interpolate over.
    const double x0 = (width  > 1) ? remap(px, 0.0, width  - 1, x_min, x_max) : x_min;
    const double y0 = (height > 1) ? remap(py, 0.0, height - 1, y_min, y_max) : y_min;
    return {x0, y0};
}

PixelPoint Viewport::to_pixel(double x0, double y0) const
{
    const double px = (width  > 1) ? remap(x0, x_min, x_max, 0.0, width  - 1) : 0.0;
    const double py = (height > 1) ? remap(y0, y_min, y_max, 0.0, height - 1) : 0.0;
    return {px, py};
}

void Viewport::zoom(PixelPoint at, double factor)
{
    if (!std::isfinite(factor) || factor <= 0.0)
        throw std::invalid_argument("zoom factor must be a positive finite number");
    if (!std::isfinite(at.x) || !std::isfinite(at.y))
        throw std::invalid_argument("zoom point must be finite");

    const double cx = remap(at.x, 0.0, width,  x_min, x_max);
    const double cy = remap(at.y, 0.0, height, y_min, y_max);
    const double half_w = x_range() * factor * 0.5;
    const double half_h = y_range() * factor * 0.5;

    x_min = cx - half_w;
    x_max = cx + half_w;
    y_min = cy - half_h;
    y_max = cy + half_h;
}

void Viewport::resize(int new_width, int new_height)
{
    check_dimensions(new_width, new_height);

    const double x_ratio = static_cast<double>(new_width)  / width;
    const double y_ratio = static_cast<double>(new_height) / height;

    const double x_span = std::abs(x_max - x_min);
    const double y_span = std::abs(y_max - y_min);

    const double x_diff = x_ratio * x_span - x_span;
    const double y_diff = y_ratio * y_span - y_span;

    x_min -= x_diff / 2.0;
    x_max += x_diff / 2.0;
    y_min -= y_diff / 2.0;
    y_max += y_diff / 2.0;

    width  = new_width;
    height = new_height;
}

void Viewport::reset()
{
    x_min = DEFAULT_X_MIN;
    x_max = DEFAULT_X_MAX;
    y_min = DEFAULT_Y_MIN;
    y_max = DEFAULT_Y_MAX;
}
