#pragma once

// Linear remap of n from [r_min, r_max] onto [t_min, t_max].
inline double remap(double n, double r_min, double r_max, double t_min, double t_max)
{
    return ((n - r_min) / (r_max - r_min)) * (t_max - t_min) + t_min;
}

struct PlanePoint { double x; double y; };
struct PixelPoint { double x; double y; };

// Default region of the complex plane shown at startup and after reset.
constexpr double DEFAULT_X_MIN = -2.00;
constexpr double DEFAULT_X_MAX =  0.47;
constexpr double DEFAULT_Y_MIN = -1.12;
constexpr double DEFAULT_Y_MAX =  1.12;

// Rectangle of the complex plane mapped onto a width x height pixel grid.
// Resizing keeps plane units per pixel constant, so growing the window
// reveals more of the plane instead of stretching it.
struct Viewport {
    int    width  = 640;
    int    height = 480;
    double x_min  = DEFAULT_X_MIN;
    double x_max  = DEFAULT_X_MAX;
    double y_min  = DEFAULT_Y_MIN;
    double y_max  = DEFAULT_Y_MAX;

    Viewport() = default;
    Viewport(int w, int h);

    // Pixel (0,0) maps to (x_min, y_min), (width-1, height-1) to (x_max, y_max).
    PlanePoint to_plane(double px, double py) const;
    PixelPoint to_pixel(double x0, double y0) const;

    // Recenter on the plane point under `at` and scale both ranges by
    // `factor` (< 1 zooms in). The centering uses width/height, not width-1.
    void zoom(PixelPoint at, double factor);

    void resize(int new_width, int new_height);
    void reset();

    PlanePoint center() const { return {(x_min + x_max) * 0.5, (y_min + y_max) * 0.5}; }
    double     x_range() const { return x_max - x_min; }
    double     y_range() const { return y_max - y_min; }
    double     zoom_level() const { return (DEFAULT_X_MAX - DEFAULT_X_MIN) / x_range(); }
};
