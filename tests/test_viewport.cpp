#include <doctest/doctest.h>

#include "viewport.hpp"

#include <limits>
#include <stdexcept>

using doctest::Approx;

TEST_CASE("viewport: starts at the default bounds") {
    const Viewport v(640, 480);
    CHECK(v.width == 640);
    CHECK(v.height == 480);
    CHECK(v.x_min == -2.00);
    CHECK(v.x_max == 0.47);
    CHECK(v.y_min == -1.12);
    CHECK(v.y_max == 1.12);
    CHECK(v.zoom_level() == Approx(1.0));
}

TEST_CASE("viewport: rejects non-positive dimensions") {
    CHECK_THROWS_AS(Viewport(0, 480), std::invalid_argument);
    CHECK_THROWS_AS(Viewport(640, -1), std::invalid_argument);
}

TEST_CASE("viewport: corners map to the plane bounds") {
    Viewport v(640, 480);
    v.zoom({100.0, 70.0}, 0.3);

    const PlanePoint tl = v.to_plane(0, 0);
    CHECK(tl.x == Approx(v.x_min));
    CHECK(tl.y == Approx(v.y_min));

    const PlanePoint br = v.to_plane(v.width - 1, v.height - 1);
    CHECK(br.x == Approx(v.x_max));
    CHECK(br.y == Approx(v.y_max));
}

TEST_CASE("viewport: to_pixel inverts to_plane") {
    const Viewport v(800, 600);
    const PlanePoint c = v.to_plane(123.0, 456.0);
    const PixelPoint p = v.to_pixel(c.x, c.y);
    CHECK(p.x == Approx(123.0));
    CHECK(p.y == Approx(456.0));
}

TEST_CASE("viewport: single pixel axis maps to the minimum") {
    const Viewport v(1, 1);
    const PlanePoint c = v.to_plane(0, 0);
    CHECK(c.x == v.x_min);
    CHECK(c.y == v.y_min);
}

TEST_CASE("viewport: zoom recenters on the clicked pixel") {
    Viewport v(640, 480);
    // Centering divides by the full width, so pixel 0 is exactly x_min.
    v.zoom({0.0, 0.0}, 0.5);
    const PlanePoint c = v.center();
    CHECK(c.x == Approx(-2.00));
    CHECK(c.y == Approx(-1.12));
    CHECK(v.x_range() == Approx(2.47 * 0.5));
    CHECK(v.y_range() == Approx(2.24 * 0.5));
}

TEST_CASE("viewport: zoom in then out at the same pixel restores the ranges") {
    Viewport v(640, 480);
    const double xr = v.x_range();
    const double yr = v.y_range();

    const PixelPoint at{200.0, 300.0};
    v.zoom(at, 0.5);
    v.zoom(at, 2.0);
    CHECK(v.x_range() == Approx(xr));
    CHECK(v.y_range() == Approx(yr));

    Viewport centered(640, 480);
    const PlanePoint before = centered.center();
    centered.zoom({320.0, 240.0}, 0.5);
    centered.zoom({320.0, 240.0}, 2.0);
    CHECK(centered.center().x == Approx(before.x));
    CHECK(centered.center().y == Approx(before.y));
    CHECK(centered.x_min == Approx(-2.00));
    CHECK(centered.y_max == Approx(1.12));
}

TEST_CASE("viewport: zoom rejects bad factors without mutating") {
    Viewport v(640, 480);
    CHECK_THROWS_AS(v.zoom({10.0, 10.0}, 0.0), std::invalid_argument);
    CHECK_THROWS_AS(v.zoom({10.0, 10.0}, -2.0), std::invalid_argument);
    CHECK_THROWS_AS(v.zoom({10.0, 10.0}, std::numeric_limits<double>::infinity()), std::invalid_argument);
    CHECK(v.x_min == -2.00);
    CHECK(v.x_max == 0.47);
}

TEST_CASE("viewport: resize keeps plane units per pixel") {
    Viewport v(640, 480);
    const double ppx = v.x_range() / v.width;
    const double ppy = v.y_range() / v.height;
    const PlanePoint c = v.center();

    v.resize(1280, 240);
    CHECK(v.width == 1280);
    CHECK(v.height == 240);
    CHECK(v.x_range() / v.width == Approx(ppx));
    CHECK(v.y_range() / v.height == Approx(ppy));
    CHECK(v.center().x == Approx(c.x));
    CHECK(v.center().y == Approx(c.y));
}

TEST_CASE("viewport: resize round trip restores the bounds") {
    Viewport v(640, 480);
    v.zoom({400.0, 100.0}, 0.25);
    const Viewport before = v;

    v.resize(1023, 77);
    v.resize(640, 480);
    CHECK(v.x_min == Approx(before.x_min));
    CHECK(v.x_max == Approx(before.x_max));
    CHECK(v.y_min == Approx(before.y_min));
    CHECK(v.y_max == Approx(before.y_max));
}

TEST_CASE("viewport: resize rejects bad sizes without mutating") {
    Viewport v(640, 480);
    CHECK_THROWS_AS(v.resize(0, 10), std::invalid_argument);
    CHECK_THROWS_AS(v.resize(10, -5), std::invalid_argument);
    CHECK(v.width == 640);
    CHECK(v.height == 480);
    CHECK(v.x_max == 0.47);
}

TEST_CASE("viewport: reset restores the default bounds only") {
    Viewport v(640, 480);
    v.resize(300, 200);
    v.zoom({10.0, 20.0}, 0.1);
    v.reset();
    CHECK(v.width == 300);
    CHECK(v.height == 200);
    CHECK(v.x_min == -2.00);
    CHECK(v.y_max == 1.12);
}

TEST_CASE("remap: linear interpolation between ranges") {
    CHECK(remap(0.0, 0.0, 10.0, -1.0, 1.0) == Approx(-1.0));
    CHECK(remap(5.0, 0.0, 10.0, -1.0, 1.0) == Approx(0.0));
    CHECK(remap(10.0, 0.0, 10.0, -1.0, 1.0) == Approx(1.0));
}
