#include <doctest/doctest.h>

#include "palette.hpp"

#include <cmath>
#include <limits>
#include <random>
#include <stdexcept>
#include <vector>

using doctest::Approx;

static void check_rgb(const Rgb& c, float r, float g, float b)
{
    CHECK(c.r == Approx(r));
    CHECK(c.g == Approx(g));
    CHECK(c.b == Approx(b));
}

TEST_CASE("palette: gradient rejects empty and unsorted stops") {
    CHECK_THROWS_AS(Gradient(std::vector<ColorStop>{}), std::invalid_argument);
    CHECK_THROWS_AS(Gradient({{1.0, {0, 0, 0}}, {0.5, {1, 1, 1}}}), std::invalid_argument);
    CHECK_NOTHROW(Gradient({{0.0, {0, 0, 0}}, {0.0, {1, 1, 1}}}));
}

TEST_CASE("palette: gradient interpolates and clamps") {
    const Gradient g({{2.0, {0.0f, 0.0f, 0.0f}}, {4.0, {1.0f, 0.5f, 0.0f}}});
    check_rgb(g.at(3.0), 0.5f, 0.25f, 0.0f);
    check_rgb(g.at(-10.0), 0.0f, 0.0f, 0.0f);
    check_rgb(g.at(100.0), 1.0f, 0.5f, 0.0f);
    check_rgb(g.at(std::nan("")), 0.0f, 0.0f, 0.0f);
}

TEST_CASE("palette: single stop gradient is constant") {
    const Gradient g({{1.0, {0.2f, 0.4f, 0.6f}}});
    check_rgb(g.at(0.0), 0.2f, 0.4f, 0.6f);
    check_rgb(g.at(1.0), 0.2f, 0.4f, 0.6f);
    check_rgb(g.at(5.0), 0.2f, 0.4f, 0.6f);

    const Palette p(g, 4);
    CHECK(p.size() == 5);
    check_rgb(p.color_at(2.5), 0.2f, 0.4f, 0.6f);
}

TEST_CASE("palette: rainbow lookup table") {
    const Palette p(rainbow_gradient(), 10);
    CHECK(p.size() == 11);
    CHECK(p.max_iter() == 10);

    check_rgb(p[0], 1.0f, 0.0f, 0.0f);
    check_rgb(p[1], 0.6f, 0.4f, 0.0f);
    check_rgb(p[5], 0.0f, 0.0f, 1.0f);
    check_rgb(p[10], 1.0f, 0.0f, 0.0f);
    check_rgb(p.interior(), 1.0f, 0.0f, 0.0f);
}

TEST_CASE("palette: lookup table spans max_iter + 1 entries") {
    for (int n : {1, 2, 256, 1000}) {
        CAPTURE(n);
        const Palette p(rainbow_gradient(), n);
        CHECK(p.size() == n + 1);
    }
    CHECK_THROWS_AS(Palette(rainbow_gradient(), 0), std::invalid_argument);
    CHECK_THROWS_AS(Palette(rainbow_gradient(), -5), std::invalid_argument);
}

TEST_CASE("palette: color_at blends neighbouring entries") {
    const Palette p(rainbow_gradient(), 10);
    check_rgb(p.color_at(0.5), 0.8f, 0.2f, 0.0f);
    check_rgb(p.color_at(5.0), 0.0f, 0.0f, 1.0f);
    check_rgb(p.color_at(3.0), p[3].r, p[3].g, p[3].b);
}

TEST_CASE("palette: color_at clamps out of range values") {
    const Palette p(rainbow_gradient(), 10);
    check_rgb(p.color_at(-3.0), p[0].r, p[0].g, p[0].b);
    check_rgb(p.color_at(std::nan("")), p[0].r, p[0].g, p[0].b);
    check_rgb(p.color_at(10.0), p[10].r, p[10].g, p[10].b);
    check_rgb(p.color_at(1e9), p[10].r, p[10].g, p[10].b);
}

TEST_CASE("palette: color_at is continuous up to the interior color") {
    const Palette p(rainbow_gradient(), 1000);
    const double just_below = std::nextafter(1000.0, 0.0);
    const Rgb a = p.color_at(just_below);
    const Rgb b = p.interior();
    CHECK(std::fabs(a.r - b.r) < 1e-3f);
    CHECK(std::fabs(a.g - b.g) < 1e-3f);
    CHECK(std::fabs(a.b - b.b) < 1e-3f);
}

TEST_CASE("palette: random gradient is deterministic per seed") {
    std::mt19937 a(42), b(42), c(43);
    const Gradient ga = random_gradient(a);
    const Gradient gb = random_gradient(b);
    const Gradient gc = random_gradient(c);

    REQUIRE(ga.stops.size() == 5);
    CHECK(ga.first_pos() == 0.0);
    CHECK(ga.last_pos() == 10.0);

    bool differs = false;
    for (size_t k = 0; k < ga.stops.size(); ++k) {
        CHECK(ga.stops[k].pos == gb.stops[k].pos);
        CHECK(ga.stops[k].color.r == gb.stops[k].color.r);
        CHECK(ga.stops[k].color.g == gb.stops[k].color.g);
        CHECK(ga.stops[k].color.b == gb.stops[k].color.b);
        for (float ch : {ga.stops[k].color.r, ga.stops[k].color.g, ga.stops[k].color.b}) {
            CHECK(ch >= 0.0f);
            CHECK(ch < 1.0f);
        }
        if (ga.stops[k].color.r != gc.stops[k].color.r) differs = true;
    }
    CHECK(differs);
}

TEST_CASE("palette: channel_byte rounds and saturates") {
    CHECK(channel_byte(0.0f) == 0);
    CHECK(channel_byte(-1.0f) == 0);
    CHECK(channel_byte(std::numeric_limits<float>::quiet_NaN()) == 0);
    CHECK(channel_byte(1.0f) == 255);
    CHECK(channel_byte(2.0f) == 255);
    CHECK(channel_byte(0.5f) == 128);
}
