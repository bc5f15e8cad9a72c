#include <doctest/doctest.h>

#include "compositor.hpp"

#include <cstring>
#include <initializer_list>
#include <random>
#include <string>

static IterationField make_field(int w, int h, std::initializer_list<double> vals)
{
    IterationField f;
    f.resize(w, h);
    size_t k = 0;
    for (double v : vals) f.values[k++] = v;
    return f;
}

static void check_pixel(const FrameBuffer& frame, int x, int y, const Rgb& c)
{
    const uint8_t* p = frame.pixel(x, y);
    CAPTURE(x);
    CAPTURE(y);
    CHECK(p[0] == channel_byte(c.r));
    CHECK(p[1] == channel_byte(c.g));
    CHECK(p[2] == channel_byte(c.b));
    CHECK(p[3] == 255);
}

TEST_CASE("compositor: smooth mode colors by smoothed count") {
    const Palette pal(rainbow_gradient(), 10);
    const IterationField field = make_field(2, 2, {10.0, 0.0, 5.0, 0.5});

    FrameBuffer frame;
    composite(field, pal, ColorMode::Smooth, frame);
    REQUIRE(frame.width == 2);
    REQUIRE(frame.height == 2);
    REQUIRE(frame.bytes.size() == FrameBuffer::byte_size(2, 2));

    check_pixel(frame, 0, 0, pal.interior());
    check_pixel(frame, 1, 0, pal[0]);
    check_pixel(frame, 0, 1, pal[5]);

    const uint8_t* p = frame.pixel(1, 1);
    CHECK(p[0] == 204);
    CHECK(p[1] == 51);
    CHECK(p[2] == 0);
    CHECK(p[3] == 255);
}

TEST_CASE("compositor: interior pixels get the interior color in every mode") {
    std::mt19937 rng(7);
    const Palette pal(random_gradient(rng), 50);
    const IterationField field = make_field(3, 1, {50.0, 12.25, 50.0});

    for (ColorMode m : {ColorMode::Smooth, ColorMode::Histogram}) {
        const std::string mode = color_mode_name(m);
        CAPTURE(mode);
        FrameBuffer frame;
        composite(field, pal, m, frame);
        check_pixel(frame, 0, 0, pal.interior());
        check_pixel(frame, 2, 0, pal.interior());
    }
}

TEST_CASE("compositor: histogram mode follows the escape distribution") {
    const Palette pal(rainbow_gradient(), 10);
    // Escaped integer counts: 0, 0, 5 -> cdf[1..5] = 2/3, cdf[6..] = 1
    const IterationField field = make_field(2, 2, {10.0, 0.0, 5.0, 0.5});

    FrameBuffer frame;
    composite(field, pal, ColorMode::Histogram, frame);

    check_pixel(frame, 0, 0, pal.interior());
    check_pixel(frame, 1, 0, pal.color_at(0.0));
    check_pixel(frame, 0, 1, pal.color_at(10.0 * 2.0 / 3.0));
    check_pixel(frame, 1, 1, pal.color_at(10.0 / 3.0));
}

TEST_CASE("compositor: histogram of an all-interior field") {
    const Palette pal(rainbow_gradient(), 10);
    const IterationField field = make_field(2, 1, {10.0, 10.0});

    FrameBuffer frame;
    composite(field, pal, ColorMode::Histogram, frame);
    check_pixel(frame, 0, 0, pal.interior());
    check_pixel(frame, 1, 0, pal.interior());
}

TEST_CASE("compositor: frame is resized to the field") {
    const Palette pal(rainbow_gradient(), 10);
    IterationField field;
    field.resize(4, 3);

    FrameBuffer frame;
    frame.resize(1, 1);
    composite(field, pal, ColorMode::Smooth, frame);
    CHECK(frame.width == 4);
    CHECK(frame.height == 3);
    CHECK(frame.bytes.size() == 48);
    for (size_t k = 3; k < frame.bytes.size(); k += 4)
        CHECK(frame.bytes[k] == 255);
}

TEST_CASE("compositor: mode names") {
    CHECK(std::strcmp(color_mode_name(ColorMode::Smooth), "Smooth") == 0);
    CHECK(std::strcmp(color_mode_name(ColorMode::Histogram), "Histogram") == 0);
}
