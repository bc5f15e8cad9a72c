#pragma once

#include <cstddef>
#include <cstdint>
#include <vector>

struct Viewport;

// Smoothed iteration counts, one per pixel, row-major.
// A value equal to max_iter marks a point that did not escape.
struct IterationField {
    std::vector<double> values;
    int width  = 0;
    int height = 0;

    void resize(int w, int h)
    {
        width  = w;
        height = h;
        values.assign(static_cast<size_t>(w) * static_cast<size_t>(h), 0.0);
    }

    double at(int x, int y) const { return values[static_cast<size_t>(y) * width + x]; }
};

// Pixel buffer: RGBA8, row-major, top-left origin.
struct FrameBuffer {
    std::vector<uint8_t> bytes;
    int width  = 0;
    int height = 0;

    void resize(int w, int h)
    {
        width  = w;
        height = h;
        bytes.assign(byte_size(w, h), 0xFF);
    }

    static size_t byte_size(int w, int h)
    {
        return static_cast<size_t>(w) * static_cast<size_t>(h) * 4;
    }

    const uint8_t* pixel(int x, int y) const
    {
        return bytes.data() + (static_cast<size_t>(y) * width + x) * 4;
    }
};

class IFieldRenderer {
public:
    virtual ~IFieldRenderer() = default;
    virtual void render(const Viewport& view, int max_iter, IterationField& field) = 0;
};
