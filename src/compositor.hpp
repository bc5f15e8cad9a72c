#pragma once

#include "palette.hpp"
#include "renderer.hpp"

enum class ColorMode {
    Smooth    = 0,  // palette indexed by the smoothed iteration count
    Histogram = 1,  // palette indexed by the cumulative distribution of counts
};
constexpr int COLOR_MODE_COUNT = 2;

const char* color_mode_name(ColorMode mode);

// Fill `frame` (resized to the field's dimensions) with RGBA8 pixels.
// Interior points always get palette.interior().
void composite(const IterationField& field, const Palette& palette,
               ColorMode mode, FrameBuffer& frame);
