#pragma once

#include "compositor.hpp"

#include <cstdint>
#include <string>

struct AppConfig {
    int         width          = 640;
    int         height         = 480;
    int         max_iter       = 1000;
    uint32_t    seed           = 0;      // 0 = pick one at startup
    ColorMode   color_mode     = ColorMode::Smooth;
    bool        random_palette = false;
    bool        vsync          = true;
    bool        benchmark      = false;
    bool        show_help      = false;
    std::string output;                  // non-empty: render once to this file and exit
};

// Throws std::invalid_argument on unknown options or bad values.
AppConfig parse_args(int argc, const char* const argv[]);

void print_usage(const char* prog);
