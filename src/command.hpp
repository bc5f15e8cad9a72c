#pragma once

#include "mandelbrot_set.hpp"

#include <cstdio>
#include <exception>
#include <string>

// Apply a host command to the set. A failure leaves the set drawable; the
// reason is logged and stored in `error` (cleared on success).
template<typename F>
inline bool apply_command(MandelbrotSet& set, std::string& error, F&& command)
{
    try {
        command(set);
        error.clear();
        return true;
    } catch (const std::exception& e) {
        error = e.what();
        std::fprintf(stderr, "Rejected command: %s\n", e.what());
        return false;
    }
}
