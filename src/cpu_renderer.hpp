#pragma once

#include "renderer.hpp"

#include <cstdint>

// Scalar escape-time pass over the full grid, top row first.
class CpuRenderer : public IFieldRenderer {
public:
    void render(const Viewport& view, int max_iter, IterationField& field) override;

    double   last_render_ms  = 0.0;
    uint64_t render_count    = 0;   // completed full-grid passes
    uint64_t last_steps      = 0;   // recurrence steps in the last pass
    uint64_t last_interior   = 0;   // pixels classified as non-escaping

    // Disable the cardioid/bulb and periodicity shortcuts (benchmarking only).
    void set_shortcuts(bool b) { use_shortcuts = b; }
    bool shortcuts() const { return use_shortcuts; }

private:
    bool use_shortcuts = true;
};
