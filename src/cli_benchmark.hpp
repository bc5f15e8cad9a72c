#pragma once

#include "cpu_renderer.hpp"
#include "mandelbrot_set.hpp"

#include <algorithm>
#include <chrono>
#include <cstdio>
#include <vector>

inline int run_cli_benchmark()
{
    constexpr int W = 1920, H = 1080, RUNS = 4, BEST_N = 2;

    struct TestCase {
        const char* label;
        int         max_iter;
        ColorMode   mode;
        bool        shortcuts;
    };

    const TestCase tests[] = {
        {"Default view, 256 iter",    256, ColorMode::Smooth,    true },
        {"Default view, 1000 iter",  1000, ColorMode::Smooth,    true },
        {"Default view, 4096 iter",  4096, ColorMode::Smooth,    true },
        {"Histogram, 1000 iter",     1000, ColorMode::Histogram, true },
        // No cardioid/bulb or periodicity shortcuts
        {"Default view, 256 iter",    256, ColorMode::Smooth,    false},
        {"Default view, 1000 iter",  1000, ColorMode::Smooth,    false},
    };

    printf("Mandel Vision CLI Benchmark\n");
    printf("%dx%d, 1 thread, %d runs (avg best %d)\n\n", W, H, RUNS, BEST_N);
    printf("%-28s %-10s %10s %8s\n", "Label", "Path", "ms", "Mpix/s");
    printf("------------------------------------------------------------\n");

    std::vector<uint8_t> frame(FrameBuffer::byte_size(W, H));

    for (const auto& t : tests) {
        MandelbrotSet set(W, H, t.max_iter, 1);
        set.set_color_mode(t.mode);
        if (auto* cpu = dynamic_cast<CpuRenderer*>(&set.renderer()))
            cpu->set_shortcuts(t.shortcuts);

        // Warm-up
        set.draw(frame.data(), frame.size());

        std::vector<double> times(RUNS);
        for (int r = 0; r < RUNS; ++r) {
            set.resize(W, H);   // same size: only invalidates the field
            const auto t0 = std::chrono::steady_clock::now();
            set.draw(frame.data(), frame.size());
            times[r] = std::chrono::duration<double, std::milli>(
                           std::chrono::steady_clock::now() - t0).count();
        }
        std::sort(times.begin(), times.end());
        double avg_ms = 0.0;
        for (int i = 0; i < BEST_N; ++i) avg_ms += times[i];
        avg_ms /= BEST_N;
        const double mpixs = (W * H) / (avg_ms * 1000.0);

        printf("%-28s %-10s %10.1f %8.2f\n", t.label,
               t.shortcuts ? "shortcut" : "plain", avg_ms, mpixs);
    }
    return 0;
}
