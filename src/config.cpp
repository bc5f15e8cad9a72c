#include "config.hpp"
#include "mandelbrot_set.hpp"

#include <cerrno>
#include <cstdio>
#include <cstdlib>
#include <cstring>
#include <stdexcept>

static long parse_long(const char* opt, const char* text, long lo, long hi)
{
    char* end = nullptr;
    errno = 0;
    const long v = std::strtol(text, &end, 10);
    if (errno != 0 || end == text || *end != '\0' || v < lo || v > hi)
        throw std::invalid_argument(std::string(opt) + " expects an integer in ["
                                    + std::to_string(lo) + ", " + std::to_string(hi)
                                    + "], got '" + text + "'");
    return v;
}

static const char* next_value(int& i, int argc, const char* const argv[])
{
    if (i + 1 >= argc)
        throw std::invalid_argument(std::string(argv[i]) + " requires an argument");
    return argv[++i];
}

AppConfig parse_args(int argc, const char* const argv[])
{
    AppConfig cfg;
    for (int i = 1; i < argc; ++i) {
        const char* a = argv[i];
        if (std::strcmp(a, "--width") == 0 || std::strcmp(a, "-w") == 0) {
            cfg.width = static_cast<int>(parse_long(a, next_value(i, argc, argv), 1, 16384));
        } else if (std::strcmp(a, "--height") == 0 || std::strcmp(a, "-h") == 0) {
            cfg.height = static_cast<int>(parse_long(a, next_value(i, argc, argv), 1, 16384));
        } else if (std::strcmp(a, "--iter") == 0 || std::strcmp(a, "-i") == 0) {
            cfg.max_iter = static_cast<int>(parse_long(a, next_value(i, argc, argv), 1,
                                                            MandelbrotSet::MAX_ITER_LIMIT));
        } else if (std::strcmp(a, "--seed") == 0) {
            cfg.seed = static_cast<uint32_t>(parse_long(a, next_value(i, argc, argv), 0, 4294967295L));
        } else if (std::strcmp(a, "--histogram") == 0) {
            cfg.color_mode = ColorMode::Histogram;
        } else if (std::strcmp(a, "--random-palette") == 0 || std::strcmp(a, "-p") == 0) {
            cfg.random_palette = true;
        } else if (std::strcmp(a, "--render") == 0 || std::strcmp(a, "-o") == 0) {
            cfg.output = next_value(i, argc, argv);
        } else if (std::strcmp(a, "--benchmark") == 0) {
            cfg.benchmark = true;
        } else if (std::strcmp(a, "--no-vsync") == 0) {
            cfg.vsync = false;
        } else if (std::strcmp(a, "--help") == 0) {
            cfg.show_help = true;
        } else {
            throw std::invalid_argument(std::string("unknown option '") + a + "'");
        }
    }
    return cfg;
}

void print_usage(const char* prog)
{
    std::printf("Mandel Vision - interactive Mandelbrot explorer\n\n");
    std::printf("Usage: %s [options]\n\n", prog);
    std::printf("Options:\n");
    std::printf("  --width,  -w <n>        Frame width in pixels (default 640)\n");
    std::printf("  --height, -h <n>        Frame height in pixels (default 480)\n");
    std::printf("  --iter,   -i <n>        Maximum iterations (default 1000)\n");
    std::printf("  --seed <n>              Palette RNG seed (0 = random)\n");
    std::printf("  --random-palette, -p    Start with a random palette\n");
    std::printf("  --histogram             Histogram-equalized coloring\n");
#ifdef HAVE_JXL
    const char* formats = "PNG/JXL";
#else
    const char* formats = "PNG";
#endif
    std::printf("  --render, -o <file>     Render one frame to %s and exit\n", formats);
    std::printf("  --benchmark             Run the CLI benchmark and exit\n");
    std::printf("  --no-vsync              Disable vsync\n");
    std::printf("  --help                  Show this help message\n");
    std::printf("\nControls:\n");
    std::printf("  Left click    Zoom in (x2) on the cursor\n");
    std::printf("  Right click   Zoom out (x2) on the cursor\n");
    std::printf("  Wheel         Zoom in / out on the cursor\n");
    std::printf("  P             Random palette\n");
    std::printf("  R             Reset view and palette\n");
    std::printf("  H             Toggle histogram coloring\n");
    std::printf("  PgUp / PgDn   Double / halve iterations\n");
    std::printf("  Ctrl+S        Export image\n");
    std::printf("  Esc           Quit\n");
}
