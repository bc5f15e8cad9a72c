#include <doctest/doctest.h>

#include "config.hpp"

#include <stdexcept>

TEST_CASE("config: defaults without arguments") {
    const char* argv[] = {"mandelvision"};
    const AppConfig cfg = parse_args(1, argv);
    CHECK(cfg.width == 640);
    CHECK(cfg.height == 480);
    CHECK(cfg.max_iter == 1000);
    CHECK(cfg.seed == 0);
    CHECK(cfg.color_mode == ColorMode::Smooth);
    CHECK_FALSE(cfg.random_palette);
    CHECK(cfg.vsync);
    CHECK_FALSE(cfg.benchmark);
    CHECK_FALSE(cfg.show_help);
    CHECK(cfg.output.empty());
}

TEST_CASE("config: long and short options") {
    const char* argv[] = {"mandelvision", "--width", "800", "-h", "600", "-i", "256",
                          "--seed", "77", "--histogram", "-p", "-o", "out.png",
                          "--no-vsync"};
    const AppConfig cfg = parse_args(14, argv);
    CHECK(cfg.width == 800);
    CHECK(cfg.height == 600);
    CHECK(cfg.max_iter == 256);
    CHECK(cfg.seed == 77);
    CHECK(cfg.color_mode == ColorMode::Histogram);
    CHECK(cfg.random_palette);
    CHECK(cfg.output == "out.png");
    CHECK_FALSE(cfg.vsync);
}

TEST_CASE("config: flags") {
    const char* argv[] = {"mandelvision", "--benchmark", "--help"};
    const AppConfig cfg = parse_args(3, argv);
    CHECK(cfg.benchmark);
    CHECK(cfg.show_help);
}

TEST_CASE("config: rejects bad input") {
    SUBCASE("unknown option") {
        const char* argv[] = {"mandelvision", "--fast"};
        CHECK_THROWS_AS(parse_args(2, argv), std::invalid_argument);
    }
    SUBCASE("missing value") {
        const char* argv[] = {"mandelvision", "--width"};
        CHECK_THROWS_AS(parse_args(2, argv), std::invalid_argument);
    }
    SUBCASE("not a number") {
        const char* argv[] = {"mandelvision", "-i", "lots"};
        CHECK_THROWS_AS(parse_args(3, argv), std::invalid_argument);
    }
    SUBCASE("trailing garbage") {
        const char* argv[] = {"mandelvision", "-w", "640px"};
        CHECK_THROWS_AS(parse_args(3, argv), std::invalid_argument);
    }
    SUBCASE("zero size") {
        const char* argv[] = {"mandelvision", "--height", "0"};
        CHECK_THROWS_AS(parse_args(3, argv), std::invalid_argument);
    }
    SUBCASE("zero iterations") {
        const char* argv[] = {"mandelvision", "--iter", "0"};
        CHECK_THROWS_AS(parse_args(3, argv), std::invalid_argument);
    }
    SUBCASE("iterations above the limit") {
        const char* argv[] = {"mandelvision", "--iter", "2000000"};
        CHECK_THROWS_AS(parse_args(3, argv), std::invalid_argument);
    }
    SUBCASE("negative seed") {
        const char* argv[] = {"mandelvision", "--seed", "-1"};
        CHECK_THROWS_AS(parse_args(3, argv), std::invalid_argument);
    }
}
