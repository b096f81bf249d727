/**
 * @file TestWindowing.cpp
 * @brief Unit tests for segmentation, input validation and configuration.
 */

#include <catch2/catch_test_macros.hpp>
#include <cmath>
#include <limits>
#include <vector>

#include "hrv/pipeline/Config.hpp"
#include "hrv/pipeline/Validation.hpp"
#include "hrv/pipeline/Windower.hpp"

namespace hrv::pipeline {

TEST_CASE("windowCount follows floor((N - W) / S) + 1", "[pipeline][windower]")
{
    REQUIRE(windowCount(30, 20, 10) == 2);
    REQUIRE(windowCount(20, 20, 10) == 1);
    REQUIRE(windowCount(19, 20, 10) == 0);
    REQUIRE(windowCount(0, 20, 10) == 0);
    REQUIRE(windowCount(100, 10, 30) == 4);
    REQUIRE(windowCount(1000, 60, 20) == 48);
}

TEST_CASE("buildWindows yields views in order", "[pipeline][windower]")
{
    std::vector<core::f64> rr(100);
    for (std::size_t i = 0; i < rr.size(); ++i)
        rr[i] = 700.0 + static_cast<core::f64>(i);

    SECTION("overlapping windows")
    {
        const auto windows = buildWindows(rr, 20, 10);
        REQUIRE(windows.size() == 9);
        REQUIRE(windows[3].startIndex == 30);
        REQUIRE(windows[3].samples.size() == 20);
        REQUIRE(windows[3].samples.data() == rr.data() + 30);
    }

    SECTION("step larger than the window skips beats")
    {
        const auto windows = buildWindows(rr, 10, 30);
        REQUIRE(windows.size() == 4);
        REQUIRE(windows.back().startIndex == 90);
        REQUIRE(windows.back().samples.back() == rr.back());
    }

    SECTION("series shorter than the window")
    {
        REQUIRE(buildWindows(std::span<const core::f64>{rr}.first(5), 20, 10).empty());
    }
}

TEST_CASE("validateRrSeries rejects non-positive or non-finite intervals", "[pipeline][validation]")
{
    std::vector<core::f64> rr(10, 800.0);
    REQUIRE(validateRrSeries(rr).has_value());
    REQUIRE(validateRrSeries({}).has_value());

    const std::vector<core::f64> invalid = {
        0.0, -12.0,
        std::numeric_limits<core::f64>::quiet_NaN(),
        std::numeric_limits<core::f64>::infinity(),
    };
    for (const core::f64 bad : invalid) {
        rr[4] = bad;
        auto result = validateRrSeries(rr);
        REQUIRE_FALSE(result.has_value());
        REQUIRE(result.error().code() == core::ErrorCode::kInvalidRrInterval);
    }
}

TEST_CASE("rejectArtifacts keeps intervals within inclusive bounds", "[pipeline][validation]")
{
    const std::vector<core::f64> rr = {250.0, 300.0, 800.0, 2000.0, 2500.0, 900.0};

    const core::RrSeries kept = rejectArtifacts(rr);
    const core::RrSeries expected = {300.0, 800.0, 2000.0, 900.0};
    REQUIRE(kept == expected);

    const core::RrSeries narrow = rejectArtifacts(rr, 850.0, 950.0);
    REQUIRE(narrow.size() == 1);
}

TEST_CASE("PipelineConfig::Builder defaults and validation", "[pipeline][config]")
{
    SECTION("defaults")
    {
        auto config = PipelineConfig::Builder{}.build();
        REQUIRE(config.has_value());
        REQUIRE(config->window() == 60);
        REQUIRE(config->step() == 20);
        REQUIRE(config->fsInterp() == 4.0);
        REQUIRE(config->minWindowSamples() == 20);
        REQUIRE(config->threadCount() == 1);
        REQUIRE_FALSE(config->rejectArtifacts());
        REQUIRE(config->artifactMinMs() == 300.0);
        REQUIRE(config->artifactMaxMs() == 2000.0);
    }

    SECTION("fluent setters")
    {
        auto config = PipelineConfig::Builder{}
            .window(120).step(30).fsInterp(8.0).threadCount(0)
            .rejectArtifacts(true).artifactBounds(400.0, 1500.0)
            .build();
        REQUIRE(config.has_value());
        REQUIRE(config->window() == 120);
        REQUIRE(config->step() == 30);
        REQUIRE(config->fsInterp() == 8.0);
        REQUIRE(config->threadCount() == 0);
        REQUIRE(config->rejectArtifacts());
        REQUIRE(config->artifactMaxMs() == 1500.0);
    }

    SECTION("invalid parameters")
    {
        REQUIRE_FALSE(PipelineConfig::Builder{}.window(0).build().has_value());
        REQUIRE_FALSE(PipelineConfig::Builder{}.step(0).build().has_value());
        REQUIRE_FALSE(PipelineConfig::Builder{}.fsInterp(0.0).build().has_value());
        REQUIRE_FALSE(PipelineConfig::Builder{}.fsInterp(std::nan("")).build().has_value());
        REQUIRE_FALSE(PipelineConfig::Builder{}.minWindowSamples(1).build().has_value());
        REQUIRE_FALSE(PipelineConfig::Builder{}.artifactBounds(900.0, 800.0).build().has_value());

        auto result = PipelineConfig::Builder{}.window(0).build();
        REQUIRE(result.error().code() == core::ErrorCode::kInvalidArgument);
    }
}

} // namespace hrv::pipeline
