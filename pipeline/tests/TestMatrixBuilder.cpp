/**
 * @file TestMatrixBuilder.cpp
 * @brief Unit tests for pipeline::MatrixBuilder and median labelling.
 */

#include <catch2/catch_test_macros.hpp>
#include <catch2/matchers/catch_matchers_floating_point.hpp>
#include <cmath>
#include <numbers>
#include <vector>

#include "hrv/pipeline/Labeling.hpp"
#include "hrv/pipeline/MatrixBuilder.hpp"
#include "hrv/pipeline/Windower.hpp"

namespace hrv::pipeline {

using Catch::Matchers::WithinAbs;

namespace {

std::vector<core::f64> modulatedRr(std::size_t beats)
{
    std::vector<core::f64> rr;
    rr.reserve(beats);
    core::f64 t = 0.0;
    for (std::size_t i = 0; i < beats; ++i) {
        const core::f64 v = 820.0
            + 45.0 * std::sin(2.0 * std::numbers::pi * 0.09 * t)
            + 20.0 * std::sin(2.0 * std::numbers::pi * 0.27 * t)
            + 8.0 * std::sin(0.37 * static_cast<core::f64>(i * i));
        rr.push_back(v);
        t += v / 1000.0;
    }
    return rr;
}

PipelineConfig makeConfig(core::usize window, core::usize step, core::u32 threads = 1)
{
    auto config = PipelineConfig::Builder{}.window(window).step(step).threadCount(threads).build();
    REQUIRE(config.has_value());
    return *config;
}

} // namespace

TEST_CASE("MatrixBuilder on a constant 800 ms series", "[pipeline][matrix]")
{
    const std::vector<core::f64> rr(30, 800.0);

    auto matrix = buildFeatureMatrix(rr, 20, 10);
    REQUIRE(matrix.has_value());
    REQUIRE(matrix->size() == 2);
    REQUIRE((*matrix)[0].startIndex == 0);
    REQUIRE((*matrix)[1].startIndex == 10);

    for (const auto &record : *matrix) {
        REQUIRE(record.meanRr == 800.0);
        REQUIRE(record.sdnn == 0.0);
        REQUIRE(record.rmssd == 0.0);
        REQUIRE(record.pnn50 == 0.0);
        REQUIRE(record.cv == 0.0);
        REQUIRE(record.sd1 == 0.0);
        REQUIRE_THAT(record.sd2, WithinAbs(0.0, 1e-9));
        REQUIRE(record.si == 0.0);
        REQUIRE(std::isfinite(record.lf));
        REQUIRE(std::isfinite(record.hf));
        REQUIRE(record.lf >= 0.0);
        REQUIRE(record.hf >= 0.0);
        if (record.hf == 0.0)
            REQUIRE(record.lfHf == 0.0);
    }
}

TEST_CASE("MatrixBuilder row count follows the window formula", "[pipeline][matrix]")
{
    const auto rr = modulatedRr(250);

    SECTION("default window")
    {
        auto matrix = buildFeatureMatrix(rr);
        REQUIRE(matrix.has_value());
        REQUIRE(matrix->size() == windowCount(rr.size(), 60, 20));
    }

    SECTION("windows shorter than the extractor minimum are dropped")
    {
        auto matrix = buildFeatureMatrix(rr, 15, 5);
        REQUIRE(matrix.has_value());
        REQUIRE(matrix->empty());
    }

    SECTION("series shorter than one window")
    {
        auto matrix = buildFeatureMatrix(std::span<const core::f64>{rr}.first(40));
        REQUIRE(matrix.has_value());
        REQUIRE(matrix->empty());
    }

    SECTION("empty series")
    {
        auto matrix = buildFeatureMatrix({});
        REQUIRE(matrix.has_value());
        REQUIRE(matrix->empty());
    }
}

TEST_CASE("MatrixBuilder every row is finite", "[pipeline][matrix]")
{
    auto matrix = buildFeatureMatrix(modulatedRr(400), 40, 10);
    REQUIRE(matrix.has_value());
    REQUIRE_FALSE(matrix->empty());
    for (const auto &record : *matrix)
        REQUIRE(record.isFinite());
}

TEST_CASE("MatrixBuilder is deterministic across runs and thread counts", "[pipeline][matrix]")
{
    const auto rr = modulatedRr(600);

    const MatrixBuilder sequential(makeConfig(60, 10));
    const MatrixBuilder pooled(makeConfig(60, 10, 4));

    auto first = sequential.build(rr);
    auto second = sequential.build(rr);
    auto parallel = pooled.build(rr);

    REQUIRE(first.has_value());
    REQUIRE(second.has_value());
    REQUIRE(parallel.has_value());
    REQUIRE(*first == *second);
    REQUIRE(*first == *parallel);
}

TEST_CASE("MatrixBuilder rejects invalid input", "[pipeline][matrix]")
{
    SECTION("invalid interval")
    {
        auto rr = modulatedRr(100);
        rr[42] = -800.0;
        auto matrix = buildFeatureMatrix(rr);
        REQUIRE_FALSE(matrix.has_value());
        REQUIRE(matrix.error().code() == core::ErrorCode::kInvalidRrInterval);
    }

    SECTION("invalid configuration")
    {
        auto matrix = buildFeatureMatrix(modulatedRr(100), 0, 20);
        REQUIRE_FALSE(matrix.has_value());
        REQUIRE(matrix.error().code() == core::ErrorCode::kInvalidArgument);
    }
}

TEST_CASE("MatrixBuilder artifact rejection filters before windowing", "[pipeline][matrix]")
{
    auto rr = modulatedRr(120);
    rr[3] = 4000.0;
    rr[70] = 150.0;

    auto filtering = PipelineConfig::Builder{}.window(59).step(59).rejectArtifacts(true).build();
    REQUIRE(filtering.has_value());

    auto raw = MatrixBuilder{makeConfig(59, 59)}.build(rr);
    auto cleaned = MatrixBuilder{*filtering}.build(rr);

    REQUIRE(raw.has_value());
    REQUIRE(cleaned.has_value());
    REQUIRE(raw->size() == 2);
    REQUIRE(cleaned->size() == 2);
    REQUIRE((*cleaned)[0].meanRr < (*raw)[0].meanRr);

    SECTION("invalid intervals are filtered too")
    {
        rr[10] = -5.0;
        REQUIRE(MatrixBuilder{*filtering}.build(rr).has_value());
        REQUIRE_FALSE(MatrixBuilder{makeConfig(59, 59)}.build(rr).has_value());
    }
}

TEST_CASE("labelByMedianStressIndex splits on the median", "[pipeline][labeling]")
{
    const auto withSi = [](std::initializer_list<core::f64> values) {
        FeatureMatrix matrix;
        for (const core::f64 si : values) {
            features::FeatureRecord record;
            record.si = si;
            matrix.push_back(record);
        }
        return matrix;
    };

    SECTION("even count")
    {
        const auto matrix = withSi({4.0, 1.0, 3.0, 2.0});
        REQUIRE(medianStressIndex(matrix) == 2.5);
        const std::vector<core::u8> expected = {1, 0, 1, 0};
        REQUIRE(labelByMedianStressIndex(matrix) == expected);
    }

    SECTION("ties at the median are labelled low")
    {
        const auto matrix = withSi({5.0, 1.0, 3.0});
        const std::vector<core::u8> expected = {1, 0, 0};
        REQUIRE(labelByMedianStressIndex(matrix) == expected);
    }

    SECTION("empty matrix")
    {
        REQUIRE(labelByMedianStressIndex(FeatureMatrix{}).empty());
    }
}

} // namespace hrv::pipeline
