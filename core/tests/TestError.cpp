/**
 * @file TestError.cpp
 * @brief Unit tests for core::Error, Expected and HRV_TRY.
 */

#include <catch2/catch_test_macros.hpp>

#include "hrv/core/Error.hpp"
#include "hrv/core/Expected.hpp"

#include <string>

namespace hrv::core {

namespace {

Expected<int> parsePositive(int value)
{
    if (value <= 0)
        return makeError(ErrorCode::kInvalidArgument, "not positive");
    return value;
}

Expected<int> doublePositive(int value)
{
    const int v = HRV_TRY(parsePositive(value));
    return v * 2;
}

ExpectedVoid requirePositive(int value)
{
    if (value <= 0)
        return makeError(ErrorCode::kInvalidArgument, "not positive");
    return {};
}

ExpectedVoid requireBothPositive(int a, int b)
{
    HRV_TRY_VOID(requirePositive(a));
    HRV_TRY_VOID(requirePositive(b));
    return {};
}

} // namespace

TEST_CASE("errorCodeName names every code", "[core][error]")
{
    REQUIRE(errorCodeName(ErrorCode::kNone) == "None");
    REQUIRE(errorCodeName(ErrorCode::kInvalidRrInterval) == "InvalidRrInterval");
    REQUIRE(errorCodeName(ErrorCode::kSpectralEstimationFailed) == "SpectralEstimationFailed");
    REQUIRE(errorCodeName(ErrorCode::kIoError) == "IoError");
}

TEST_CASE("Error::format includes code and message", "[core][error]")
{
    const Error err{ErrorCode::kFileNotFound, "rr.csv"};
    const std::string text = err.format();

    REQUIRE(text.find("[FileNotFound]") != std::string::npos);
    REQUIRE(text.find("rr.csv") != std::string::npos);
}

TEST_CASE("Error::withContext prefixes the message", "[core][error]")
{
    const Error err{ErrorCode::kInvalidRrInterval, "negative value"};
    const Error wrapped = err.withContext("subject s01");

    REQUIRE(wrapped.code() == ErrorCode::kInvalidRrInterval);
    REQUIRE(wrapped.message() == "subject s01: negative value");
    REQUIRE(wrapped.location().line() == err.location().line());
}

TEST_CASE("HRV_TRY propagates errors and unwraps values", "[core][error]")
{
    SECTION("value")
    {
        auto result = doublePositive(21);
        REQUIRE(result.has_value());
        REQUIRE(*result == 42);
    }

    SECTION("error")
    {
        auto result = doublePositive(-1);
        REQUIRE_FALSE(result.has_value());
        REQUIRE(result.error().code() == ErrorCode::kInvalidArgument);
    }

    SECTION("void")
    {
        REQUIRE(requireBothPositive(3, 4).has_value());
        REQUIRE_FALSE(requireBothPositive(3, 0).has_value());
    }
}

} // namespace hrv::core
