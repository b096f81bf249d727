/**
 * @file TestCsvIo.cpp
 * @brief Unit tests for the RR reader and the feature CSV writer.
 */

#include <catch2/catch_test_macros.hpp>
#include <catch2/matchers/catch_matchers_string.hpp>

#include "hrv/io/FeatureWriter.hpp"
#include "hrv/io/RrReader.hpp"

#include <filesystem>
#include <fstream>
#include <sstream>
#include <string>
#include <vector>

namespace hrv::io {

using Catch::Matchers::ContainsSubstring;

namespace {

class TempCsvFile {
public:
    TempCsvFile(const std::string &name, const std::string &content)
        : _path(std::filesystem::temp_directory_path() / name)
    {
        std::ofstream ofs(_path);
        ofs << content;
    }

    ~TempCsvFile() { std::filesystem::remove(_path); }

    [[nodiscard]] std::string path() const { return _path.string(); }

private:
    std::filesystem::path _path;
};

std::vector<std::string> lines(const std::string &text)
{
    std::vector<std::string> out;
    std::istringstream ss(text);
    std::string line;
    while (std::getline(ss, line))
        out.push_back(line);
    return out;
}

pipeline::LabeledRow makeRow()
{
    pipeline::LabeledRow row;
    row.subjectId = "s01";
    row.features.startIndex = 20;
    row.features.meanRr = 800.0;
    row.features.sdnn = 42.5;
    row.features.si = 0.25;
    row.stressLabel = 1;
    row.state = {-2, pipeline::AutonomicState::kRest};
    return row;
}

} // namespace

TEST_CASE("readRrCsv reads one interval per token", "[io][csv]")
{
    TempCsvFile csv("hrv_io_rr.csv", "# exported RR\n800,810\n\n% note\n 820 \n790\r\n");

    auto rr = readRrCsv(csv.path());
    REQUIRE(rr.has_value());

    const core::RrSeries expected = {800.0, 810.0, 820.0, 790.0};
    REQUIRE(*rr == expected);
}

TEST_CASE("readRrCsv reports missing and malformed files", "[io][csv]")
{
    SECTION("missing file")
    {
        auto rr = readRrCsv("/nonexistent/hrv_missing.csv");
        REQUIRE_FALSE(rr.has_value());
        REQUIRE(rr.error().code() == core::ErrorCode::kFileNotFound);
    }

    SECTION("non-numeric token")
    {
        TempCsvFile csv("hrv_io_bad.csv", "800\n810,abc\n");
        auto rr = readRrCsv(csv.path());
        REQUIRE_FALSE(rr.has_value());
        REQUIRE(rr.error().code() == core::ErrorCode::kFileParseError);
        REQUIRE_THAT(rr.error().message(), ContainsSubstring("abc"));
        REQUIRE_THAT(rr.error().message(), ContainsSubstring(":2"));
    }

    SECTION("no values")
    {
        std::istringstream input("# header only\n\n");
        auto rr = parseRrCsv(input, "memory");
        REQUIRE_FALSE(rr.has_value());
        REQUIRE(rr.error().code() == core::ErrorCode::kFileParseError);
    }
}

TEST_CASE("writeFeatureCsv emits the header and one line per row", "[io][csv]")
{
    auto withDemographics = makeRow();
    withDemographics.age = 34.0;
    withDemographics.genderEnc = 0;
    const std::vector<pipeline::LabeledRow> rows = {makeRow(), withDemographics};

    std::ostringstream out;
    writeFeatureCsv(out, rows);

    const auto text = lines(out.str());
    REQUIRE(text.size() == 3);
    REQUIRE(text[0] == kFeatureCsvHeader);
    REQUIRE(text[1] == "s01,20,800,42.5,0,0,0,0,0,0,0,0,0.25,,,1,rest");
    REQUIRE(text[2] == "s01,20,800,42.5,0,0,0,0,0,0,0,0,0.25,34,0,1,rest");
}

TEST_CASE("writeFeatureCsv to a file", "[io][csv]")
{
    const std::vector<pipeline::LabeledRow> rows = {makeRow()};

    SECTION("writes the file")
    {
        const auto path = (std::filesystem::temp_directory_path() / "hrv_io_out.csv").string();
        REQUIRE(writeFeatureCsv(path, rows).has_value());

        std::ifstream in(path);
        std::string header;
        std::getline(in, header);
        REQUIRE(header == kFeatureCsvHeader);
        std::filesystem::remove(path);
    }

    SECTION("unwritable path")
    {
        auto result = writeFeatureCsv("/nonexistent/dir/out.csv", rows);
        REQUIRE_FALSE(result.has_value());
        REQUIRE(result.error().code() == core::ErrorCode::kIoError);
    }
}

} // namespace hrv::io
