/**
 * @file RrReader.cpp
 * @brief Implementation of the RR interval CSV reader.
 * @author MasterLaplace
 */

#include "hrv/io/RrReader.hpp"

#include "hrv/core/Log.hpp"

#include <charconv>
#include <format>
#include <fstream>
#include <sstream>

namespace hrv::io {

namespace {

[[nodiscard]] std::string_view trim(std::string_view token) noexcept
{
    constexpr std::string_view kBlank = " \t\r";
    const auto first = token.find_first_not_of(kBlank);
    if (first == std::string_view::npos)
        return {};
    const auto last = token.find_last_not_of(kBlank);
    return token.substr(first, last - first + 1);
}

} // namespace

core::Expected<core::RrSeries> parseRrCsv(std::istream &input, std::string_view sourceName)
{
    core::RrSeries rr;
    std::string line;
    core::usize lineNumber = 0;

    while (std::getline(input, line)) {
        ++lineNumber;
        const std::string_view content = trim(line);
        if (content.empty() || content.front() == '#' || content.front() == '%')
            continue;

        std::istringstream ss{std::string(content)};
        std::string token;
        while (std::getline(ss, token, ',')) {
            const std::string_view value = trim(token);
            if (value.empty())
                continue;

            core::f64 parsed = 0.0;
            const auto [end, ec] = std::from_chars(value.data(), value.data() + value.size(), parsed);
            if (ec != std::errc{} || end != value.data() + value.size()) {
                return core::makeError(core::ErrorCode::kFileParseError,
                    std::format("invalid value '{}' at {}:{}", value, sourceName, lineNumber));
            }
            rr.push_back(parsed);
        }
    }

    if (rr.empty())
        return core::makeError(core::ErrorCode::kFileParseError,
            std::format("no RR intervals in {}", sourceName));

    return rr;
}

core::Expected<core::RrSeries> readRrCsv(const std::string &path)
{
    std::ifstream file(path);
    if (!file.is_open())
        return core::makeError(core::ErrorCode::kFileNotFound, path);

    auto rr = parseRrCsv(file, path);
    if (rr)
        core::Log::debug("io", std::format("{}: {} intervals", path, rr->size()));
    return rr;
}

} // namespace hrv::io
