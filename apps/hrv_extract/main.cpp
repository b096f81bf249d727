/**
 * @file main.cpp
 * @brief hrv_extract entry-point: RR CSV files in, labelled feature CSV out.
 *
 * @author MasterLaplace
 * @version 0.1.0
 * @date 2026-10-19
 * @copyright MIT License
 */

#include <hrv/core/Log.hpp>
#include <hrv/core/Types.hpp>
#include <hrv/io/FeatureWriter.hpp>
#include <hrv/io/RrReader.hpp>
#include <hrv/pipeline/Config.hpp>
#include <hrv/pipeline/DatasetBuilder.hpp>

#include <charconv>
#include <cstdio>
#include <filesystem>
#include <format>
#include <iostream>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

using namespace hrv;

namespace {

struct Options {
    std::vector<std::string> inputs;
    pipeline::PipelineConfig::Builder config;
    std::optional<core::f64> age;
    std::optional<core::i32> gender;
    std::optional<std::string> out;
    bool verbose = false;
};

void printUsage(const char *program)
{
    std::fprintf(stderr,
        "usage: %s <rr.csv>... [--window N] [--step N] [--fs HZ] [--threads N]\n"
        "       [--reject-artifacts] [--age Y] [--gender G] [--out FILE] [--verbose]\n",
        program);
}

template <typename T>
[[nodiscard]] std::optional<T> parseNumber(std::string_view text)
{
    T value{};
    const auto [end, ec] = std::from_chars(text.data(), text.data() + text.size(), value);
    if (ec != std::errc{} || end != text.data() + text.size())
        return std::nullopt;
    return value;
}

[[nodiscard]] core::Expected<Options> parseArgs(int argc, char *argv[])
{
    Options opts;

    for (int i = 1; i < argc; ++i)
    {
        const std::string_view arg = argv[i];

        if (arg == "--reject-artifacts")
        {
            opts.config.rejectArtifacts(true);
            continue;
        }
        if (arg == "--verbose")
        {
            opts.verbose = true;
            continue;
        }
        if (!arg.starts_with("--"))
        {
            opts.inputs.emplace_back(arg);
            continue;
        }

        if (i + 1 >= argc)
            return core::makeError(core::ErrorCode::kInvalidArgument, std::format("{} expects a value", arg));
        const std::string_view value = argv[++i];
        const auto bad = [&] {
            return core::makeError(core::ErrorCode::kInvalidArgument,
                std::format("invalid value '{}' for {}", value, arg));
        };

        if (arg == "--window" || arg == "--step" || arg == "--threads")
        {
            const auto n = parseNumber<core::u32>(value);
            if (!n)
                return bad();
            if (arg == "--window")
                opts.config.window(*n);
            else if (arg == "--step")
                opts.config.step(*n);
            else
                opts.config.threadCount(*n);
        }
        else if (arg == "--fs")
        {
            const auto hz = parseNumber<core::f64>(value);
            if (!hz)
                return bad();
            opts.config.fsInterp(*hz);
        }
        else if (arg == "--age")
        {
            opts.age = parseNumber<core::f64>(value);
            if (!opts.age)
                return bad();
        }
        else if (arg == "--gender")
        {
            opts.gender = parseNumber<core::i32>(value);
            if (!opts.gender)
                return bad();
        }
        else if (arg == "--out")
        {
            opts.out = std::string(value);
        }
        else
        {
            return core::makeError(core::ErrorCode::kInvalidArgument, std::format("unknown option {}", arg));
        }
    }

    if (opts.inputs.empty())
        return core::makeError(core::ErrorCode::kInvalidArgument, "no input file");

    return opts;
}

[[nodiscard]] core::ExpectedVoid run(const Options &opts)
{
    const pipeline::PipelineConfig config = HRV_TRY(opts.config.build());

    std::vector<pipeline::Subject> subjects;
    subjects.reserve(opts.inputs.size());
    for (const auto &path : opts.inputs)
    {
        pipeline::Subject subject;
        subject.info.id = std::filesystem::path(path).stem().string();
        subject.info.age = opts.age;
        subject.info.genderEnc = opts.gender;
        subject.rr = HRV_TRY(io::readRrCsv(path));
        subjects.push_back(std::move(subject));
    }

    const pipeline::DatasetBuilder builder(config);
    const auto rows = HRV_TRY(builder.build(subjects));

    core::Log::info("cli", std::format("{} subjects, {} rows", subjects.size(), rows.size()));

    if (opts.out)
        return io::writeFeatureCsv(*opts.out, rows);

    io::writeFeatureCsv(std::cout, rows);
    std::cout.flush();
    if (!std::cout)
        return core::makeError(core::ErrorCode::kIoError, "write to stdout failed");
    return {};
}

} // namespace

int main(int argc, char *argv[])
{
    core::Log::setMinLevel(core::LogLevel::kWarn);

    auto opts = parseArgs(argc, argv);
    if (!opts)
    {
        core::Log::error("cli", opts.error().format());
        printUsage(argv[0]);
        return 1;
    }

    if (opts->verbose)
        core::Log::setMinLevel(core::LogLevel::kDebug);

    if (auto result = run(*opts); !result)
    {
        core::Log::error("cli", result.error().format());
        return 1;
    }
    return 0;
}
