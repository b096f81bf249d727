/**
 * @file RrReader.hpp
 * @brief Loads RR interval sequences from CSV text.
 * @author MasterLaplace
 *
 * Every comma or newline separated token is one interval in milliseconds.
 * Blank lines and lines starting with '#' or '%' are ignored.
 */

#pragma once

#include "hrv/core/Expected.hpp"
#include "hrv/core/Types.hpp"

#include <istream>
#include <string>
#include <string_view>

namespace hrv::io {

/**
 * @brief Parses RR intervals from a text stream.
 *
 * @param input      Stream to consume
 * @param sourceName Name used in error messages
 * @return The intervals in file order, or kFileParseError on a non-numeric
 *         token or when no value is found
 */
[[nodiscard]] core::Expected<core::RrSeries> parseRrCsv(std::istream &input, std::string_view sourceName);

/**
 * @brief Reads RR intervals from a CSV file.
 *
 * @return The intervals, kFileNotFound when the file cannot be opened, or
 *         the errors of parseRrCsv
 */
[[nodiscard]] core::Expected<core::RrSeries> readRrCsv(const std::string &path);

} // namespace hrv::io
