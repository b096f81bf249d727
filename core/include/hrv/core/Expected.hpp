/**
 * @file Expected.hpp
 * @brief Monadic error-handling type built on std::expected.
 *
 * Provides Expected<T> as an alias for std::expected<T, Error> and the
 * HRV_TRY convenience macros for early-return propagation.
 *
 * @author MasterLaplace
 * @version 0.1.0
 * @date 2026-10-19
 * @copyright MIT License
 */
#pragma once

#ifndef HRV_CORE_EXPECTED_HPP
    #define HRV_CORE_EXPECTED_HPP

    #include "Error.hpp"

    #include <expected>

namespace hrv::core {

/**
 * @brief Alias for an expected value or a structured Error.
 * @tparam T The success-path value type.
 */
template <typename T>
using Expected = std::expected<T, Error>;

/**
 * @brief Alias for operations that succeed with no value.
 */
using ExpectedVoid = Expected<void>;

} // namespace hrv::core

/**
 * @brief Propagate an error from an Expected expression.
 *
 * Evaluates @p expr once.  If the result holds an error, the enclosing
 * function immediately returns that error wrapped in an unexpected.
 * Otherwise the macro yields the contained value.
 *
 * @param expr An expression of type hrv::core::Expected<U>.
 */
#define HRV_TRY(expr)                                                     \
    ({                                                                     \
        auto &&_hrv_result = (expr);                                       \
        if (!_hrv_result.has_value()) [[unlikely]]                         \
            return std::unexpected(std::move(_hrv_result.error()));        \
        std::move(_hrv_result.value());                                    \
    })

/**
 * @brief Propagate an error from an ExpectedVoid expression.
 * @param expr An expression of type hrv::core::ExpectedVoid.
 */
#define HRV_TRY_VOID(expr)                                                \
    do {                                                                    \
        auto &&_hrv_result = (expr);                                       \
        if (!_hrv_result.has_value()) [[unlikely]]                         \
            return std::unexpected(std::move(_hrv_result.error()));        \
    } while (false)

#endif // HRV_CORE_EXPECTED_HPP
