/**
 * @file Assert.hpp
 * @brief Debug assertion macro with source location.
 *
 * HRV_ASSERT is active only when HRV_DEBUG is defined. It guards
 * programming errors only; data-dependent failures travel through
 * Expected<T>.
 *
 * @author MasterLaplace
 * @version 0.1.0
 * @date 2026-10-19
 * @copyright MIT License
 */
#pragma once

#ifndef HRV_CORE_ASSERT_HPP
    #define HRV_CORE_ASSERT_HPP

    #include "Platform.hpp"

    #include <cstdio>
    #include <cstdlib>
    #include <source_location>

namespace hrv::core::detail {

[[noreturn]] inline void assertFail(
    const char *expr,
    std::source_location loc = std::source_location::current()
) {
    std::fprintf(
        stderr,
        "[HRV ASSERT] %s:%u in %s: \"%s\" failed\n",
        loc.file_name(), loc.line(), loc.function_name(), expr
    );
    std::abort();
}

} // namespace hrv::core::detail

    #ifdef HRV_DEBUG
        #define HRV_ASSERT(cond)                                          \
            do {                                                           \
                if (HRV_UNLIKELY(!(cond)))                                 \
                    ::hrv::core::detail::assertFail(#cond);                \
            } while (false)
    #else
        #define HRV_ASSERT(cond) ((void)0)
    #endif

#endif // HRV_CORE_ASSERT_HPP
