/**
 * @file NonCopyable.hpp
 * @brief CRTP base class that deletes copy operations.
 *
 * @author MasterLaplace
 * @version 0.1.0
 * @date 2026-10-19
 * @copyright MIT License
 */
#pragma once

#ifndef HRV_CORE_NON_COPYABLE_HPP
    #define HRV_CORE_NON_COPYABLE_HPP

namespace hrv::core {

/**
 * @brief Inherit to disable copy construction and assignment.
 * @tparam Derived The CRTP derived class.
 */
template <typename Derived>
class NonCopyable {
protected:
    NonCopyable()  = default;
    ~NonCopyable() = default;

    NonCopyable(const NonCopyable &)            = delete;
    NonCopyable &operator=(const NonCopyable &)  = delete;

    NonCopyable(NonCopyable &&)                 = default;
    NonCopyable &operator=(NonCopyable &&)       = default;
};

} // namespace hrv::core

#endif // HRV_CORE_NON_COPYABLE_HPP
