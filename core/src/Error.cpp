/**
 * @file Error.cpp
 * @brief Implementation of Error formatting helpers.
 *
 * @author MasterLaplace
 * @version 0.1.0
 * @date 2026-10-19
 * @copyright MIT License
 */
#include "hrv/core/Error.hpp"

#include <sstream>

namespace hrv::core {

std::string Error::format() const
{
    std::ostringstream os;
    os << '[' << errorCodeName(_code) << "] " << _message
       << " (" << _location.file_name() << ':' << _location.line() << ')';
    return os.str();
}

Error Error::withContext(std::string_view context) const
{
    std::string message;
    message.reserve(context.size() + 2 + _message.size());
    message.append(context).append(": ").append(_message);
    return Error{_code, std::move(message), _location};
}

} // namespace hrv::core
