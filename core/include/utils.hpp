#pragma once

#include "datatypes.hpp"
#include <string>
#include <chrono>

namespace core {
namespace utils {

    // Formats a timestamp as "YYYY-MM-DD HH:MM:SS" (UTC). Used for chart axis labels.
    std::string timestampToString(const Timestamp& ts);

    // Parses "YYYY-MM-DD", "YYYY-MM-DD HH:MM:SS" or "YYYY-MM-DDTHH:MM:SS[.fff][Z|+HH:MM]".
    // Strings without an offset are taken as UTC.
    Timestamp stringToTimestamp(const std::string& text);

    std::string toLower(std::string text);
    std::string toUpper(std::string text);
    std::string trim(const std::string& text);

} // namespace utils
} // namespace core
