#include "utils.hpp"
#include <iomanip>
#include <sstream>
#include <string>
#include <stdexcept>
#include <cmath>
#include <cctype>
#include <ctime>
#include <algorithm>

namespace core {
namespace utils {

    Timestamp stringToTimestamp(const std::string& text) {
        const std::string input = trim(text);
        std::tm tm = {};
        std::istringstream ss(input);

        // 1. Date part, optionally followed by 'T' or ' ' and a time part
        ss >> std::get_time(&tm, "%Y-%m-%d");
        if (ss.fail()) {
            throw std::runtime_error("Failed to parse timestamp (date part): " + text);
        }
        if (ss.peek() == 'T' || ss.peek() == ' ') {
            ss.ignore();
            ss >> std::get_time(&tm, "%H:%M:%S");
            if (ss.fail()) {
                throw std::runtime_error("Failed to parse timestamp (time part): " + text);
            }
        }

        // 2. Optional fractional seconds
        double fractional_seconds = 0.0;
        if (ss.peek() == '.') {
            ss.ignore();
            std::string digits;
            while (std::isdigit(ss.peek()) && digits.size() < 9) {
                digits += static_cast<char>(ss.get());
            }
            while (std::isdigit(ss.peek())) {
                ss.ignore();
            }
            if (!digits.empty()) {
                fractional_seconds = std::stod(digits) / std::pow(10.0, static_cast<double>(digits.length()));
            }
        }

        // 3. Optional offset (Z, +HH:MM, -HH:MM). Absent means UTC.
        std::chrono::seconds offset_duration(0);
        char sign_or_z = 0;
        if (ss >> sign_or_z) {
            if (sign_or_z == '+' || sign_or_z == '-') {
                int offset_h = 0;
                int offset_m = 0;
                char colon = ' ';
                if (!(ss >> std::setw(2) >> offset_h >> colon >> std::setw(2) >> offset_m) || colon != ':') {
                    throw std::runtime_error("Failed to parse timestamp (timezone offset HH:MM): " + text);
                }
                offset_duration = std::chrono::hours(offset_h) + std::chrono::minutes(offset_m);
                if (sign_or_z == '-') {
                    offset_duration *= -1;
                }
            } else if (sign_or_z != 'Z') {
                throw std::runtime_error("Invalid timezone indicator '" + std::string(1, sign_or_z) + "' in timestamp: " + text);
            }
        }

        #ifdef _WIN32
            time_t tt = _mkgmtime(&tm);
        #else
            time_t tt = timegm(&tm);
        #endif
        if (tt == static_cast<time_t>(-1)) {
            throw std::runtime_error("Failed to convert parsed date/time to UTC epoch seconds: " + text);
        }

        auto base_tp_utc = std::chrono::system_clock::from_time_t(tt);
        base_tp_utc += std::chrono::duration_cast<std::chrono::system_clock::duration>(
            std::chrono::duration<double>(fractional_seconds));

        // 2015-04-20T00:00:00+05:30 is 2015-04-19T18:30:00Z
        return base_tp_utc - offset_duration;
    }

    std::string timestampToString(const Timestamp& ts) {
        auto tt = std::chrono::system_clock::to_time_t(ts);
        std::tm time_tm;
        #ifdef _WIN32
            gmtime_s(&time_tm, &tt);
        #else
            gmtime_r(&tt, &time_tm);
        #endif

        std::ostringstream oss;
        oss << std::put_time(&time_tm, "%Y-%m-%d %H:%M:%S");
        return oss.str();
    }

    std::string toLower(std::string text) {
        std::transform(text.begin(), text.end(), text.begin(),
            [](unsigned char c){ return static_cast<char>(std::tolower(c)); });
        return text;
    }

    std::string toUpper(std::string text) {
        std::transform(text.begin(), text.end(), text.begin(),
            [](unsigned char c){ return static_cast<char>(std::toupper(c)); });
        return text;
    }

    std::string trim(const std::string& text) {
        const auto first = text.find_first_not_of(" \t\r\n");
        if (first == std::string::npos) {
            return "";
        }
        const auto last = text.find_last_not_of(" \t\r\n");
        return text.substr(first, last - first + 1);
    }

} // namespace utils
} // namespace core
