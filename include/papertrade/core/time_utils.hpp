// include/papertrade/core/time_utils.hpp
#pragma once

#include <time.h>
#include <chrono>
#include <ctime>
#include <iomanip>
#include <optional>
#include <sstream>
#include <string>
#include "papertrade/core/types.hpp"

namespace papertrade {
namespace core {

/**
 * @brief Thread-safe wrapper for localtime
 * @param time Pointer to time_t value
 * @param result Pointer to tm struct where result will be stored
 * @return Pointer to the result tm struct on success, nullptr on failure
 */
inline std::tm* safe_localtime(const std::time_t* time, std::tm* result) {
#ifdef _WIN32
    if (localtime_s(result, time) != 0) {
        return nullptr;
    }
    return result;
#else
    return localtime_r(time, result);
#endif
}

/**
 * @brief Thread-safe wrapper for gmtime
 */
inline std::tm* safe_gmtime(const std::time_t* time, std::tm* result) {
#ifdef _WIN32
    if (gmtime_s(result, time) != 0) {
        return nullptr;
    }
    return result;
#else
    return gmtime_r(time, result);
#endif
}

/**
 * @brief Format a timestamp in UTC
 * @param ts Timestamp to format
 * @param format strftime-compatible format
 */
inline std::string format_timestamp(const Timestamp& ts, const char* format = "%Y-%m-%d %H:%M:%S") {
    auto t = std::chrono::system_clock::to_time_t(ts);
    std::tm result{};
    if (safe_gmtime(&t, &result) == nullptr) {
        return "";
    }
    char buffer[64];
    std::strftime(buffer, sizeof(buffer), format, &result);
    return std::string(buffer);
}

/**
 * @brief Get current time as a string with specified format
 * @param format Format string compatible with strftime
 * @param use_local_time If true, uses local time, otherwise GMT
 */
inline std::string get_formatted_time(const char* format, bool use_local_time = true) {
    auto now = std::chrono::system_clock::now();
    auto now_c = std::chrono::system_clock::to_time_t(now);
    std::tm result{};

    if (use_local_time) {
        safe_localtime(&now_c, &result);
    } else {
        safe_gmtime(&now_c, &result);
    }

    char buffer[128];
    std::strftime(buffer, sizeof(buffer), format, &result);
    return std::string(buffer);
}

/**
 * @brief Parse a UTC "YYYY-MM-DD HH:MM:SS" (or "YYYY-MM-DDTHH:MM:SS") string
 * @return Parsed timestamp, or nullopt if the text does not match
 */
inline std::optional<Timestamp> parse_timestamp(std::string text) {
    if (text.size() > 10 && text[10] == 'T') {
        text[10] = ' ';
    }
    std::tm tm{};
    std::istringstream ss(text);
    ss >> std::get_time(&tm, "%Y-%m-%d %H:%M:%S");
    if (ss.fail()) {
        // Date-only rows from daily candles
        ss.clear();
        ss.str(text);
        tm = std::tm{};
        ss >> std::get_time(&tm, "%Y-%m-%d");
        if (ss.fail()) {
            return std::nullopt;
        }
    }
#ifdef _WIN32
    std::time_t t = _mkgmtime(&tm);
#else
    std::time_t t = timegm(&tm);
#endif
    if (t == static_cast<std::time_t>(-1)) {
        return std::nullopt;
    }
    return std::chrono::system_clock::from_time_t(t);
}

}  // namespace core
}  // namespace papertrade
