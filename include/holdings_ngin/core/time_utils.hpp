#pragma once

#include <time.h>
#include <chrono>
#include <ctime>
#include <string>

namespace holdings_ngin {
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
 * @brief Get current time as a string with specified format
 * @param format Format string compatible with strftime
 * @param use_local_time If true, uses local time, otherwise GMT
 */
inline std::string get_formatted_time(const char* format, bool use_local_time = true) {
    auto now_c = std::chrono::system_clock::to_time_t(std::chrono::system_clock::now());
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

}  // namespace core
}  // namespace holdings_ngin
