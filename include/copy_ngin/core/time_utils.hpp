#pragma once

#include <time.h>
#include <chrono>
#include <cstdint>
#include <cstdio>
#include <ctime>
#include <string>
#include "copy_ngin/core/types.hpp"

namespace copy_ngin {
namespace core {

/**
 * @brief Thread-safe wrapper for gmtime
 *
 * @param time Pointer to time_t value
 * @param result Pointer to tm struct where result will be stored
 * @return Pointer to the result tm struct on success, nullptr on failure
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
 * @brief Current UTC time formatted with strftime
 */
inline std::string get_formatted_time(const char* format) {
    auto now_c = std::chrono::system_clock::to_time_t(std::chrono::system_clock::now());
    std::tm result;
    safe_gmtime(&now_c, &result);

    char buffer[128];
    std::strftime(buffer, sizeof(buffer), format, &result);
    return std::string(buffer);
}

// Provider timestamps are milliseconds since the Unix epoch
inline int64_t to_epoch_ms(const Timestamp& ts) {
    return std::chrono::duration_cast<std::chrono::milliseconds>(ts.time_since_epoch()).count();
}

inline Timestamp from_epoch_ms(int64_t ms) {
    return Timestamp(std::chrono::duration_cast<Timestamp::duration>(std::chrono::milliseconds(ms)));
}

/**
 * @brief Truncate a timestamp to the start of its bucket
 * @param ts Timestamp to truncate
 * @param step Bucket width, measured from the Unix epoch
 */
inline Timestamp floor_to_step(const Timestamp& ts, std::chrono::minutes step) {
    auto since_epoch = ts.time_since_epoch();
    auto step_d = std::chrono::duration_cast<Timestamp::duration>(step);
    auto remainder = since_epoch % step_d;
    if (remainder.count() < 0) {
        remainder += step_d;
    }
    return Timestamp(since_epoch - remainder);
}

inline Timestamp floor_to_minute(const Timestamp& ts) {
    return floor_to_step(ts, std::chrono::minutes(1));
}

/**
 * @brief Format a timestamp as UTC "YYYY-MM-DDTHH:MM:SSZ"
 */
inline std::string format_timestamp_utc(const Timestamp& ts) {
    auto time_c = std::chrono::system_clock::to_time_t(ts);
    std::tm result;
    safe_gmtime(&time_c, &result);
    char buffer[32];
    std::strftime(buffer, sizeof(buffer), "%Y-%m-%dT%H:%M:%SZ", &result);
    return std::string(buffer);
}

/**
 * @brief Format a timestamp as UTC "YYYY-MM-DDTHH:MM:SS.mmmZ"
 */
inline std::string format_timestamp_utc_ms(const Timestamp& ts) {
    int64_t ms = to_epoch_ms(ts);
    int64_t millis = ms % 1000;
    if (millis < 0) {
        millis += 1000;
    }
    std::string text = format_timestamp_utc(from_epoch_ms(ms - millis));
    char suffix[8];
    std::snprintf(suffix, sizeof(suffix), ".%03dZ", static_cast<int>(millis));
    return text.substr(0, text.size() - 1) + suffix;
}

}  // namespace core
}  // namespace copy_ngin
