// include/decision_gate/core/time_utils.hpp
#pragma once

#include <time.h>
#include <chrono>
#include <cstdint>
#include <ctime>
#include <string>
#include "decision_gate/core/types.hpp"

namespace decision_gate {
namespace core {

/// Reentrant localtime, nullptr on failure
inline std::tm* safe_localtime(const std::time_t* time, std::tm* result) {
#ifdef _WIN32
    return localtime_s(result, time) == 0 ? result : nullptr;
#else
    return localtime_r(time, result);
#endif
}

/// Reentrant gmtime, nullptr on failure
inline std::tm* safe_gmtime(const std::time_t* time, std::tm* result) {
#ifdef _WIN32
    return gmtime_s(result, time) == 0 ? result : nullptr;
#else
    return gmtime_r(time, result);
#endif
}

/**
 * @brief Midnight UTC of a calendar date
 *
 * Evaluation dates, cache keys and ground-truth dates all go through this, so
 * it must not depend on the process time zone. Computed with the days-from-civil
 * algorithm instead of timegm.
 */
inline Timestamp make_utc_date(int year, unsigned month, unsigned day) {
    year -= month <= 2 ? 1 : 0;
    const int era = (year >= 0 ? year : year - 399) / 400;
    const unsigned yoe = static_cast<unsigned>(year - era * 400);
    const unsigned doy = (153 * (month + (month > 2 ? -3 : 9)) + 2) / 5 + day - 1;
    const unsigned doe = yoe * 365 + yoe / 4 - yoe / 100 + doy;
    const int64_t days = static_cast<int64_t>(era) * 146097 + static_cast<int64_t>(doe) - 719468;
    return Timestamp(std::chrono::seconds(days * 86400));
}

/// YYYY-MM-DD of the UTC day containing ts, empty if the time cannot be broken down
inline std::string to_date_string(Timestamp ts) {
    const std::time_t seconds = std::chrono::system_clock::to_time_t(ts);
    std::tm parts{};
    if (safe_gmtime(&seconds, &parts) == nullptr) {
        return "";
    }

    char buffer[16];
    const size_t written = std::strftime(buffer, sizeof(buffer), "%Y-%m-%d", &parts);
    return std::string(buffer, written);
}

/**
 * @brief Current wall-clock time through strftime
 * @param use_local_time Local time when true, UTC otherwise
 */
inline std::string get_formatted_time(const char* format, bool use_local_time = true) {
    const std::time_t now = std::chrono::system_clock::to_time_t(std::chrono::system_clock::now());
    std::tm parts{};
    const std::tm* ok =
        use_local_time ? safe_localtime(&now, &parts) : safe_gmtime(&now, &parts);
    if (ok == nullptr) {
        return "";
    }

    char buffer[128];
    const size_t written = std::strftime(buffer, sizeof(buffer), format, &parts);
    return std::string(buffer, written);
}

}  // namespace core
}  // namespace decision_gate
