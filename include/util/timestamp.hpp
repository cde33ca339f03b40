#pragma once

#include <chrono>
#include <ctime>
#include <string>

namespace pfs::util {

// Formats ts in local time with a strftime format string.
inline std::string formatTimestamp(const std::chrono::system_clock::time_point ts, const std::string& format) {
    const std::time_t t = std::chrono::system_clock::to_time_t(ts);
    std::tm tm{};
    localtime_r(&t, &tm);

    char buffer[256];
    const size_t n = std::strftime(buffer, sizeof(buffer), format.c_str(), &tm);
    return {buffer, n};
}

inline std::chrono::system_clock::time_point fromUnixSeconds(const long long seconds) {
    return std::chrono::system_clock::time_point{std::chrono::seconds{seconds}};
}

inline long long toNanoseconds(const timespec& ts) {
    return static_cast<long long>(ts.tv_sec) * 1'000'000'000LL + ts.tv_nsec;
}

}
