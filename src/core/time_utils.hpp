// Regmock Time Utilities
// Wire formats for timestamps and durations

#pragma once

#include <chrono>
#include <ctime>
#include <string>

#include <fmt/format.h>

namespace regmock::core {

using Clock = std::chrono::system_clock;

/// Format as yyyy-MM-ddTHH:mm:ssZ (UTC, second precision)
[[nodiscard]] inline std::string format_iso8601_utc(Clock::time_point tp) {
    std::time_t t = Clock::to_time_t(tp);
    std::tm tm{};
    gmtime_r(&t, &tm);

    char buffer[32];
    size_t n = std::strftime(buffer, sizeof(buffer), "%Y-%m-%dT%H:%M:%SZ", &tm);
    return std::string(buffer, n);
}

/// Format a duration as [d.]hh:mm:ss
[[nodiscard]] inline std::string format_uptime(std::chrono::seconds uptime) {
    if (uptime.count() < 0) {
        uptime = std::chrono::seconds{0};
    }

    auto total = uptime.count();
    auto days = total / 86400;
    auto hours = (total % 86400) / 3600;
    auto minutes = (total % 3600) / 60;
    auto seconds = total % 60;

    if (days > 0) {
        return fmt::format("{}.{:02}:{:02}:{:02}", days, hours, minutes, seconds);
    }
    return fmt::format("{:02}:{:02}:{:02}", hours, minutes, seconds);
}

}  // namespace regmock::core
