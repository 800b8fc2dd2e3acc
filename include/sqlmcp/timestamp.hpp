#pragma once
#include <chrono>
#include <string>

namespace sqlmcp {

/// ISO-8601 UTC with microseconds, e.g. "2025-01-31T09:15:02.123456Z".
std::string iso8601_utc(std::chrono::system_clock::time_point tp);

inline std::string iso8601_now() {
    return iso8601_utc(std::chrono::system_clock::now());
}

} // namespace sqlmcp
