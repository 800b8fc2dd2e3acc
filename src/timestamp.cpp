#include "sqlmcp/timestamp.hpp"
#include <ctime>
#include <iomanip>
#include <sstream>

namespace sqlmcp {

std::string iso8601_utc(std::chrono::system_clock::time_point tp) {
    auto secs = std::chrono::time_point_cast<std::chrono::seconds>(tp);
    auto micros = std::chrono::duration_cast<std::chrono::microseconds>(tp - secs).count();
    std::time_t t = std::chrono::system_clock::to_time_t(secs);

    std::tm tm{};
    gmtime_r(&t, &tm);

    std::ostringstream oss;
    oss << std::put_time(&tm, "%Y-%m-%dT%H:%M:%S")
        << '.' << std::setw(6) << std::setfill('0') << micros << 'Z';
    return oss.str();
}

} // namespace sqlmcp
