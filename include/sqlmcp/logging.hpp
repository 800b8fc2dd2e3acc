#pragma once
#include <spdlog/common.h>
#include <string>

namespace sqlmcp {

struct LogSettings {
    std::string level = "info";
    std::string file;               // rotating file sink when set
    size_t max_file_size = 10 * 1024 * 1024;
    size_t max_files = 3;
    std::string logger_name = "sqlmcp";
};

/// Map "trace" .. "critical" / "off" (and "warning") to a spdlog level.
/// Throws McpConfigError for anything else.
spdlog::level::level_enum parse_log_level(const std::string& level);

/// Install the default logger: colored stderr, plus a rotating file when
/// configured.
void init_logging(const LogSettings& settings);

} // namespace sqlmcp
