#include "sqlmcp/logging.hpp"
#include "sqlmcp/error.hpp"

#include <spdlog/spdlog.h>
#include <spdlog/sinks/rotating_file_sink.h>
#include <spdlog/sinks/stdout_color_sinks.h>

#include <algorithm>
#include <cctype>
#include <memory>
#include <vector>

namespace sqlmcp {

spdlog::level::level_enum parse_log_level(const std::string& level) {
    std::string l = level;
    std::transform(l.begin(), l.end(), l.begin(), [](unsigned char c) { return std::tolower(c); });

    if (l == "trace") return spdlog::level::trace;
    if (l == "debug") return spdlog::level::debug;
    if (l == "info") return spdlog::level::info;
    if (l == "warn" || l == "warning") return spdlog::level::warn;
    if (l == "error") return spdlog::level::err;
    if (l == "critical") return spdlog::level::critical;
    if (l == "off") return spdlog::level::off;
    throw McpConfigError("Unknown log level: " + level);
}

void init_logging(const LogSettings& settings) {
    const auto level = parse_log_level(settings.level);

    std::vector<spdlog::sink_ptr> sinks;
    sinks.push_back(std::make_shared<spdlog::sinks::stderr_color_sink_mt>());
    if (!settings.file.empty()) {
        try {
            sinks.push_back(std::make_shared<spdlog::sinks::rotating_file_sink_mt>(
                settings.file, settings.max_file_size, settings.max_files));
        } catch (const spdlog::spdlog_ex& e) {
            throw McpConfigError("Cannot open log file " + settings.file + ": " + e.what());
        }
    }

    auto logger = std::make_shared<spdlog::logger>(settings.logger_name, sinks.begin(), sinks.end());
    logger->set_level(level);
    logger->set_pattern("[%Y-%m-%d %H:%M:%S.%e] [%l] [%n] %v");
    logger->flush_on(spdlog::level::warn);
    spdlog::set_default_logger(logger);
}

} // namespace sqlmcp
