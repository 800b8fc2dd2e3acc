#include "sqlmcp/config.hpp"
#include "sqlmcp/error.hpp"
#include "sqlmcp/version.hpp"

#include <algorithm>
#include <cctype>
#include <cstdlib>
#include <limits>

namespace sqlmcp {

namespace {

std::string trim(const std::string& s) {
    auto begin = std::find_if_not(s.begin(), s.end(), [](unsigned char c) { return std::isspace(c); });
    auto end = std::find_if_not(s.rbegin(), s.rend(), [](unsigned char c) { return std::isspace(c); }).base();
    return begin < end ? std::string(begin, end) : std::string();
}

long long parse_integer(const std::string& name, const std::string& value,
                        long long min, long long max) {
    const auto text = trim(value);
    size_t pos = 0;
    long long n = 0;
    try {
        n = std::stoll(text, &pos);
    } catch (const std::exception&) {
        throw McpConfigError(name + " must be an integer, got '" + value + "'");
    }
    if (pos != text.size()) {
        throw McpConfigError(name + " must be an integer, got '" + value + "'");
    }
    if (n < min || n > max) {
        throw McpConfigError(name + " must be between " + std::to_string(min) + " and "
                             + std::to_string(max) + ", got " + std::to_string(n));
    }
    return n;
}

} // anonymous namespace

bool parse_bool(const std::string& value) {
    auto v = trim(value);
    std::transform(v.begin(), v.end(), v.begin(), [](unsigned char c) { return std::tolower(c); });
    return v == "true" || v == "1" || v == "t";
}

std::vector<std::string> split_list(const std::string& value) {
    std::vector<std::string> items;
    size_t start = 0;
    while (start <= value.size()) {
        auto comma = value.find(',', start);
        if (comma == std::string::npos) comma = value.size();
        auto item = trim(value.substr(start, comma - start));
        if (!item.empty()) items.push_back(std::move(item));
        start = comma + 1;
    }
    return items;
}

Settings::Settings() {
    server_info.name = DEFAULT_SERVER_NAME;
    server_info.version = DEFAULT_SERVER_VERSION;
}

std::optional<std::string> Settings::process_env(const std::string& name) {
    const char* value = std::getenv(name.c_str());
    if (!value) return std::nullopt;
    return std::string(value);
}

Settings Settings::from_env(const Lookup& lookup) {
    Settings s;
    auto get = [&](const char* name) { return lookup(name); };

    if (auto v = get("HOST")) s.host = trim(*v);
    if (auto v = get("PORT")) s.port = static_cast<uint16_t>(parse_integer("PORT", *v, 0, 65535));
    if (auto v = get("DEBUG")) s.debug = parse_bool(*v);
    if (auto v = get("ALLOWED_ORIGINS")) s.allowed_origins = split_list(*v);
    if (auto v = get("MCP_SERVER_NAME")) s.server_info.name = *v;
    if (auto v = get("MCP_SERVER_VERSION")) s.server_info.version = *v;
    if (auto v = get("MCP_SUPPORTED_LANGUAGES")) s.server_info.capabilities.supported_languages = split_list(*v);
    if (auto v = get("LOG_LEVEL")) s.log_level = trim(*v);
    if (auto v = get("LOG_FILE")) s.log_file = trim(*v);

    constexpr long long max_ms = std::numeric_limits<int>::max();
    if (auto v = get("SQLMCP_HEARTBEAT_INTERVAL_MS")) {
        s.heartbeat_interval = std::chrono::milliseconds(parse_integer("SQLMCP_HEARTBEAT_INTERVAL_MS", *v, 1, max_ms));
    }
    if (auto v = get("SQLMCP_GRACE_DELAY_MS")) {
        s.grace_delay = std::chrono::milliseconds(parse_integer("SQLMCP_GRACE_DELAY_MS", *v, 0, max_ms));
    }
    if (auto v = get("SQLMCP_MAX_MISSED_HEARTBEATS")) {
        s.max_missed_heartbeats = static_cast<int>(parse_integer("SQLMCP_MAX_MISSED_HEARTBEATS", *v, 1, 1000));
    }
    if (auto v = get("SQLMCP_BACKEND_TIMEOUT_MS")) {
        s.backend_timeout = std::chrono::milliseconds(parse_integer("SQLMCP_BACKEND_TIMEOUT_MS", *v, 0, max_ms));
    }
    if (auto v = get("SQLMCP_STRICT_LIFECYCLE")) s.strict_lifecycle = parse_bool(*v);
    if (auto v = get("SQLMCP_MAX_CONNECTIONS")) {
        s.max_connections = static_cast<int>(parse_integer("SQLMCP_MAX_CONNECTIONS", *v, 1, 100000));
    }

    s.validate();
    return s;
}

void Settings::validate() const {
    if (host.empty()) throw McpConfigError("HOST must not be empty");
    if (server_info.name.empty()) throw McpConfigError("MCP_SERVER_NAME must not be empty");
    if (server_info.version.empty()) throw McpConfigError("MCP_SERVER_VERSION must not be empty");
    if (heartbeat_interval.count() <= 0) throw McpConfigError("heartbeat interval must be positive");
    if (grace_delay.count() < 0) throw McpConfigError("grace delay must not be negative");
    if (max_missed_heartbeats < 1) throw McpConfigError("max missed heartbeats must be at least 1");
    if (backend_timeout.count() < 0) throw McpConfigError("backend timeout must not be negative");
    if (max_connections < 1) throw McpConfigError("max connections must be at least 1");
}

StreamOptions Settings::stream_options() const {
    StreamOptions opts;
    opts.grace_delay = grace_delay;
    opts.heartbeat_interval = heartbeat_interval;
    opts.max_missed_heartbeats = max_missed_heartbeats;
    opts.debug = debug;
    return opts;
}

} // namespace sqlmcp
