#pragma once
#include "stream_session.hpp"
#include "types.hpp"
#include <chrono>
#include <cstdint>
#include <functional>
#include <optional>
#include <string>
#include <vector>

namespace sqlmcp {

/// Server settings, read from the process environment.
struct Settings {
    std::string host = "0.0.0.0";
    uint16_t port = 8080;
    bool debug = false;
    std::vector<std::string> allowed_origins{"*"};

    ServerInfo server_info;

    std::string log_level = "info";
    std::string log_file;

    std::chrono::milliseconds heartbeat_interval{10000};
    std::chrono::milliseconds grace_delay{1000};
    int max_missed_heartbeats = 3;
    std::chrono::milliseconds backend_timeout{30000};
    bool strict_lifecycle = false;
    int max_connections = 100;

    Settings();

    /// Returns the variable's value, or nullopt when unset.
    using Lookup = std::function<std::optional<std::string>(const std::string& name)>;

    /// Build settings from environment variables. Unset variables keep
    /// their defaults. Throws McpConfigError on malformed values.
    static Settings from_env(const Lookup& lookup = process_env);

    static std::optional<std::string> process_env(const std::string& name);

    /// Throws McpConfigError describing the first invalid field.
    void validate() const;

    [[nodiscard]] StreamOptions stream_options() const;
};

/// "true", "1" and "t" (any case) are true; everything else is false.
bool parse_bool(const std::string& value);

/// Split on commas, trimming blanks and dropping empty items.
std::vector<std::string> split_list(const std::string& value);

} // namespace sqlmcp
