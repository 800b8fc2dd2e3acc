#pragma once
#include <string_view>

namespace sqlmcp {

constexpr std::string_view LIBRARY_VERSION        = "1.0.0";
constexpr std::string_view JSONRPC_VERSION        = "2.0";
constexpr std::string_view DEFAULT_SERVER_NAME    = "sqlmcp";
constexpr std::string_view DEFAULT_SERVER_VERSION = "1.0.0";

} // namespace sqlmcp
