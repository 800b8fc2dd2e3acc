#pragma once
#include "json_rpc.hpp"
#include "error.hpp"
#include <optional>
#include <string>
#include <string_view>

namespace sqlmcp {

class Codec {
public:
    /// Parse a raw call body into a request.
    /// Throws McpParseError on invalid JSON or missing/mistyped fields.
    [[nodiscard]] static JsonRpcRequest parse(std::string_view raw);

    /// Best-effort extraction of the "id" member. Never throws; works on
    /// bodies that are broken after the id member.
    [[nodiscard]] static std::optional<RequestId> recover_id(std::string_view raw) noexcept;

    /// Parse a response envelope. Throws McpParseError unless exactly one
    /// of result/error is present.
    [[nodiscard]] static JsonRpcResponse parse_response(std::string_view raw);

    [[nodiscard]] static std::string serialize(const JsonRpcResponse& resp);
    [[nodiscard]] static std::string serialize(const JsonRpcRequest& req);

    [[nodiscard]] static std::string encode_result(const std::optional<RequestId>& id,
                                                   nlohmann::json result);
    [[nodiscard]] static std::string encode_error(const std::optional<RequestId>& id,
                                                  int code, const std::string& message,
                                                  std::optional<nlohmann::json> data = std::nullopt);

private:
    static nlohmann::json parse_document(std::string_view raw);
    static JsonRpcRequest parse_object(const nlohmann::json& j);
};

} // namespace sqlmcp
