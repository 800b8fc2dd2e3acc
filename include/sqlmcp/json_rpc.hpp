#pragma once
#include <cstdint>
#include <limits>
#include <stdexcept>
#include <string>
#include <variant>
#include <optional>
#include <nlohmann/json.hpp>

namespace sqlmcp {

using RequestId = std::variant<int64_t, std::string>;

inline void to_json(nlohmann::json& j, const RequestId& id) {
    std::visit([&j](const auto& v) { j = v; }, id);
}

inline void from_json(const nlohmann::json& j, RequestId& id) {
    if (j.is_number_unsigned()
        && j.get<uint64_t>() > static_cast<uint64_t>(std::numeric_limits<int64_t>::max())) {
        throw std::out_of_range("RequestId exceeds the signed 64-bit range");
    } else if (j.is_number_integer()) {
        id = j.get<int64_t>();
    } else if (j.is_string()) {
        id = j.get<std::string>();
    } else {
        throw std::invalid_argument("RequestId must be integer or string");
    }
}

/// Render an id for log lines.
std::string to_string(const RequestId& id);
std::string to_string(const std::optional<RequestId>& id);

struct JsonRpcError {
    int code;
    std::string message;
    std::optional<nlohmann::json> data;

    bool operator==(const JsonRpcError& o) const {
        return code == o.code && message == o.message && data == o.data;
    }
};

inline void to_json(nlohmann::json& j, const JsonRpcError& e) {
    j = nlohmann::json{{"code", e.code}, {"message", e.message}};
    if (e.data) j["data"] = *e.data;
}

inline void from_json(const nlohmann::json& j, JsonRpcError& e) {
    e.code = j.at("code").get<int>();
    e.message = j.at("message").get<std::string>();
    if (j.contains("data") && !j.at("data").is_null()) e.data = j.at("data");
}

struct JsonRpcRequest {
    RequestId id;
    std::string method;
    nlohmann::json params = nlohmann::json::object();

    bool operator==(const JsonRpcRequest& o) const {
        return id == o.id && method == o.method && params == o.params;
    }
};

/// Exactly one of result/error is set. A result holding JSON null is
/// still a result. The id is empty only when the request id could not
/// be recovered and serializes as null.
struct JsonRpcResponse {
    std::optional<RequestId> id;
    std::optional<nlohmann::json> result;
    std::optional<JsonRpcError> error;

    [[nodiscard]] bool is_error() const { return error.has_value(); }
    [[nodiscard]] bool is_well_formed() const { return result.has_value() != error.has_value(); }

    bool operator==(const JsonRpcResponse& o) const {
        return id == o.id && result == o.result && error == o.error;
    }
};

[[nodiscard]] JsonRpcResponse make_result(std::optional<RequestId> id, nlohmann::json result);
[[nodiscard]] JsonRpcResponse make_error(std::optional<RequestId> id, JsonRpcError error);

void to_json(nlohmann::json& j, const JsonRpcRequest& r);
void from_json(const nlohmann::json& j, JsonRpcRequest& r);

void to_json(nlohmann::json& j, const JsonRpcResponse& r);
void from_json(const nlohmann::json& j, JsonRpcResponse& r);

} // namespace sqlmcp
