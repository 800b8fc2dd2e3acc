#include "sqlmcp/json_rpc.hpp"
#include "sqlmcp/version.hpp"

namespace sqlmcp {

std::string to_string(const RequestId& id) {
    if (const auto* i = std::get_if<int64_t>(&id)) return std::to_string(*i);
    return "\"" + std::get<std::string>(id) + "\"";
}

std::string to_string(const std::optional<RequestId>& id) {
    return id ? to_string(*id) : std::string("null");
}

JsonRpcResponse make_result(std::optional<RequestId> id, nlohmann::json result) {
    JsonRpcResponse resp;
    resp.id = std::move(id);
    resp.result = std::move(result);
    return resp;
}

JsonRpcResponse make_error(std::optional<RequestId> id, JsonRpcError error) {
    JsonRpcResponse resp;
    resp.id = std::move(id);
    resp.error = std::move(error);
    return resp;
}

void to_json(nlohmann::json& j, const JsonRpcRequest& r) {
    nlohmann::json id_j;
    to_json(id_j, r.id);
    j = nlohmann::json::object();
    j["jsonrpc"] = std::string(JSONRPC_VERSION);
    j["id"] = id_j;
    j["method"] = r.method;
    if (!r.params.empty()) j["params"] = r.params;
}

void from_json(const nlohmann::json& j, JsonRpcRequest& r) {
    from_json(j.at("id"), r.id);
    r.method = j.at("method").get<std::string>();
    if (j.contains("params") && !j.at("params").is_null()) r.params = j.at("params");
}

void to_json(nlohmann::json& j, const JsonRpcResponse& r) {
    j = nlohmann::json::object();
    j["jsonrpc"] = std::string(JSONRPC_VERSION);
    if (r.id) {
        nlohmann::json id_j;
        to_json(id_j, *r.id);
        j["id"] = id_j;
    } else {
        j["id"] = nullptr;
    }
    if (r.error) {
        j["error"] = *r.error;
    } else {
        // Keeps the envelope valid even for a default-constructed response
        j["result"] = r.result ? *r.result : nlohmann::json(nullptr);
    }
}

void from_json(const nlohmann::json& j, JsonRpcResponse& r) {
    if (j.contains("id") && !j.at("id").is_null()) {
        RequestId id;
        from_json(j.at("id"), id);
        r.id = std::move(id);
    }
    if (j.contains("result")) r.result = j.at("result");
    if (j.contains("error")) r.error = j.at("error").get<JsonRpcError>();
}

} // namespace sqlmcp
