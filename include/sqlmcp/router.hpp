#pragma once
#include "client_context.hpp"
#include "json_rpc.hpp"
#include <functional>
#include <mutex>
#include <string>
#include <unordered_map>
#include <variant>

namespace sqlmcp {

using HandlerResult = std::variant<nlohmann::json, JsonRpcError>;
using RequestHandler = std::function<HandlerResult(const nlohmann::json& params, ClientContext& ctx)>;

/// Method table for JSON-RPC requests. dispatch() always returns a
/// well-formed response; handler exceptions become error objects.
class Router {
public:
    /// Register a request handler for a method.
    void on_request(const std::string& method, RequestHandler handler);

    /// Require the client to be Initialized before the method runs.
    /// Only enforced when lifecycle enforcement is on.
    void require_initialized(const std::string& method);

    void set_enforce_lifecycle(bool enforce);

    /// Include exception messages as data.detail of InternalError.
    void set_expose_error_detail(bool expose);

    [[nodiscard]] JsonRpcResponse dispatch(const JsonRpcRequest& req, ClientContext& ctx);

    [[nodiscard]] bool has_handler(const std::string& method) const;

private:
    std::optional<JsonRpcError> check_lifecycle(const std::string& method,
                                                const ClientContext& ctx) const;
    JsonRpcError internal_error(const std::string& detail) const;

    mutable std::mutex mutex_;
    std::unordered_map<std::string, RequestHandler> request_handlers_;
    std::unordered_map<std::string, bool> needs_initialized_;
    bool enforce_lifecycle_{false};
    bool expose_error_detail_{false};
};

} // namespace sqlmcp
