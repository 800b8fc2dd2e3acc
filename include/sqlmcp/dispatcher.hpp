#pragma once
#include "backend.hpp"
#include "client_context.hpp"
#include "json_rpc.hpp"
#include "router.hpp"
#include "tool_registry.hpp"
#include "types.hpp"
#include <chrono>
#include <functional>
#include <memory>
#include <optional>
#include <string>
#include <string_view>

namespace sqlmcp {

/// Outcome of one call, reported to the DispatchObserver.
struct DispatchRecord {
    std::string method;                 // empty when the body did not decode
    std::optional<RequestId> id;
    std::chrono::steady_clock::duration duration{};
    std::optional<int> error_code;      // empty on success
};

using DispatchObserver = std::function<void(const DispatchRecord&)>;

struct DispatchReply {
    JsonRpcResponse response;
    int http_status = 200;
};

/// Routes calls to initialize, shutdown and the SQL tools, validating
/// parameters and delegating work to the backend.
class Dispatcher {
public:
    struct Options {
        ServerInfo server_info;
        bool debug = false;
        bool strict_lifecycle = false;
        DispatchObserver observer;
    };

    Dispatcher(std::shared_ptr<const ToolRegistry> tools,
               std::shared_ptr<IBackend> backend,
               Options opts);

    // Non-copyable, non-movable (handlers capture this)
    Dispatcher(const Dispatcher&) = delete;
    Dispatcher& operator=(const Dispatcher&) = delete;

    /// Dispatch a decoded request; ctx carries and receives the lifecycle state.
    [[nodiscard]] JsonRpcResponse dispatch(const JsonRpcRequest& req, ClientContext& ctx);

    /// Decode a raw call body and dispatch it. Never throws.
    [[nodiscard]] DispatchReply handle(std::string_view body, ClientContext& ctx) noexcept;

    /// Handshake payload returned by initialize.
    [[nodiscard]] const nlohmann::json& capabilities() const { return handshake_; }

    [[nodiscard]] const ServerInfo& server_info() const { return opts_.server_info; }

private:
    void setup_handlers();
    std::optional<JsonRpcError> check_params(const std::string& tool,
                                             const nlohmann::json& params,
                                             const char* required) const;
    void notify(const DispatchRecord& record) const;

    std::shared_ptr<const ToolRegistry> tools_;
    std::shared_ptr<IBackend> backend_;
    Options opts_;
    nlohmann::json handshake_;
    Router router_;
};

} // namespace sqlmcp
