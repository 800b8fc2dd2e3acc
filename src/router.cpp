#include "sqlmcp/router.hpp"
#include "sqlmcp/error.hpp"
#include <spdlog/spdlog.h>

namespace sqlmcp {

void Router::on_request(const std::string& method, RequestHandler handler) {
    std::lock_guard<std::mutex> lock(mutex_);
    request_handlers_[method] = std::move(handler);
}

void Router::require_initialized(const std::string& method) {
    std::lock_guard<std::mutex> lock(mutex_);
    needs_initialized_[method] = true;
}

void Router::set_enforce_lifecycle(bool enforce) {
    std::lock_guard<std::mutex> lock(mutex_);
    enforce_lifecycle_ = enforce;
}

void Router::set_expose_error_detail(bool expose) {
    std::lock_guard<std::mutex> lock(mutex_);
    expose_error_detail_ = expose;
}

bool Router::has_handler(const std::string& method) const {
    std::lock_guard<std::mutex> lock(mutex_);
    return request_handlers_.count(method) > 0;
}

std::optional<JsonRpcError> Router::check_lifecycle(const std::string& method,
                                                    const ClientContext& ctx) const {
    if (!enforce_lifecycle_) return std::nullopt;
    auto it = needs_initialized_.find(method);
    if (it == needs_initialized_.end()) return std::nullopt;

    switch (ctx.state()) {
        case LifecycleState::Initialized:
            return std::nullopt;
        case LifecycleState::Uninitialized:
            return JsonRpcError{error::InvalidRequest, "Server not initialized",
                                nlohmann::json{{"method", method}}};
        case LifecycleState::ShuttingDown:
            return JsonRpcError{error::InvalidRequest, "Server is shutting down",
                                nlohmann::json{{"method", method}}};
    }
    return std::nullopt;
}

JsonRpcError Router::internal_error(const std::string& detail) const {
    JsonRpcError err{error::InternalError, "Internal error", std::nullopt};
    if (expose_error_detail_) err.data = nlohmann::json{{"detail", detail}};
    return err;
}

JsonRpcResponse Router::dispatch(const JsonRpcRequest& req, ClientContext& ctx) {
    // Hold lock only to look up handler and check the lifecycle
    RequestHandler handler;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        auto it = request_handlers_.find(req.method);
        if (it == request_handlers_.end()) {
            return make_error(req.id, JsonRpcError{
                error::MethodNotFound, "Method not found",
                nlohmann::json{{"method", req.method}}
            });
        }
        if (auto err = check_lifecycle(req.method, ctx)) {
            return make_error(req.id, std::move(*err));
        }
        handler = it->second;
    }

    // Call handler WITHOUT holding the lock; backend calls may be slow
    try {
        auto result = handler(req.params, ctx);
        if (auto* err = std::get_if<JsonRpcError>(&result)) {
            return make_error(req.id, std::move(*err));
        }
        return make_result(req.id, std::move(std::get<nlohmann::json>(result)));
    } catch (const McpProtocolError& e) {
        return make_error(req.id, JsonRpcError{e.code, e.what(), std::nullopt});
    } catch (const McpBackendError& e) {
        spdlog::warn("Backend error in {}: {}", req.method, e.what());
        return make_error(req.id, JsonRpcError{error::ApplicationError, e.what(), std::nullopt});
    } catch (const McpTimeoutError& e) {
        spdlog::warn("Backend timeout in {}: {}", req.method, e.what());
        return make_error(req.id, JsonRpcError{error::ApplicationError, e.what(), std::nullopt});
    } catch (const std::exception& e) {
        spdlog::error("Unexpected error in {}: {}", req.method, e.what());
        std::lock_guard<std::mutex> lock(mutex_);
        return make_error(req.id, internal_error(e.what()));
    } catch (...) {
        spdlog::error("Unexpected non-standard exception in {}", req.method);
        std::lock_guard<std::mutex> lock(mutex_);
        return make_error(req.id, internal_error("unknown exception"));
    }
}

} // namespace sqlmcp
