#include "sqlmcp/dispatcher.hpp"
#include "sqlmcp/codec.hpp"
#include "sqlmcp/error.hpp"
#include <spdlog/spdlog.h>
#include <stdexcept>

namespace sqlmcp {

namespace {

std::optional<int> error_code_of(const JsonRpcResponse& resp) {
    if (resp.error) return resp.error->code;
    return std::nullopt;
}

} // anonymous namespace

Dispatcher::Dispatcher(std::shared_ptr<const ToolRegistry> tools,
                       std::shared_ptr<IBackend> backend,
                       Options opts)
    : tools_(std::move(tools))
    , backend_(std::move(backend))
    , opts_(std::move(opts)) {
    if (!tools_) tools_ = ToolRegistry::builtin();
    if (!backend_) {
        throw std::invalid_argument("Dispatcher requires a backend");
    }
    handshake_ = tools_->handshake(opts_.server_info);
    router_.set_enforce_lifecycle(opts_.strict_lifecycle);
    router_.set_expose_error_detail(opts_.debug);
    setup_handlers();
}

std::optional<JsonRpcError> Dispatcher::check_params(const std::string& tool,
                                                     const nlohmann::json& params,
                                                     const char* required) const {
    auto problem = tools_->validate_arguments(tool, params);
    if (!problem) {
        // A custom registry may describe the tool without a schema
        auto it = params.find(required);
        if (it == params.end() || !it->is_string() || it->get_ref<const std::string&>().empty()) {
            problem = std::string("Missing required parameter: ") + required;
        }
    }
    if (!problem) return std::nullopt;
    return JsonRpcError{error::InvalidParams, "Invalid params",
                        nlohmann::json{{"detail", *problem}}};
}

void Dispatcher::setup_handlers() {
    // initialize
    router_.on_request("initialize", [this](const nlohmann::json& params, ClientContext& ctx) -> HandlerResult {
        if (opts_.strict_lifecycle && ctx.state() == LifecycleState::ShuttingDown) {
            return JsonRpcError{error::InvalidRequest, "Server is shutting down", std::nullopt};
        }
        auto client_info = params.find("clientInfo");
        if (client_info != params.end() && client_info->is_object()) {
            spdlog::info("Client initialized: {}", client_info->dump());
        }
        ctx.set_state(LifecycleState::Initialized);
        return handshake_;
    });

    // shutdown
    router_.on_request("shutdown", [](const nlohmann::json&, ClientContext& ctx) -> HandlerResult {
        spdlog::info("Client requested shutdown");
        ctx.set_state(LifecycleState::ShuttingDown);
        return nlohmann::json(nullptr);
    });

    // list_tables
    router_.on_request("list_tables", [this](const nlohmann::json&, ClientContext&) -> HandlerResult {
        return nlohmann::json{{"tables", backend_->list_tables()}};
    });

    // discover_data
    router_.on_request("discover_data", [this](const nlohmann::json& params, ClientContext&) -> HandlerResult {
        if (auto err = check_params("discover_data", params, "table")) return *err;
        nlohmann::json j = backend_->discover_data(params.at("table").get<std::string>());
        return j;
    });

    // prepare_query
    router_.on_request("prepare_query", [this](const nlohmann::json& params, ClientContext&) -> HandlerResult {
        if (auto err = check_params("prepare_query", params, "query")) return *err;
        nlohmann::json j = backend_->prepare_query(params.at("query").get<std::string>());
        return j;
    });

    // query
    router_.on_request("query", [this](const nlohmann::json& params, ClientContext&) -> HandlerResult {
        if (auto err = check_params("query", params, "query")) return *err;
        auto result = backend_->query(params.at("query").get<std::string>());
        for (const auto& row : result.rows) {
            if (row.size() != result.columns.size()) {
                throw std::runtime_error("Backend returned a row with " + std::to_string(row.size())
                                         + " values for " + std::to_string(result.columns.size())
                                         + " columns");
            }
        }
        nlohmann::json j = result;
        return j;
    });

    for (const char* method : {"list_tables", "discover_data", "prepare_query", "query"}) {
        router_.require_initialized(method);
    }
}

void Dispatcher::notify(const DispatchRecord& record) const {
    if (!opts_.observer) return;
    try {
        opts_.observer(record);
    } catch (const std::exception& e) {
        spdlog::warn("Dispatch observer failed: {}", e.what());
    }
}

JsonRpcResponse Dispatcher::dispatch(const JsonRpcRequest& req, ClientContext& ctx) {
    auto start = std::chrono::steady_clock::now();
    auto resp = router_.dispatch(req, ctx);
    notify(DispatchRecord{req.method, req.id, std::chrono::steady_clock::now() - start,
                          error_code_of(resp)});
    return resp;
}

DispatchReply Dispatcher::handle(std::string_view body, ClientContext& ctx) noexcept {
    auto start = std::chrono::steady_clock::now();
    try {
        JsonRpcRequest req;
        try {
            req = Codec::parse(body);
        } catch (const McpParseError& e) {
            auto id = Codec::recover_id(body);
            spdlog::error("Invalid request (id={}): {}", to_string(id), e.what());

            std::optional<nlohmann::json> data;
            if (opts_.debug) data = nlohmann::json{{"detail", e.what()}};
            DispatchReply reply{make_error(id, JsonRpcError{error::ParseError, "Parse error", data}), 400};
            notify(DispatchRecord{"", id, std::chrono::steady_clock::now() - start, error::ParseError});
            return reply;
        }

        spdlog::info("MCP request: method={}, id={}", req.method, to_string(req.id));
        return DispatchReply{dispatch(req, ctx), 200};
    } catch (const std::exception& e) {
        spdlog::error("Unexpected error while handling call: {}", e.what());
        std::optional<nlohmann::json> data;
        if (opts_.debug) data = nlohmann::json{{"detail", e.what()}};
        return DispatchReply{make_error(std::nullopt, JsonRpcError{error::InternalError, "Internal error", data}), 500};
    } catch (...) {
        spdlog::error("Unexpected non-standard exception while handling call");
        return DispatchReply{make_error(std::nullopt, JsonRpcError{error::InternalError, "Internal error", std::nullopt}), 500};
    }
}

} // namespace sqlmcp
