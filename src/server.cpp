#include "sqlmcp/server.hpp"
#include "sqlmcp/codec.hpp"
#include "sqlmcp/timestamp.hpp"
#include "sqlmcp/transport/http_server.hpp"
#include <spdlog/spdlog.h>

#include <algorithm>

namespace sqlmcp {

namespace {

// Every live call holds an HTTP worker, so only abandoned calls can
// saturate a pool as wide as the HTTP one
std::shared_ptr<IBackend> make_backend(std::shared_ptr<IBackend> backend,
                                       std::chrono::milliseconds timeout, int workers) {
    if (!backend) backend = std::make_shared<StubBackend>();
    if (timeout.count() > 0) {
        backend = std::make_shared<TimeoutBackend>(std::move(backend), timeout,
                                                   static_cast<size_t>(std::max(1, workers)));
    }
    return backend;
}

std::string outcome_label(const DispatchRecord& record) {
    return record.error_code ? std::to_string(*record.error_code) : std::string("ok");
}

} // anonymous namespace

struct McpServer::Impl {
    Settings settings;
    RequestMetrics metrics;
    ClientContexts contexts;
    std::unique_ptr<Dispatcher> dispatcher;
    std::unique_ptr<SessionManager> sessions;
    std::unique_ptr<HttpServer> http;

    explicit Impl(Options opts) : settings(std::move(opts.settings)) {
        settings.validate();

        Dispatcher::Options dopts;
        dopts.server_info = settings.server_info;
        dopts.debug = settings.debug;
        dopts.strict_lifecycle = settings.strict_lifecycle;
        dopts.observer = [this](const DispatchRecord& record) { on_dispatch(record); };

        dispatcher = std::make_unique<Dispatcher>(
            std::move(opts.registry),
            make_backend(std::move(opts.backend), settings.backend_timeout, settings.max_connections),
            std::move(dopts));

        sessions = std::make_unique<SessionManager>(
            settings.stream_options(), dispatcher->capabilities(), std::move(opts.timer_factory));
        sessions->on_open([this](const StreamSession& s) { contexts.open(s.client_id()); });
        sessions->on_close([this](const StreamSession& s) { contexts.release(s.client_id()); });

        HttpServer::Options hopts;
        hopts.host = settings.host;
        hopts.port = settings.port;
        hopts.allowed_origins = settings.allowed_origins;
        hopts.max_connections = settings.max_connections;

        HttpServer::Handlers handlers;
        handlers.rpc = [this](const std::string& body, const HttpRequestInfo& info) {
            auto ctx = contexts.acquire(info.client_id);
            auto reply = dispatcher->handle(body, *ctx);
            return RpcReply{reply.http_status, Codec::serialize(reply.response)};
        };
        handlers.stream = [this](EventSink& sink, const HttpRequestInfo& info) {
            spdlog::info("Event stream requested by {} ({})", info.remote_addr, info.user_agent);
            if (sessions->serve(sink).empty()) {
                spdlog::warn("Event stream refused: server is shutting down");
            }
        };
        handlers.health = [this] { return health(); };
        handlers.metrics = [this] { return metrics.render(); };
        handlers.observer = [this](const std::string& method, const std::string& path,
                                   int status, std::chrono::steady_clock::duration elapsed) {
            spdlog::info("{} {} -> {} ({:.3f}ms)", method, path, status,
                         std::chrono::duration<double, std::milli>(elapsed).count());
            metrics.observe_request(method, path, elapsed);
        };

        http = std::make_unique<HttpServer>(std::move(hopts), std::move(handlers));
    }

    void on_dispatch(const DispatchRecord& record) {
        const auto ms = std::chrono::duration<double, std::milli>(record.duration).count();
        if (record.error_code) {
            spdlog::debug("MCP call {} id={} failed with {} in {:.3f}ms",
                          record.method, to_string(record.id), *record.error_code, ms);
        } else {
            spdlog::debug("MCP call {} id={} completed in {:.3f}ms",
                          record.method, to_string(record.id), ms);
        }
        metrics.observe_dispatch(record.method.empty() ? std::string("<invalid>") : record.method,
                                 outcome_label(record));
    }

    std::string health() const {
        nlohmann::json j = {
            {"status", "ok"},
            {"timestamp", iso8601_now()},
            {"version", settings.server_info.version},
            {"service", settings.server_info.name}
        };
        return j.dump();
    }
};

McpServer::McpServer(Options opts)
    : impl_(std::make_unique<Impl>(std::move(opts))) {
}

McpServer::~McpServer() {
    shutdown();
}

void McpServer::start() {
    spdlog::info("Starting {} {} on {}:{}", impl_->settings.server_info.name,
                 impl_->settings.server_info.version, impl_->settings.host, impl_->settings.port);
    impl_->http->start();
}

void McpServer::shutdown() {
    impl_->sessions->cancel_all();
    impl_->http->shutdown();
}

bool McpServer::wait_until_ready(std::chrono::milliseconds timeout) const {
    return impl_->http->wait_until_ready(timeout);
}

uint16_t McpServer::port() const { return impl_->http->port(); }
bool McpServer::is_running() const { return impl_->http->is_running(); }
std::string McpServer::health() const { return impl_->health(); }

Dispatcher& McpServer::dispatcher() { return *impl_->dispatcher; }
SessionManager& McpServer::sessions() { return *impl_->sessions; }
ClientContexts& McpServer::contexts() { return impl_->contexts; }
const RequestMetrics& McpServer::metrics() const { return impl_->metrics; }
const Settings& McpServer::settings() const { return impl_->settings; }

} // namespace sqlmcp
