#include "sqlmcp/transport/http_server.hpp"
#include "sqlmcp/error.hpp"
#include "sqlmcp/codec.hpp"

#include <httplib.h>
#include <spdlog/spdlog.h>

#include <algorithm>
#include <thread>

namespace sqlmcp {

namespace {

/// EventSink over a chunked response. Valid only inside the content provider.
class DataSinkEventSink : public EventSink {
public:
    explicit DataSinkEventSink(httplib::DataSink& sink) : sink_(sink) {}

    bool send(const std::string& chunk) override {
        if (!sink_.is_writable()) return false;
        return sink_.write(chunk.data(), chunk.size());
    }

    bool is_open() const override { return sink_.is_writable(); }

private:
    httplib::DataSink& sink_;
};

HttpRequestInfo request_info(const httplib::Request& req) {
    HttpRequestInfo info;
    info.client_id = req.get_header_value("Mcp-Session-Id");
    info.user_agent = req.get_header_value("User-Agent");
    info.remote_addr = req.remote_addr;
    return info;
}

} // anonymous namespace

HttpServer::HttpServer(Options opts, Handlers handlers)
    : opts_(std::move(opts))
    , handlers_(std::move(handlers))
    , server_(std::make_unique<httplib::Server>()) {
}

HttpServer::~HttpServer() {
    shutdown();
}

bool HttpServer::origin_allowed(const std::string& origin) const {
    if (opts_.allowed_origins.empty()) return true;
    return std::any_of(opts_.allowed_origins.begin(), opts_.allowed_origins.end(),
                       [&](const std::string& allowed) {
                           return allowed == "*" || allowed == origin;
                       });
}

void HttpServer::setup_routes() {
    const int workers = std::max(1, opts_.max_connections);
    server_->new_task_queue = [workers] { return new httplib::ThreadPool(static_cast<size_t>(workers)); };

    // Reject foreign origins before routing (DNS rebinding protection)
    server_->set_pre_routing_handler([this](const httplib::Request& req, httplib::Response& res) {
        auto origin = req.get_header_value("Origin");
        if (origin.empty() || origin_allowed(origin)) {
            return httplib::Server::HandlerResponse::Unhandled;
        }
        spdlog::warn("Rejected request from origin {}", origin);
        res.status = 403;
        res.set_content(Codec::encode_error(std::nullopt, error::InvalidRequest, "Origin not allowed"),
                        "application/json");
        return httplib::Server::HandlerResponse::Handled;
    });

    server_->set_post_routing_handler([this](const httplib::Request& req, httplib::Response& res) {
        auto origin = req.get_header_value("Origin");
        if (!origin.empty()) {
            const bool wildcard = std::find(opts_.allowed_origins.begin(), opts_.allowed_origins.end(), "*")
                                  != opts_.allowed_origins.end();
            res.set_header("Access-Control-Allow-Origin", wildcard ? std::string("*") : origin);
            res.set_header("Access-Control-Allow-Methods", "GET, POST, OPTIONS");
            res.set_header("Access-Control-Allow-Headers", "Content-Type, Mcp-Session-Id");
        }
    });

    server_->Options(".*", [](const httplib::Request&, httplib::Response& res) {
        res.status = 204;
    });

    // POST: one JSON-RPC call per body
    server_->Post(opts_.rpc_path, [this](const httplib::Request& req, httplib::Response& res) {
        const auto start = std::chrono::steady_clock::now();
        try {
            auto reply = handlers_.rpc(req.body, request_info(req));
            res.status = reply.status;
            res.set_content(reply.body, "application/json");
        } catch (const std::exception& e) {
            spdlog::error("Unhandled error on {}: {}", req.path, e.what());
            res.status = 500;
            res.set_content(Codec::encode_error(std::nullopt, error::InternalError, "Internal error"),
                            "application/json");
        }
        if (handlers_.observer) {
            handlers_.observer("POST", opts_.rpc_path, res.status, std::chrono::steady_clock::now() - start);
        }
    });

    // GET: long-lived event stream, one session per connection. Each open
    // stream pins a worker, so admission stops short of the pool size.
    server_->Get(opts_.events_path, [this](const httplib::Request& req, httplib::Response& res) {
        const auto start = std::chrono::steady_clock::now();
        if (++active_streams_ > stream_capacity()) {
            --active_streams_;
            spdlog::warn("Refused event stream from {}: {} streams open", req.remote_addr, stream_capacity());
            res.status = 503;
            res.set_header("Retry-After", "1");
            res.set_content(R"({"error":"Too many open event streams"})", "application/json");
            if (handlers_.observer) {
                handlers_.observer("GET", opts_.events_path, res.status, std::chrono::steady_clock::now() - start);
            }
            return;
        }

        auto info = request_info(req);
        res.set_header("Cache-Control", "no-cache");
        res.set_header("X-Accel-Buffering", "no");
        res.set_chunked_content_provider("text/event-stream",
            [this, info](size_t /*offset*/, httplib::DataSink& sink) -> bool {
                DataSinkEventSink events(sink);
                try {
                    handlers_.stream(events, info);
                } catch (const std::exception& e) {
                    spdlog::error("Event stream failed: {}", e.what());
                    return false;
                }
                sink.done();
                return true;
            },
            // Runs once the response is gone, whether or not the stream ever started
            [this, start](bool /*success*/) {
                --active_streams_;
                if (handlers_.observer) {
                    handlers_.observer("GET", opts_.events_path, 200, std::chrono::steady_clock::now() - start);
                }
            });
    });

    server_->Get(opts_.health_path, [this](const httplib::Request&, httplib::Response& res) {
        const auto start = std::chrono::steady_clock::now();
        res.set_content(handlers_.health ? handlers_.health() : std::string("{\"status\":\"ok\"}"),
                        "application/json");
        if (handlers_.observer) {
            handlers_.observer("GET", opts_.health_path, res.status, std::chrono::steady_clock::now() - start);
        }
    });

    if (handlers_.metrics) {
        server_->Get(opts_.metrics_path, [this](const httplib::Request&, httplib::Response& res) {
            res.set_content(handlers_.metrics(), "text/plain; version=0.0.4");
        });
    }
}

void HttpServer::start() {
    if (!handlers_.rpc || !handlers_.stream) {
        throw McpTransportError("HTTP server started without handlers");
    }
    {
        std::lock_guard<std::mutex> lock(state_mutex_);
        if (started_ || stop_requested_) return;
        started_ = true;
    }

    setup_routes();

    int port = opts_.port;
    if (port == 0) {
        port = server_->bind_to_any_port(opts_.host);
        if (port < 0) port = 0;
    } else if (!server_->bind_to_port(opts_.host, port)) {
        port = 0;
    }
    if (port == 0) {
        std::lock_guard<std::mutex> lock(state_mutex_);
        finished_ = true;
        throw McpTransportError("Failed to bind HTTP server on " + opts_.host + ":" + std::to_string(opts_.port));
    }
    bound_port_ = static_cast<uint16_t>(port);

    {
        std::lock_guard<std::mutex> lock(state_mutex_);
        if (stop_requested_) {
            finished_ = true;
            spdlog::info("Shutdown requested before {}:{} started listening", opts_.host, port);
            return;
        }
        running_ = true;
    }
    spdlog::info("Listening on {}:{}", opts_.host, port);

    // Blocks until stop()
    const bool ok = server_->listen_after_bind();
    bool stopped = false;
    {
        std::lock_guard<std::mutex> lock(state_mutex_);
        running_ = false;
        finished_ = true;
        stopped = stop_requested_;
    }
    if (!ok && !stopped) {
        throw McpTransportError("HTTP server on " + opts_.host + ":" + std::to_string(port) + " stopped unexpectedly");
    }
}

bool HttpServer::wait_until_ready(std::chrono::milliseconds timeout) const {
    const auto deadline = std::chrono::steady_clock::now() + timeout;
    while (std::chrono::steady_clock::now() < deadline) {
        if (server_->is_running()) return true;
        std::this_thread::sleep_for(std::chrono::milliseconds(5));
    }
    return server_->is_running();
}

int HttpServer::stream_capacity() const {
    const int workers = std::max(1, opts_.max_connections);
    const int reserve = std::max(1, std::min(opts_.reserved_workers, workers / 2));
    return workers - reserve;
}

void HttpServer::shutdown() {
    {
        std::lock_guard<std::mutex> lock(state_mutex_);
        if (stop_requested_) return;
        stop_requested_ = true;
        // start() either has not reached listen yet and will see the flag,
        // or is already done
        if (!running_) return;
    }

    // stop() is a no-op until listen_after_bind() has raised is_running(),
    // and must not be repeated once it took effect
    while (!server_->is_running()) {
        {
            std::lock_guard<std::mutex> lock(state_mutex_);
            if (finished_) return;
        }
        std::this_thread::sleep_for(std::chrono::milliseconds(2));
    }
    server_->stop();
}

} // namespace sqlmcp
