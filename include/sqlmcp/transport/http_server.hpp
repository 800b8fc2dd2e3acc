#pragma once
#include "event_sink.hpp"
#include <atomic>
#include <chrono>
#include <cstdint>
#include <functional>
#include <memory>
#include <mutex>
#include <string>
#include <vector>

// Forward declarations to avoid including heavy httplib header
namespace httplib {
    class Server;
}

namespace sqlmcp {

/// Per-request facts handed to the handlers.
struct HttpRequestInfo {
    std::string client_id;      // Mcp-Session-Id header, may be empty
    std::string user_agent;
    std::string remote_addr;
};

struct RpcReply {
    int status = 200;
    std::string body;
};

/// HTTP front end: JSON-RPC calls on POST, event streams on GET, plus
/// health and metrics endpoints.
class HttpServer {
public:
    struct Options {
        std::string host = "0.0.0.0";
        uint16_t port = 8080;               // 0 binds any free port
        std::string rpc_path = "/";
        std::string events_path = "/sse";
        std::string health_path = "/health";
        std::string metrics_path = "/metrics";
        std::vector<std::string> allowed_origins{"*"};
        int max_connections = 100;          // worker threads
        int reserved_workers = 4;           // kept free of event streams for calls
    };

    using RpcHandler = std::function<RpcReply(const std::string& body, const HttpRequestInfo&)>;
    using StreamHandler = std::function<void(EventSink&, const HttpRequestInfo&)>;
    using TextHandler = std::function<std::string()>;
    using RequestObserver = std::function<void(const std::string& method, const std::string& path,
                                               int status, std::chrono::steady_clock::duration)>;

    struct Handlers {
        RpcHandler rpc;
        StreamHandler stream;
        TextHandler health;         // JSON body
        TextHandler metrics;        // Prometheus text; endpoint disabled when empty
        RequestObserver observer;
    };

    HttpServer(Options opts, Handlers handlers);
    ~HttpServer();

    HttpServer(const HttpServer&) = delete;
    HttpServer& operator=(const HttpServer&) = delete;

    /// Bind and serve. Blocks until shutdown(). Throws McpTransportError
    /// when the address cannot be bound. Returns at once when shutdown()
    /// already ran.
    void start();

    /// Block until the listener is up or the timeout expires.
    bool wait_until_ready(std::chrono::milliseconds timeout) const;

    /// Stop the listener. Safe from any thread, before or during start().
    void shutdown();

    [[nodiscard]] bool is_running() const { return running_; }

    /// Event streams admitted at once; further ones get 503.
    [[nodiscard]] int stream_capacity() const;
    [[nodiscard]] int active_streams() const { return active_streams_; }

    /// Bound port; the chosen one when Options::port was 0.
    [[nodiscard]] uint16_t port() const { return bound_port_; }

    [[nodiscard]] bool origin_allowed(const std::string& origin) const;

private:
    void setup_routes();

    Options opts_;
    Handlers handlers_;
    std::unique_ptr<httplib::Server> server_;
    std::atomic<bool> running_{false};
    std::atomic<uint16_t> bound_port_{0};
    std::atomic<int> active_streams_{0};

    std::mutex state_mutex_;
    bool started_ = false;
    bool stop_requested_ = false;
    bool finished_ = false;
};

} // namespace sqlmcp
