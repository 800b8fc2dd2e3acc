#pragma once
#include "backend.hpp"
#include "client_context.hpp"
#include "config.hpp"
#include "dispatcher.hpp"
#include "metrics.hpp"
#include "session_manager.hpp"
#include "tool_registry.hpp"
#include <chrono>
#include <cstdint>
#include <memory>
#include <string>

namespace sqlmcp {

/// SQL tool server: dispatcher, event stream sessions and the HTTP front
/// end wired together from Settings.
class McpServer {
public:
    struct Options {
        Settings settings;
        /// Defaults to StubBackend. Wrapped in a TimeoutBackend unless
        /// settings.backend_timeout is zero.
        std::shared_ptr<IBackend> backend;
        /// Defaults to ToolRegistry::builtin().
        std::shared_ptr<const ToolRegistry> registry;
        SessionManager::TimerFactory timer_factory;
    };

    explicit McpServer(Options opts);
    ~McpServer();

    McpServer(const McpServer&) = delete;
    McpServer& operator=(const McpServer&) = delete;

    /// Serve HTTP until shutdown(). Blocks; returns at once when shutdown()
    /// came first.
    void start();

    /// Close every event stream, then stop the listener. Safe to call
    /// from any thread, more than once.
    void shutdown();

    bool wait_until_ready(std::chrono::milliseconds timeout) const;

    [[nodiscard]] uint16_t port() const;
    [[nodiscard]] bool is_running() const;

    /// Body of the health endpoint.
    [[nodiscard]] std::string health() const;

    Dispatcher& dispatcher();
    SessionManager& sessions();
    ClientContexts& contexts();
    const RequestMetrics& metrics() const;
    const Settings& settings() const;

private:
    struct Impl;
    std::unique_ptr<Impl> impl_;
};

} // namespace sqlmcp
