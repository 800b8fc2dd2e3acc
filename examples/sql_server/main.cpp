/// SQL tool server over HTTP with the stub backend.
/// Configured entirely from the environment (PORT, HOST, LOG_LEVEL, ...).

#include <sqlmcp/sqlmcp.hpp>
#include <spdlog/spdlog.h>

#include <atomic>
#include <chrono>
#include <csignal>
#include <iostream>
#include <thread>

namespace {

std::atomic<bool> g_stop{false};

void signal_handler(int) {
    g_stop = true;
}

} // anonymous namespace

int main() {
    sqlmcp::Settings settings;
    try {
        settings = sqlmcp::Settings::from_env();
        sqlmcp::LogSettings log;
        log.level = settings.debug ? std::string("debug") : settings.log_level;
        log.file = settings.log_file;
        log.logger_name = settings.server_info.name;
        sqlmcp::init_logging(log);
    } catch (const sqlmcp::McpConfigError& e) {
        std::cerr << "Configuration error: " << e.what() << std::endl;
        return 2;
    }

    std::signal(SIGINT, signal_handler);
    std::signal(SIGTERM, signal_handler);

    try {
        sqlmcp::McpServer::Options opts;
        opts.settings = settings;
        sqlmcp::McpServer server(std::move(opts));

        std::thread watcher([&server] {
            while (!g_stop) {
                std::this_thread::sleep_for(std::chrono::milliseconds(100));
            }
            spdlog::info("Received stop signal, shutting down...");
            server.shutdown();
        });

        try {
            server.start();
        } catch (...) {
            g_stop = true;
            watcher.join();
            throw;
        }
        g_stop = true;
        watcher.join();
    } catch (const std::exception& e) {
        spdlog::critical("Server error: {}", e.what());
        return 1;
    }

    spdlog::info("Server stopped");
    return 0;
}
