#pragma once
#include "types.hpp"
#include <chrono>
#include <condition_variable>
#include <deque>
#include <functional>
#include <memory>
#include <mutex>
#include <string>
#include <thread>
#include <vector>

namespace sqlmcp {

/// Data source behind the SQL tools. Operations throw McpBackendError for
/// failures the client should see. Implementations shared between
/// connections must be safe to call concurrently.
class IBackend {
public:
    virtual ~IBackend() = default;

    virtual std::vector<std::string> list_tables() = 0;
    virtual TableSchema discover_data(const std::string& table) = 0;
    virtual PreparedQuery prepare_query(const std::string& query) = 0;
    virtual QueryResult query(const std::string& query) = 0;
};

/// Fixed literal data, independent of the input.
class StubBackend : public IBackend {
public:
    std::vector<std::string> list_tables() override;
    TableSchema discover_data(const std::string& table) override;
    PreparedQuery prepare_query(const std::string& query) override;
    QueryResult query(const std::string& query) override;
};

/// Bounds the latency of every call on the wrapped backend. A call that
/// does not finish within the timeout throws McpTimeoutError; the call
/// itself keeps running on its worker and its result is dropped. Calls run
/// on a fixed set of owned workers: when all of them are busy, typically
/// with abandoned calls, new calls fail at once with McpBackendError.
/// The destructor waits for running calls.
class TimeoutBackend : public IBackend {
public:
    static constexpr size_t DEFAULT_WORKERS = 8;

    TimeoutBackend(std::shared_ptr<IBackend> inner, std::chrono::milliseconds timeout,
                   size_t workers = DEFAULT_WORKERS);
    ~TimeoutBackend() override;

    TimeoutBackend(const TimeoutBackend&) = delete;
    TimeoutBackend& operator=(const TimeoutBackend&) = delete;

    std::vector<std::string> list_tables() override;
    TableSchema discover_data(const std::string& table) override;
    PreparedQuery prepare_query(const std::string& query) override;
    QueryResult query(const std::string& query) override;

    [[nodiscard]] std::chrono::milliseconds timeout() const { return timeout_; }
    [[nodiscard]] size_t worker_count() const { return workers_.size(); }

    /// Calls currently occupying a worker, abandoned ones included.
    [[nodiscard]] size_t in_flight() const;

private:
    template<typename T, typename Fn>
    T call(const char* operation, Fn fn);

    void worker_loop();

    std::shared_ptr<IBackend> inner_;
    std::chrono::milliseconds timeout_;

    std::vector<std::thread> workers_;
    std::deque<std::function<void()>> queue_;
    mutable std::mutex mutex_;
    std::condition_variable cv_;
    size_t busy_ = 0;
    bool stopping_ = false;
};

} // namespace sqlmcp
