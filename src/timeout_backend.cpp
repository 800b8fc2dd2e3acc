#include "sqlmcp/backend.hpp"
#include "sqlmcp/error.hpp"
#include <future>
#include <stdexcept>

namespace sqlmcp {

TimeoutBackend::TimeoutBackend(std::shared_ptr<IBackend> inner, std::chrono::milliseconds timeout,
                               size_t workers)
    : inner_(std::move(inner)), timeout_(timeout) {
    if (!inner_) {
        throw std::invalid_argument("TimeoutBackend requires a backend");
    }
    if (workers == 0) {
        throw std::invalid_argument("TimeoutBackend requires at least one worker");
    }
    if (timeout_.count() <= 0) return;

    workers_.reserve(workers);
    for (size_t i = 0; i < workers; ++i) {
        workers_.emplace_back([this] { worker_loop(); });
    }
}

TimeoutBackend::~TimeoutBackend() {
    {
        std::lock_guard<std::mutex> lock(mutex_);
        stopping_ = true;
    }
    cv_.notify_all();
    for (auto& t : workers_) {
        if (t.joinable()) t.join();
    }
}

void TimeoutBackend::worker_loop() {
    for (;;) {
        std::function<void()> task;
        {
            std::unique_lock<std::mutex> lock(mutex_);
            cv_.wait(lock, [this] { return stopping_ || !queue_.empty(); });
            if (queue_.empty()) return;
            task = std::move(queue_.front());
            queue_.pop_front();
        }
        task();
        std::lock_guard<std::mutex> lock(mutex_);
        --busy_;
    }
}

size_t TimeoutBackend::in_flight() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return busy_;
}

template<typename T, typename Fn>
T TimeoutBackend::call(const char* operation, Fn fn) {
    if (timeout_.count() <= 0) {
        return fn(*inner_);
    }

    auto task = std::make_shared<std::packaged_task<T()>>(
        [inner = inner_, fn = std::move(fn)]() { return fn(*inner); });
    auto fut = task->get_future();
    {
        std::lock_guard<std::mutex> lock(mutex_);
        if (stopping_) {
            throw McpBackendError("Backend is shutting down");
        }
        // Admitted calls never exceed the workers, so none waits in the queue
        if (busy_ >= workers_.size()) {
            throw McpBackendError(std::string("Backend call '") + operation + "' rejected: "
                                  + std::to_string(busy_) + " calls still running");
        }
        ++busy_;
        queue_.emplace_back([task] { (*task)(); });
    }
    cv_.notify_one();

    if (fut.wait_for(timeout_) == std::future_status::timeout) {
        throw McpTimeoutError(std::string("Backend call '") + operation + "' timed out after "
                              + std::to_string(timeout_.count()) + "ms");
    }
    return fut.get();
}

std::vector<std::string> TimeoutBackend::list_tables() {
    return call<std::vector<std::string>>("list_tables",
        [](IBackend& b) { return b.list_tables(); });
}

TableSchema TimeoutBackend::discover_data(const std::string& table) {
    return call<TableSchema>("discover_data",
        [table](IBackend& b) { return b.discover_data(table); });
}

PreparedQuery TimeoutBackend::prepare_query(const std::string& query) {
    return call<PreparedQuery>("prepare_query",
        [query](IBackend& b) { return b.prepare_query(query); });
}

QueryResult TimeoutBackend::query(const std::string& query) {
    return call<QueryResult>("query",
        [query](IBackend& b) { return b.query(query); });
}

} // namespace sqlmcp
