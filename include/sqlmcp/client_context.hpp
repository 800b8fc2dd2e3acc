#pragma once
#include <chrono>
#include <map>
#include <memory>
#include <mutex>
#include <string>
#include <vector>

namespace sqlmcp {

enum class LifecycleState {
    Uninitialized,
    Initialized,
    ShuttingDown
};

const char* to_string(LifecycleState s);

/// Dispatcher state of one logical client. Passed into every dispatch call.
class ClientContext {
public:
    explicit ClientContext(std::string client_id = {});

    [[nodiscard]] const std::string& client_id() const { return client_id_; }

    LifecycleState state() const;
    void set_state(LifecycleState s);

    [[nodiscard]] std::chrono::system_clock::time_point created_at() const { return created_at_; }

private:
    mutable std::mutex mutex_;
    std::string client_id_;
    LifecycleState state_{LifecycleState::Uninitialized};
    std::chrono::system_clock::time_point created_at_;
};

/// Client contexts keyed by client id. Contexts are opened and released
/// alongside event streams; calls without a known id share one default
/// context.
class ClientContexts {
public:
    ClientContexts();

    /// Create the context for a newly opened stream.
    std::shared_ptr<ClientContext> open(const std::string& client_id);

    /// Context for a call. Falls back to the shared default for an empty
    /// or unknown id.
    std::shared_ptr<ClientContext> acquire(const std::string& client_id) const;

    bool release(const std::string& client_id);

    [[nodiscard]] bool contains(const std::string& client_id) const;
    [[nodiscard]] size_t size() const;
    [[nodiscard]] std::shared_ptr<ClientContext> shared_default() const { return default_; }

private:
    mutable std::mutex mutex_;
    std::map<std::string, std::shared_ptr<ClientContext>> contexts_;
    std::shared_ptr<ClientContext> default_;
};

} // namespace sqlmcp
