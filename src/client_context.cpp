#include "sqlmcp/client_context.hpp"

namespace sqlmcp {

const char* to_string(LifecycleState s) {
    switch (s) {
        case LifecycleState::Uninitialized: return "uninitialized";
        case LifecycleState::Initialized:   return "initialized";
        case LifecycleState::ShuttingDown:  return "shutting_down";
    }
    return "unknown";
}

ClientContext::ClientContext(std::string client_id)
    : client_id_(std::move(client_id))
    , created_at_(std::chrono::system_clock::now()) {
}

LifecycleState ClientContext::state() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return state_;
}

void ClientContext::set_state(LifecycleState s) {
    std::lock_guard<std::mutex> lock(mutex_);
    state_ = s;
}

ClientContexts::ClientContexts()
    : default_(std::make_shared<ClientContext>()) {
}

std::shared_ptr<ClientContext> ClientContexts::open(const std::string& client_id) {
    auto ctx = std::make_shared<ClientContext>(client_id);
    std::lock_guard<std::mutex> lock(mutex_);
    contexts_[client_id] = ctx;
    return ctx;
}

std::shared_ptr<ClientContext> ClientContexts::acquire(const std::string& client_id) const {
    if (client_id.empty()) return default_;
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = contexts_.find(client_id);
    return it == contexts_.end() ? default_ : it->second;
}

bool ClientContexts::release(const std::string& client_id) {
    std::lock_guard<std::mutex> lock(mutex_);
    return contexts_.erase(client_id) > 0;
}

bool ClientContexts::contains(const std::string& client_id) const {
    std::lock_guard<std::mutex> lock(mutex_);
    return contexts_.count(client_id) > 0;
}

size_t ClientContexts::size() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return contexts_.size();
}

} // namespace sqlmcp
