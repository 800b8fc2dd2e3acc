#include "sqlmcp/session_manager.hpp"
#include <spdlog/spdlog.h>
#include <iomanip>
#include <random>
#include <sstream>

namespace sqlmcp {

std::string SessionManager::generate_client_id() {
    thread_local std::mt19937_64 gen{std::random_device{}()};
    std::uniform_int_distribution<uint64_t> dis;
    uint64_t a = dis(gen), b = dis(gen);
    // Format as UUID v4
    a = (a & 0xFFFFFFFFFFFF0FFFull) | 0x0000000000004000ull;
    b = (b & 0x3FFFFFFFFFFFFFFFull) | 0x8000000000000000ull;
    std::ostringstream oss;
    oss << std::hex << std::setfill('0');
    oss << std::setw(8)  << (a >> 32);
    oss << "-" << std::setw(4) << ((a >> 16) & 0xFFFF);
    oss << "-" << std::setw(4) << (a & 0xFFFF);
    oss << "-" << std::setw(4) << (b >> 48);
    oss << "-" << std::setw(12) << (b & 0xFFFFFFFFFFFFull);
    return oss.str();
}

SessionManager::SessionManager(StreamOptions opts, nlohmann::json capabilities,
                               TimerFactory timer_factory)
    : opts_(opts)
    , capabilities_(std::move(capabilities))
    , timer_factory_(std::move(timer_factory)) {
    if (!timer_factory_) {
        timer_factory_ = [] { return std::make_unique<SteadyTimer>(); };
    }
}

SessionManager::~SessionManager() {
    cancel_all();
}

std::string SessionManager::serve(EventSink& sink) {
    std::shared_ptr<StreamSession> session;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        if (!accepting_) return {};
        std::string id;
        do {
            id = generate_client_id();
        } while (sessions_.count(id) > 0);
        session = std::make_shared<StreamSession>(id, sink, timer_factory_(), capabilities_, opts_);
        sessions_[id] = session;
    }

    const std::string client_id = session->client_id();
    try {
        if (on_open_) on_open_(*session);
        session->run();
    } catch (const std::exception& e) {
        spdlog::error("Event stream {} aborted: {}", client_id, e.what());
    }

    {
        std::lock_guard<std::mutex> lock(mutex_);
        sessions_.erase(client_id);
    }
    try {
        if (on_close_) on_close_(*session);
    } catch (const std::exception& e) {
        spdlog::warn("Close listener for {} failed: {}", client_id, e.what());
    }
    return client_id;
}

bool SessionManager::cancel(const std::string& client_id) {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = sessions_.find(client_id);
    if (it == sessions_.end()) return false;
    it->second->cancel();
    return true;
}

void SessionManager::cancel_all() {
    std::lock_guard<std::mutex> lock(mutex_);
    accepting_ = false;
    for (auto& [id, session] : sessions_) {
        session->cancel();
    }
}

size_t SessionManager::active_count() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return sessions_.size();
}

std::vector<std::string> SessionManager::client_ids() const {
    std::lock_guard<std::mutex> lock(mutex_);
    std::vector<std::string> ids;
    ids.reserve(sessions_.size());
    for (const auto& [id, session] : sessions_) ids.push_back(id);
    return ids;
}

bool SessionManager::accepting() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return accepting_;
}

} // namespace sqlmcp
