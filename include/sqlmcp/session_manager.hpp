#pragma once
#include "stream_session.hpp"
#include "transport/event_sink.hpp"
#include <functional>
#include <map>
#include <memory>
#include <mutex>
#include <string>
#include <vector>

namespace sqlmcp {

/// Owns every open event stream. Each stream runs on the thread that
/// called serve(); sessions share nothing but the capabilities payload.
class SessionManager {
public:
    using TimerFactory = std::function<std::unique_ptr<Timer>()>;
    using SessionListener = std::function<void(const StreamSession&)>;

    SessionManager(StreamOptions opts, nlohmann::json capabilities,
                   TimerFactory timer_factory = nullptr);
    ~SessionManager();

    SessionManager(const SessionManager&) = delete;
    SessionManager& operator=(const SessionManager&) = delete;

    /// Open a session on sink and run it until it closes. Blocks.
    /// Returns the client id, or an empty string once the manager has
    /// stopped accepting sessions.
    std::string serve(EventSink& sink);

    /// Cancel one session. Returns false for an unknown client id.
    bool cancel(const std::string& client_id);

    /// Cancel every session and refuse new ones.
    void cancel_all();

    /// Called on the session's thread right after registration and
    /// right before removal. Set before serving.
    void on_open(SessionListener listener) { on_open_ = std::move(listener); }
    void on_close(SessionListener listener) { on_close_ = std::move(listener); }

    [[nodiscard]] size_t active_count() const;
    [[nodiscard]] std::vector<std::string> client_ids() const;
    [[nodiscard]] bool accepting() const;

    /// Random UUID v4.
    static std::string generate_client_id();

private:
    StreamOptions opts_;
    nlohmann::json capabilities_;
    TimerFactory timer_factory_;
    SessionListener on_open_;
    SessionListener on_close_;

    mutable std::mutex mutex_;
    std::map<std::string, std::shared_ptr<StreamSession>> sessions_;
    bool accepting_{true};
};

} // namespace sqlmcp
