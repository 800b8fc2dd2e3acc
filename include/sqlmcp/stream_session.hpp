#pragma once
#include "transport/event_sink.hpp"
#include <atomic>
#include <chrono>
#include <condition_variable>
#include <memory>
#include <mutex>
#include <string>
#include <nlohmann/json.hpp>

namespace sqlmcp {

enum class StreamState {
    Active,
    Closing,
    Closed
};

enum class CloseReason {
    None,
    Cancelled,          // explicit stop signal
    Disconnected,       // peer went away, noticed at a suspension point
    MissedHeartbeats,
    StreamError
};

const char* to_string(StreamState s);
const char* to_string(CloseReason r);

/// Suspension point of a stream session.
class Timer {
public:
    virtual ~Timer() = default;

    /// Wait for the given duration. Returns false when cancelled before
    /// or during the wait.
    virtual bool wait_for(std::chrono::milliseconds d) = 0;

    /// Wake any current wait and fail all later ones.
    virtual void cancel() = 0;

    [[nodiscard]] virtual bool cancelled() const = 0;
};

class SteadyTimer : public Timer {
public:
    bool wait_for(std::chrono::milliseconds d) override;
    void cancel() override;
    bool cancelled() const override;

private:
    mutable std::mutex mutex_;
    std::condition_variable cv_;
    bool cancelled_{false};
};

struct StreamOptions {
    std::chrono::milliseconds grace_delay{1000};
    std::chrono::milliseconds heartbeat_interval{10000};
    int max_missed_heartbeats = 3;
    /// Include fault messages in error events.
    bool debug = false;
};

/// One open event stream.
///
/// run() emits a "ready" event, waits the grace delay, emits the
/// capabilities event and then a heartbeat every interval. A failed
/// heartbeat increments the missed counter, a delivered one resets it;
/// reaching max_missed_heartbeats closes the session after a best-effort
/// error event. cancel() or a vanished peer closes it without one.
class StreamSession {
public:
    StreamSession(std::string client_id,
                  EventSink& sink,
                  std::unique_ptr<Timer> timer,
                  nlohmann::json capabilities,
                  StreamOptions opts);

    StreamSession(const StreamSession&) = delete;
    StreamSession& operator=(const StreamSession&) = delete;

    /// Drive the session until it is Closed. Runs on the caller's thread.
    void run();

    /// Request termination. Thread-safe; returns immediately.
    void cancel();

    /// One heartbeat attempt. Returns true while the session stays Active.
    bool heartbeat();

    [[nodiscard]] const std::string& client_id() const { return client_id_; }
    [[nodiscard]] StreamState state() const { return state_.load(); }
    [[nodiscard]] CloseReason close_reason() const { return close_reason_.load(); }
    [[nodiscard]] int missed_heartbeats() const { return missed_heartbeats_.load(); }
    [[nodiscard]] std::chrono::system_clock::time_point created_at() const { return created_at_; }

    [[nodiscard]] nlohmann::json ready_event() const;
    [[nodiscard]] nlohmann::json capabilities_event() const;
    [[nodiscard]] nlohmann::json heartbeat_event() const;
    [[nodiscard]] nlohmann::json error_event(const std::string& detail) const;

private:
    bool emit(const nlohmann::json& event);
    bool suspend(std::chrono::milliseconds d);
    void close(CloseReason reason);
    void fail(CloseReason reason, const std::string& detail);

    std::string client_id_;
    EventSink& sink_;
    std::unique_ptr<Timer> timer_;
    nlohmann::json capabilities_;
    StreamOptions opts_;
    std::chrono::system_clock::time_point created_at_;

    std::atomic<StreamState> state_{StreamState::Active};
    std::atomic<CloseReason> close_reason_{CloseReason::None};
    std::atomic<int> missed_heartbeats_{0};
};

} // namespace sqlmcp
