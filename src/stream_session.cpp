#include "sqlmcp/stream_session.hpp"
#include "sqlmcp/timestamp.hpp"
#include "sqlmcp/version.hpp"
#include <spdlog/spdlog.h>

namespace sqlmcp {

const char* to_string(StreamState s) {
    switch (s) {
        case StreamState::Active:  return "active";
        case StreamState::Closing: return "closing";
        case StreamState::Closed:  return "closed";
    }
    return "unknown";
}

const char* to_string(CloseReason r) {
    switch (r) {
        case CloseReason::None:             return "none";
        case CloseReason::Cancelled:        return "cancelled";
        case CloseReason::Disconnected:     return "disconnected";
        case CloseReason::MissedHeartbeats: return "missed_heartbeats";
        case CloseReason::StreamError:      return "stream_error";
    }
    return "unknown";
}

// ---------- SteadyTimer ----------

bool SteadyTimer::wait_for(std::chrono::milliseconds d) {
    std::unique_lock<std::mutex> lock(mutex_);
    cv_.wait_for(lock, d, [this] { return cancelled_; });
    return !cancelled_;
}

void SteadyTimer::cancel() {
    {
        std::lock_guard<std::mutex> lock(mutex_);
        cancelled_ = true;
    }
    cv_.notify_all();
}

bool SteadyTimer::cancelled() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return cancelled_;
}

// ---------- StreamSession ----------

StreamSession::StreamSession(std::string client_id,
                             EventSink& sink,
                             std::unique_ptr<Timer> timer,
                             nlohmann::json capabilities,
                             StreamOptions opts)
    : client_id_(std::move(client_id))
    , sink_(sink)
    , timer_(timer ? std::move(timer) : std::make_unique<SteadyTimer>())
    , capabilities_(std::move(capabilities))
    , opts_(opts)
    , created_at_(std::chrono::system_clock::now()) {
}

nlohmann::json StreamSession::ready_event() const {
    return {{"type", "ready"}, {"clientId", client_id_}};
}

nlohmann::json StreamSession::capabilities_event() const {
    return {
        {"jsonrpc", std::string(JSONRPC_VERSION)},
        {"id", 1},
        {"result", capabilities_}
    };
}

nlohmann::json StreamSession::heartbeat_event() const {
    return {{"type", "heartbeat"}, {"timestamp", iso8601_now()}, {"clientId", client_id_}};
}

nlohmann::json StreamSession::error_event(const std::string& detail) const {
    nlohmann::json event = {{"type", "error"}, {"message", "Stream error"}};
    if (opts_.debug) event["detail"] = detail;
    return event;
}

bool StreamSession::emit(const nlohmann::json& event) {
    try {
        return sink_.send(frame_event(event.dump()));
    } catch (const std::exception& e) {
        spdlog::debug("Event stream {} send failed: {}", client_id_, e.what());
        return false;
    }
}

bool StreamSession::suspend(std::chrono::milliseconds d) {
    if (!timer_->wait_for(d)) {
        close(CloseReason::Cancelled);
        return false;
    }
    if (!sink_.is_open()) {
        close(CloseReason::Disconnected);
        return false;
    }
    return true;
}

void StreamSession::close(CloseReason reason) {
    auto expected = CloseReason::None;
    close_reason_.compare_exchange_strong(expected, reason);
    state_ = StreamState::Closed;
}

void StreamSession::fail(CloseReason reason, const std::string& detail) {
    state_ = StreamState::Closing;
    // Best effort; the transport is likely already broken
    emit(error_event(detail));
    close(reason);
}

bool StreamSession::heartbeat() {
    if (state_ != StreamState::Active) return false;

    if (emit(heartbeat_event())) {
        missed_heartbeats_ = 0;
        return true;
    }

    int missed = ++missed_heartbeats_;
    spdlog::error("Error sending heartbeat to client {} ({} missed)", client_id_, missed);
    if (missed >= opts_.max_missed_heartbeats) {
        spdlog::warn("Too many missed heartbeats for client {}, closing connection", client_id_);
        fail(CloseReason::MissedHeartbeats, "Too many missed heartbeats");
        return false;
    }
    return true;
}

void StreamSession::run() {
    if (state_ != StreamState::Active) return;
    spdlog::info("Event stream opened: {}", client_id_);

    try {
        if (!emit(ready_event())) {
            fail(CloseReason::StreamError, "Failed to send ready event");
        } else if (suspend(opts_.grace_delay)) {
            if (!emit(capabilities_event())) {
                fail(CloseReason::StreamError, "Failed to send capabilities event");
            }
            while (state_ == StreamState::Active && suspend(opts_.heartbeat_interval)) {
                heartbeat();
            }
        }
    } catch (const std::exception& e) {
        spdlog::error("Event stream error for client {}: {}", client_id_, e.what());
        fail(CloseReason::StreamError, e.what());
    }

    if (state_ != StreamState::Closed) close(CloseReason::Cancelled);
    spdlog::info("Event stream terminated: {} ({})", client_id_, to_string(close_reason()));
}

void StreamSession::cancel() {
    timer_->cancel();
}

} // namespace sqlmcp
