#pragma once
#include <string>

namespace sqlmcp {

/// Write side of one server-to-client event stream.
class EventSink {
public:
    virtual ~EventSink() = default;

    /// Deliver one framed chunk. Blocks until written. Returns false (or
    /// throws) when the chunk could not be delivered.
    virtual bool send(const std::string& chunk) = 0;

    /// False once the peer is known to be gone.
    [[nodiscard]] virtual bool is_open() const = 0;
};

/// "data: <payload>\n\n"
inline std::string frame_event(const std::string& payload) {
    return "data: " + payload + "\n\n";
}

} // namespace sqlmcp
