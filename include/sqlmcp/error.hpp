#pragma once
#include <stdexcept>
#include <string>

namespace sqlmcp {

class McpError : public std::runtime_error {
public:
    using std::runtime_error::runtime_error;
};

class McpParseError : public McpError {
public:
    using McpError::McpError;
};

class McpProtocolError : public McpError {
public:
    int code;
    McpProtocolError(int code, const std::string& msg)
        : McpError(msg), code(code) {}
};

/// Failure reported by a Backend. The message is meant for the client.
class McpBackendError : public McpError {
public:
    using McpError::McpError;
};

class McpTransportError : public McpError {
public:
    using McpError::McpError;
};

class McpTimeoutError : public McpError {
public:
    using McpError::McpError;
};

class McpConfigError : public McpError {
public:
    using McpError::McpError;
};

namespace error {
    constexpr int ParseError       = -32700;
    constexpr int InvalidRequest   = -32600;
    constexpr int MethodNotFound   = -32601;
    constexpr int InvalidParams    = -32602;
    constexpr int InternalError    = -32603;
    constexpr int ApplicationError = -32000;
} // namespace error

} // namespace sqlmcp
