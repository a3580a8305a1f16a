#pragma once
#include <stdexcept>
#include <string>

namespace foundry {

class FoundryError : public std::runtime_error {
public:
    using std::runtime_error::runtime_error;
};

/// Malformed frame on a tool-server pipe. Treated like a process failure:
/// the connection is recycled.
class ParseError : public FoundryError {
public:
    using FoundryError::FoundryError;
};

/// JSON-RPC error object returned by a tool server.
class ProtocolError : public FoundryError {
public:
    int code;
    ProtocolError(int code, const std::string& msg)
        : FoundryError(msg), code(code) {}
};

class TransportError : public FoundryError {
public:
    using FoundryError::FoundryError;
};

class TimeoutError : public FoundryError {
public:
    using FoundryError::FoundryError;
};

/// Spawn, handshake or crash of a tool-server subprocess.
class ServerProcessError : public FoundryError {
public:
    using FoundryError::FoundryError;
};

class UnknownServerError : public FoundryError {
public:
    explicit UnknownServerError(const std::string& id)
        : FoundryError("Unknown tool server: " + id) {}
};

/// Failure reported by (or while talking to) the remote completion service.
class UpstreamError : public FoundryError {
public:
    int status;
    UpstreamError(int status, const std::string& msg)
        : FoundryError(msg), status(status) {}
    explicit UpstreamError(const std::string& msg)
        : FoundryError(msg), status(0) {}
};

class ConversationBusyError : public FoundryError {
public:
    explicit ConversationBusyError(const std::string& id)
        : FoundryError("Conversation " + id + " already has a request in progress") {}
};

class ConfigError : public FoundryError {
public:
    using FoundryError::FoundryError;
};

namespace error {
    constexpr int ParseError       = -32700;
    constexpr int InvalidRequest   = -32600;
    constexpr int MethodNotFound   = -32601;
    constexpr int InvalidParams    = -32602;
    constexpr int InternalError    = -32603;
    constexpr int RequestCancelled = -32800;
} // namespace error

} // namespace foundry
