#pragma once
#include "../json_rpc.hpp"
#include <exception>
#include <functional>

namespace foundry {

using MessageCallback = std::function<void(JsonRpcMessage)>;
using ErrorCallback = std::function<void(std::exception_ptr)>;

/// Bidirectional JSON-RPC channel to one peer.
class ITransport {
public:
    virtual ~ITransport() = default;

    /// Run the read loop on the calling thread until the peer closes the
    /// stream or shutdown() is called.
    virtual void start(MessageCallback on_message,
                       ErrorCallback on_error = nullptr) = 0;

    /// Queue a message for the peer. Throws TransportError once shut down.
    virtual void send(const JsonRpcMessage& msg) = 0;

    virtual void shutdown() = 0;

    [[nodiscard]] virtual bool is_connected() const = 0;
};

} // namespace foundry
