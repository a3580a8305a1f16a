#pragma once
#include "protocol_types.hpp"
#include "types.hpp"
#include "transport/transport.hpp"
#include <chrono>
#include <functional>
#include <memory>
#include <optional>
#include <string>
#include <vector>

namespace foundry {

/// Client side of one tool-server session: launches the process, performs
/// the initialize handshake and correlates requests with responses by id.
///
/// Several calls may be in flight at once (bounded by max_in_flight); each
/// waits on its own promise, so a slow call never delays the others.
class ServerConnection {
public:
    struct Options {
        Implementation client_info{"foundry", "0.1.0"};
        std::chrono::milliseconds handshake_timeout{15000};
        std::chrono::milliseconds shutdown_grace{3000};
        std::size_t max_in_flight = 32;
        std::size_t max_catalog_pages = 100;
    };

    /// Invoked once, from the reader thread, when the session ends for any
    /// reason other than close().
    using ClosedCallback = std::function<void(const std::string& reason)>;

    ServerConnection(std::string server_id, Options opts);
    ~ServerConnection();

    ServerConnection(const ServerConnection&) = delete;
    ServerConnection& operator=(const ServerConnection&) = delete;

    void on_closed(ClosedCallback callback);

    // ---- Connection ----
    /// Spawn `config.command` and start reading its stdout.
    /// Throws ServerProcessError when the process cannot be started.
    void launch(const ServerConfig& config);
    /// Run over an existing transport instead of a child process.
    void attach(std::unique_ptr<ITransport> transport);
    /// Ask the peer to exit, escalate after the grace period, join threads.
    void close();

    // ---- Protocol ----
    [[nodiscard]] InitializeResult initialize();
    [[nodiscard]] Page<ToolDefinition> list_tools(const std::optional<std::string>& cursor = std::nullopt);
    /// Follows nextCursor until exhausted (bounded by max_catalog_pages).
    [[nodiscard]] std::vector<ToolDefinition> list_all_tools();
    /// Throws TimeoutError, ProtocolError or TransportError.
    [[nodiscard]] CallToolResult call_tool(const std::string& name,
                                           const nlohmann::json& arguments,
                                           std::chrono::milliseconds timeout);

    // ---- State ----
    [[nodiscard]] bool is_open() const noexcept;
    [[nodiscard]] std::size_t in_flight() const;
    [[nodiscard]] const std::string& server_id() const noexcept;
    [[nodiscard]] std::string stderr_tail() const;

private:
    struct Impl;
    std::unique_ptr<Impl> impl_;
};

} // namespace foundry
