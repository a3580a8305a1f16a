#pragma once
#include "server_connection.hpp"
#include "types.hpp"
#include <chrono>
#include <future>
#include <map>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <vector>

namespace foundry {

/// Owns the declared tool servers and their connections.
///
/// Every lifecycle transition goes through this class. Membership is
/// guarded by one map mutex; each server additionally has its own lifecycle
/// mutex (connect/disconnect/restart of that id never race each other) and
/// a state mutex for status reads. Calls copy the live connection's
/// shared_ptr and run without holding any manager lock, so a slow server
/// blocks nobody but its own callers, and tearing a server down while calls
/// are in flight fails those calls instead of corrupting state.
///
/// A crashed server moves to Failed and stays there until connect() is
/// called again; there is no automatic restart.
class ServerManager {
public:
    struct Options {
        ServerConnection::Options connection;
        std::chrono::milliseconds call_timeout{60000};
    };

    struct ReloadSummary {
        std::vector<std::string> added;
        std::vector<std::string> removed;
        std::vector<std::string> restarted;
        std::vector<std::string> updated;
        std::vector<std::string> unchanged;
    };

    explicit ServerManager(Options opts);
    ~ServerManager();

    ServerManager(const ServerManager&) = delete;
    ServerManager& operator=(const ServerManager&) = delete;

    /// Replace the declared set. Removed servers are torn down, added ones
    /// start Disconnected, live servers whose launch changed are restarted,
    /// servers switched to disabled are disconnected. Idempotent.
    ReloadSummary reload(const std::vector<ServerConfig>& configs);

    /// Spawn, handshake and fetch the catalog. Blocks until Connected or
    /// Failed and returns that status; a Connected server is left alone.
    /// Throws UnknownServerError.
    ConnectionStatus connect(const std::string& id);

    /// connect() on a background thread.
    [[nodiscard]] std::future<ConnectionStatus> connect_async(const std::string& id);

    /// Connect every enabled, not yet connected server concurrently and
    /// wait for all of them.
    void connect_all();

    /// Always ends Disconnected, escalating to SIGKILL if needed.
    /// Throws UnknownServerError.
    void disconnect(const std::string& id);

    /// Disconnect everything. The declared set is kept.
    void shutdown();

    /// Call `tool` on server `id`. Throws UnknownServerError,
    /// TransportError (not connected / connection lost), TimeoutError or
    /// ProtocolError.
    [[nodiscard]] CallToolResult invoke(const std::string& id, const std::string& tool,
                                        const nlohmann::json& args,
                                        std::optional<std::chrono::milliseconds> timeout = std::nullopt);

    /// Descriptors of every Connected server, namespaced "server__tool".
    [[nodiscard]] std::vector<ToolDescriptor> list_tools() const;

    [[nodiscard]] std::optional<ServerStatus> status(const std::string& id) const;
    [[nodiscard]] std::vector<ServerStatus> statuses() const;
    [[nodiscard]] bool is_connected(const std::string& id) const;
    [[nodiscard]] bool contains(const std::string& id) const;

private:
    struct Entry;

    std::shared_ptr<Entry> find(const std::string& id) const;
    std::shared_ptr<Entry> require(const std::string& id) const;
    ConnectionStatus connect_entry(const std::shared_ptr<Entry>& entry);
    void disconnect_entry(const std::shared_ptr<Entry>& entry);

    Options opts_;
    mutable std::mutex mutex_;
    std::map<std::string, std::shared_ptr<Entry>> entries_;
    std::mutex reload_mutex_;
};

} // namespace foundry
