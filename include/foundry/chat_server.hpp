#pragma once
#include "config.hpp"
#include "conversation_engine.hpp"
#include "project_catalog.hpp"
#include "server_manager.hpp"
#include "session_store.hpp"
#include <atomic>
#include <chrono>
#include <functional>
#include <memory>
#include <string>
#include <vector>

// Forward declarations to avoid including heavy httplib header
namespace httplib {
    class Server;
    class Response;
}

namespace foundry {

/// HTTP front end: the streaming chat endpoint plus session, conversation
/// and tool-server management routes. Each chat request gets a producer
/// thread running the engine; frames reach the socket through a bounded
/// channel, so a slow client stalls the engine instead of losing events.
/// A dropped connection cancels the run.
class ChatServer {
public:
    struct Options {
        std::string host = "127.0.0.1";
        int port = 8000;                              // 0: pick a free port
        std::size_t stream_buffer = 256;
        std::chrono::milliseconds keepalive_interval{15000};
        std::size_t worker_threads = 32;
        std::vector<ModelInfo> models = AppConfig::default_models();
    };

    /// Re-reads the server declarations for POST /mcp/servers/refresh.
    using ServerSource = std::function<std::vector<ServerConfig>()>;

    ChatServer(Options opts, ConversationEngine& engine, SessionStore& sessions,
               ServerManager& servers, std::shared_ptr<const ProjectCatalog> catalog,
               ServerSource server_source = nullptr);
    ~ChatServer();

    ChatServer(const ChatServer&) = delete;
    ChatServer& operator=(const ChatServer&) = delete;

    /// Bind the listening socket and return the port. Throws TransportError.
    int bind();
    /// Serve on the bound socket until stop().
    void serve();
    /// bind() then serve().
    void listen();
    void stop();

    [[nodiscard]] int port() const noexcept { return port_.load(); }
    [[nodiscard]] bool is_running() const;

private:
    void setup_routes();
    void handle_chat(const std::string& project_id, const std::string& user_id,
                     const std::string& body, httplib::Response& res);
    bool project_known(const std::string& project_id) const;

    Options opts_;
    ConversationEngine& engine_;
    SessionStore& sessions_;
    ServerManager& servers_;
    std::shared_ptr<const ProjectCatalog> catalog_;
    ServerSource server_source_;
    std::unique_ptr<httplib::Server> server_;
    std::atomic<int> port_{0};
};

} // namespace foundry
