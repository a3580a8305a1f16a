/// Foundry assistant server: chat streaming over SSE plus tool-server management.
/// Usage: ./foundry_server [--config foundry.json] [--host 127.0.0.1] [--port 8000]

#include <foundry/foundry.hpp>
#include <atomic>
#include <csignal>
#include <iostream>
#include <thread>

namespace {

std::atomic<bool> g_stop{false};

void signal_handler(int) {
    g_stop = true;
}

void usage(const char* argv0) {
    std::cerr << "Usage: " << argv0 << " [--config <file>] [--host <addr>] [--port <n>]\n";
}

} // namespace

int main(int argc, char* argv[]) {
    std::optional<std::filesystem::path> config_path;
    std::optional<std::string> host;
    std::optional<int> port;
    for (int i = 1; i < argc; ++i) {
        std::string arg = argv[i];
        if ((arg == "--config" || arg == "-c") && i + 1 < argc) {
            config_path = argv[++i];
        } else if (arg == "--host" && i + 1 < argc) {
            host = argv[++i];
        } else if (arg == "--port" && i + 1 < argc) {
            try {
                port = std::stoi(argv[++i]);
            } catch (const std::exception&) {
                usage(argv[0]);
                return 2;
            }
        } else if (arg == "--help" || arg == "-h") {
            usage(argv[0]);
            return 0;
        } else {
            usage(argv[0]);
            return 2;
        }
    }

    foundry::AppConfig config;
    try {
        if (config_path) config = foundry::load_config(*config_path);
        foundry::apply_env_overrides(config);
    } catch (const foundry::ConfigError& e) {
        std::cerr << "Configuration error: " << e.what() << "\n";
        return 2;
    }
    if (host) config.host = *host;
    if (port) config.port = *port;

    foundry::configure_logging(config.log_level);
    if (config.anthropic.api_key.empty()) {
        spdlog::warn("no API key configured; set ANTHROPIC_API_KEY or anthropic.api_key");
    }

    // ---- Project data and built-in tools ----
    std::shared_ptr<const foundry::ProjectCatalog> projects;
    try {
        if (config.project_data) projects = foundry::JsonProjectCatalog::load(*config.project_data);
    } catch (const foundry::ConfigError& e) {
        spdlog::error("{}", e.what());
        return 2;
    }
    auto tool_catalog = projects ? projects
                                 : std::make_shared<foundry::JsonProjectCatalog>(
                                       nlohmann::json{{"projects", nlohmann::json::array()}});

    foundry::ToolRegistry registry;
    foundry::register_project_tools(registry, tool_catalog);
    registry.seal();

    // ---- Tool servers ----
    foundry::ServerManager::Options mopts;
    mopts.connection.handshake_timeout = config.handshake_timeout;
    mopts.connection.shutdown_grace = config.shutdown_grace;
    mopts.call_timeout = config.server_call_timeout;
    foundry::ServerManager servers{mopts};
    servers.reload(config.servers);

    foundry::ChatServer::ServerSource server_source = [config, config_path]() {
        if (config.servers_file) return foundry::load_server_configs(*config.servers_file);
        if (config_path) return foundry::load_config(*config_path).servers;
        return config.servers;
    };

    std::unique_ptr<foundry::ConfigWatcher> watcher;
    if (config.servers_file) {
        watcher = std::make_unique<foundry::ConfigWatcher>(
            *config.servers_file, config.reload_interval,
            [&servers](const std::vector<foundry::ServerConfig>& configs) {
                auto summary = servers.reload(configs);
                spdlog::info("servers reloaded: {} added, {} removed, {} restarted",
                             summary.added.size(), summary.removed.size(), summary.restarted.size());
            });
        watcher->poll();
        watcher->start();
    }
    if (config.autoconnect) servers.connect_all();

    // ---- Engine ----
    foundry::ToolRouter::Options ropts;
    ropts.builtin_timeout = config.builtin_tool_timeout;
    ropts.server_timeout = config.server_call_timeout;
    foundry::ToolRouter router{registry, servers, ropts};

    foundry::AnthropicClient::Options aopts;
    aopts.api_key = config.anthropic.api_key;
    aopts.base_url = config.anthropic.base_url;
    aopts.api_version = config.anthropic.api_version;
    foundry::AnthropicClient client{aopts};

    foundry::SessionStore sessions;

    foundry::ConversationEngine::Options eopts;
    eopts.max_tool_rounds = config.max_tool_rounds;
    eopts.max_tokens = config.anthropic.max_tokens;
    eopts.default_model = config.anthropic.model;
    eopts.parallel_tool_calls = config.parallel_tool_calls;
    foundry::ConversationEngine engine{client, router, sessions, projects, eopts};

    // ---- HTTP ----
    foundry::ChatServer::Options sopts;
    sopts.host = config.host;
    sopts.port = config.port;
    sopts.stream_buffer = config.stream_buffer;
    sopts.models = config.models;
    foundry::ChatServer server{sopts, engine, sessions, servers, projects, server_source};

    std::signal(SIGINT, signal_handler);
    std::signal(SIGTERM, signal_handler);

    std::atomic<bool> done{false};
    std::thread stopper([&] {
        while (!g_stop && !done) std::this_thread::sleep_for(std::chrono::milliseconds(100));
        server.stop();
    });

    int rc = 0;
    try {
        server.listen();
    } catch (const foundry::TransportError& e) {
        spdlog::error("{}", e.what());
        rc = 1;
    }
    done = true;
    stopper.join();

    spdlog::info("shutting down");
    if (watcher) watcher->stop();
    servers.shutdown();
    return rc;
}
