#include "foundry/server_manager.hpp"
#include "foundry/error.hpp"
#include <spdlog/spdlog.h>

namespace foundry {

struct ServerManager::Entry {
    explicit Entry(ServerConfig c) : config(std::move(c)) {}

    std::mutex lifecycle_mutex;

    mutable std::mutex state_mutex;
    ServerConfig config;
    ConnectionStatus status = ConnectionStatus::Disconnected;
    std::optional<std::string> error;
    std::vector<ToolDescriptor> tools;
    std::shared_ptr<ServerConnection> connection;
    uint64_t generation = 0;   // bumped on every connect/disconnect
    bool removed = false;

    ServerStatus snapshot() const {
        std::lock_guard<std::mutex> lock(state_mutex);
        return ServerStatus{config, status, error, tools};
    }
};

namespace {

std::vector<ToolDescriptor> describe_tools(const std::string& server_id,
                                           const std::vector<ToolDefinition>& defs) {
    std::vector<ToolDescriptor> out;
    out.reserve(defs.size());
    for (const auto& d : defs) {
        ToolDescriptor t;
        t.name = namespaced_tool_name(server_id, d.name);
        t.description = "[" + server_id + "] " + d.description.value_or(d.title.value_or(d.name));
        t.input_schema = d.input_schema.is_object()
            ? d.input_schema
            : nlohmann::json{{"type", "object"}, {"properties", nlohmann::json::object()}};
        t.origin = ToolOrigin::Server;
        t.server_id = server_id;
        t.remote_name = d.name;
        out.push_back(std::move(t));
    }
    return out;
}

} // anonymous namespace

ServerManager::ServerManager(Options opts) : opts_(std::move(opts)) {}

ServerManager::~ServerManager() {
    shutdown();
}

std::shared_ptr<ServerManager::Entry> ServerManager::find(const std::string& id) const {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = entries_.find(id);
    return it == entries_.end() ? nullptr : it->second;
}

std::shared_ptr<ServerManager::Entry> ServerManager::require(const std::string& id) const {
    auto entry = find(id);
    if (!entry) throw UnknownServerError(id);
    return entry;
}

// ---- Declared set ----

ServerManager::ReloadSummary ServerManager::reload(const std::vector<ServerConfig>& configs) {
    std::lock_guard<std::mutex> reload_lock(reload_mutex_);

    std::map<std::string, ServerConfig> incoming;
    for (const auto& c : configs) {
        if (c.id.empty() || c.command.empty()) {
            spdlog::warn("Ignoring tool server declaration without id or command");
            continue;
        }
        if (!incoming.emplace(c.id, c).second) {
            spdlog::warn("Duplicate tool server id '{}', keeping the last declaration", c.id);
            incoming[c.id] = c;
        }
    }

    ReloadSummary summary;
    std::vector<std::shared_ptr<Entry>> removed, disabled, restarted;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        for (auto it = entries_.begin(); it != entries_.end();) {
            if (incoming.count(it->first)) {
                ++it;
                continue;
            }
            summary.removed.push_back(it->first);
            removed.push_back(it->second);
            it = entries_.erase(it);
        }

        for (auto& [id, cfg] : incoming) {
            auto it = entries_.find(id);
            if (it == entries_.end()) {
                entries_.emplace(id, std::make_shared<Entry>(cfg));
                summary.added.push_back(id);
                continue;
            }
            auto& entry = it->second;
            std::lock_guard<std::mutex> state(entry->state_mutex);
            if (entry->config == cfg) {
                summary.unchanged.push_back(id);
                continue;
            }
            const ServerConfig old = entry->config;
            const bool live = entry->status == ConnectionStatus::Connected
                              || entry->status == ConnectionStatus::Connecting;
            entry->config = cfg;
            if (old.enabled && !cfg.enabled) {
                disabled.push_back(entry);
                summary.updated.push_back(id);
            } else if (!old.same_launch(cfg) && live) {
                restarted.push_back(entry);
                summary.restarted.push_back(id);
            } else {
                summary.updated.push_back(id);
            }
        }
    }

    for (auto& entry : removed) {
        {
            std::lock_guard<std::mutex> state(entry->state_mutex);
            entry->removed = true;
        }
        disconnect_entry(entry);
    }
    for (auto& entry : disabled) disconnect_entry(entry);
    for (auto& entry : restarted) {
        disconnect_entry(entry);
        connect_entry(entry);
    }

    spdlog::info("Tool servers reloaded: {} added, {} removed, {} restarted, {} updated, {} unchanged",
                 summary.added.size(), summary.removed.size(), summary.restarted.size(),
                 summary.updated.size(), summary.unchanged.size());
    return summary;
}

// ---- Lifecycle ----

ConnectionStatus ServerManager::connect(const std::string& id) {
    return connect_entry(require(id));
}

std::future<ConnectionStatus> ServerManager::connect_async(const std::string& id) {
    auto entry = require(id);
    return std::async(std::launch::async, [this, entry] { return connect_entry(entry); });
}

void ServerManager::connect_all() {
    std::vector<std::shared_ptr<Entry>> targets;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        for (const auto& [id, entry] : entries_) {
            std::lock_guard<std::mutex> state(entry->state_mutex);
            if (entry->config.enabled && entry->status != ConnectionStatus::Connected) {
                targets.push_back(entry);
            }
        }
    }

    std::vector<std::future<ConnectionStatus>> pending;
    pending.reserve(targets.size());
    for (auto& entry : targets) {
        pending.push_back(std::async(std::launch::async, [this, entry] { return connect_entry(entry); }));
    }
    for (auto& f : pending) {
        try {
            f.get();
        } catch (const UnknownServerError& e) {
            spdlog::debug("connect_all: {}", e.what());
        }
    }
}

ConnectionStatus ServerManager::connect_entry(const std::shared_ptr<Entry>& entry) {
    std::lock_guard<std::mutex> lifecycle(entry->lifecycle_mutex);

    ServerConfig config;
    uint64_t gen = 0;
    std::shared_ptr<ServerConnection> stale;
    {
        std::lock_guard<std::mutex> state(entry->state_mutex);
        if (entry->removed) throw UnknownServerError(entry->config.id);
        if (entry->status == ConnectionStatus::Connected && entry->connection
            && entry->connection->is_open()) {
            return ConnectionStatus::Connected;
        }
        if (!entry->config.enabled) {
            entry->status = ConnectionStatus::Failed;
            entry->error = "Server is disabled in configuration";
            return entry->status;
        }
        stale = std::move(entry->connection);
        entry->status = ConnectionStatus::Connecting;
        entry->error.reset();
        entry->tools.clear();
        gen = ++entry->generation;
        config = entry->config;
    }
    if (stale) stale->close();

    spdlog::info("[{}] connecting: {}", config.id, config.command);
    auto conn = std::make_shared<ServerConnection>(config.id, opts_.connection);

    std::weak_ptr<Entry> weak = entry;
    conn->on_closed([weak, gen](const std::string& reason) {
        auto e = weak.lock();
        if (!e) return;
        std::lock_guard<std::mutex> state(e->state_mutex);
        if (e->generation != gen) return;
        if (e->status == ConnectionStatus::Connected || e->status == ConnectionStatus::Connecting) {
            spdlog::error("[{}] server failed: {}", e->config.id, reason);
            e->status = ConnectionStatus::Failed;
            e->error = reason;
            e->tools.clear();
        }
    });

    std::string failure;
    try {
        conn->launch(config);
        InitializeResult init = conn->initialize();
        std::vector<ToolDefinition> defs;
        // A server without the tools capability explicitly offers none.
        if (init.capabilities.tools) defs = conn->list_all_tools();
        auto tools = describe_tools(config.id, defs);

        std::lock_guard<std::mutex> state(entry->state_mutex);
        if (entry->generation == gen && conn->is_open()) {
            entry->status = ConnectionStatus::Connected;
            entry->tools = std::move(tools);
            entry->connection = conn;
            spdlog::info("[{}] connected with {} tools", config.id, entry->tools.size());
            return ConnectionStatus::Connected;
        }
        failure = entry->error.value_or("Server exited during handshake");
    } catch (const FoundryError& e) {
        failure = e.what();
    } catch (const nlohmann::json::exception& e) {
        failure = std::string("Malformed handshake data: ") + e.what();
    }

    conn->close();

    std::string tail = conn->stderr_tail();
    while (!tail.empty() && (tail.back() == '\n' || tail.back() == '\r')) tail.pop_back();
    if (!tail.empty() && failure.find(tail) == std::string::npos) failure += ": " + tail;

    std::lock_guard<std::mutex> state(entry->state_mutex);
    if (entry->generation == gen) {
        entry->status = ConnectionStatus::Failed;
        entry->error = failure;
        entry->tools.clear();
    }
    spdlog::error("[{}] connect failed: {}", config.id, failure);
    return ConnectionStatus::Failed;
}

void ServerManager::disconnect(const std::string& id) {
    disconnect_entry(require(id));
}

void ServerManager::disconnect_entry(const std::shared_ptr<Entry>& entry) {
    std::lock_guard<std::mutex> lifecycle(entry->lifecycle_mutex);

    std::shared_ptr<ServerConnection> conn;
    std::string id;
    {
        std::lock_guard<std::mutex> state(entry->state_mutex);
        conn = std::move(entry->connection);
        ++entry->generation;
        entry->status = ConnectionStatus::Disconnected;
        entry->error.reset();
        entry->tools.clear();
        id = entry->config.id;
    }
    // In-flight calls hold their own reference; close() fails them.
    if (conn) {
        conn->close();
        spdlog::info("[{}] disconnected", id);
    }
}

void ServerManager::shutdown() {
    std::vector<std::shared_ptr<Entry>> all;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        for (const auto& [id, entry] : entries_) all.push_back(entry);
    }
    std::vector<std::future<void>> pending;
    for (auto& entry : all) {
        pending.push_back(std::async(std::launch::async, [this, entry] { disconnect_entry(entry); }));
    }
    for (auto& f : pending) f.get();
}

// ---- Calls ----

CallToolResult ServerManager::invoke(const std::string& id, const std::string& tool,
                                     const nlohmann::json& args,
                                     std::optional<std::chrono::milliseconds> timeout) {
    auto entry = require(id);
    std::shared_ptr<ServerConnection> conn;
    {
        std::lock_guard<std::mutex> state(entry->state_mutex);
        if (entry->status != ConnectionStatus::Connected || !entry->connection) {
            throw TransportError("Server '" + id + "' is not connected");
        }
        conn = entry->connection;
    }
    return conn->call_tool(tool, args, timeout.value_or(opts_.call_timeout));
}

// ---- Views ----

std::vector<ToolDescriptor> ServerManager::list_tools() const {
    std::vector<std::shared_ptr<Entry>> all;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        for (const auto& [id, entry] : entries_) all.push_back(entry);
    }
    std::vector<ToolDescriptor> tools;
    for (const auto& entry : all) {
        std::lock_guard<std::mutex> state(entry->state_mutex);
        if (entry->status != ConnectionStatus::Connected) continue;
        tools.insert(tools.end(), entry->tools.begin(), entry->tools.end());
    }
    return tools;
}

std::optional<ServerStatus> ServerManager::status(const std::string& id) const {
    auto entry = find(id);
    if (!entry) return std::nullopt;
    return entry->snapshot();
}

std::vector<ServerStatus> ServerManager::statuses() const {
    std::vector<std::shared_ptr<Entry>> all;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        for (const auto& [id, entry] : entries_) all.push_back(entry);
    }
    std::vector<ServerStatus> out;
    out.reserve(all.size());
    for (const auto& entry : all) out.push_back(entry->snapshot());
    return out;
}

bool ServerManager::is_connected(const std::string& id) const {
    auto entry = find(id);
    if (!entry) return false;
    std::lock_guard<std::mutex> state(entry->state_mutex);
    return entry->status == ConnectionStatus::Connected;
}

bool ServerManager::contains(const std::string& id) const {
    return find(id) != nullptr;
}

} // namespace foundry
