#include "foundry/config.hpp"
#include "foundry/codec.hpp"
#include "foundry/error.hpp"
#include <cstdlib>
#include <fstream>
#include <sstream>
#include <spdlog/spdlog.h>

namespace fs = std::filesystem;

namespace foundry {

namespace {

std::string read_file(const fs::path& path) {
    std::ifstream in(path);
    if (!in) throw ConfigError("Cannot open " + path.string());
    std::stringstream ss;
    ss << in.rdbuf();
    return ss.str();
}

nlohmann::json parse_file(const fs::path& path) {
    try {
        return Codec::parse_json(read_file(path));
    } catch (const ParseError& e) {
        throw ConfigError("Invalid JSON in " + path.string() + ": " + e.what());
    }
}

template <typename T>
T get_as(const nlohmann::json& obj, const char* key, T fallback) {
    auto it = obj.find(key);
    if (it == obj.end() || it->is_null()) return fallback;
    try {
        return it->get<T>();
    } catch (const nlohmann::json::exception&) {
        throw ConfigError(std::string("Invalid value for '") + key + "'");
    }
}

std::chrono::milliseconds get_ms(const nlohmann::json& obj, const char* key,
                                 std::chrono::milliseconds fallback) {
    auto v = get_as<long long>(obj, key, fallback.count());
    if (v <= 0) throw ConfigError(std::string("'") + key + "' must be positive");
    return std::chrono::milliseconds(v);
}

fs::path resolve(const fs::path& base_dir, const std::string& p) {
    fs::path path(p);
    if (path.is_relative() && !base_dir.empty()) return base_dir / path;
    return path;
}

ServerConfig parse_server(const std::string& id, const nlohmann::json& s, bool map_form) {
    if (!s.is_object()) throw ConfigError("Server '" + id + "' must be an object");
    ServerConfig cfg;
    cfg.id = id;
    cfg.command = get_as<std::string>(s, "command", "");
    if (cfg.command.empty()) throw ConfigError("Server '" + id + "' has no command");
    cfg.args = get_as<std::vector<std::string>>(s, "args", {});
    cfg.env = get_as<std::map<std::string, std::string>>(s, "env", {});
    if (map_form) {
        cfg.enabled = !get_as<bool>(s, "disabled", false);
    } else {
        cfg.enabled = get_as<bool>(s, "enabled", true);
    }
    return cfg;
}

} // namespace

void to_json(nlohmann::json& j, const ModelInfo& m) {
    j = nlohmann::json{{"id", m.id}, {"name", m.name}, {"description", m.description}};
}

std::vector<ModelInfo> AppConfig::default_models() {
    return {
        {"claude-opus-4-6", "Claude Opus 4.6", "Most capable model, deep reasoning and complex analysis"},
        {"claude-sonnet-4-5-20250929", "Claude Sonnet 4.5", "Fast and capable, a good balance of speed and quality"},
        {"claude-haiku-4-5-20251001", "Claude Haiku 4.5", "Fastest model, quick answers at lower cost"},
    };
}

// ---------- Server declarations ----------

std::vector<ServerConfig> parse_server_configs(const nlohmann::json& doc) {
    if (!doc.is_object()) throw ConfigError("Server configuration must be a JSON object");

    std::vector<ServerConfig> out;
    std::map<std::string, bool> seen;
    auto add = [&](ServerConfig cfg) {
        if (cfg.id.empty()) throw ConfigError("Server entry without an id");
        if (cfg.id.find(NAMESPACE_SEPARATOR) != std::string::npos) {
            throw ConfigError("Server id '" + cfg.id + "' must not contain '__'");
        }
        if (seen[cfg.id]) throw ConfigError("Duplicate server id '" + cfg.id + "'");
        seen[cfg.id] = true;
        out.push_back(std::move(cfg));
    };

    if (auto it = doc.find("servers"); it != doc.end() && !it->is_null()) {
        if (!it->is_array()) throw ConfigError("'servers' must be an array");
        for (const auto& s : *it) {
            add(parse_server(s.is_object() ? get_as<std::string>(s, "id", "") : "", s, false));
        }
    }
    if (auto it = doc.find("mcpServers"); it != doc.end() && !it->is_null()) {
        if (!it->is_object()) throw ConfigError("'mcpServers' must be an object");
        for (const auto& [id, s] : it->items()) add(parse_server(id, s, true));
    }
    return out;
}

std::vector<ServerConfig> load_server_configs(const fs::path& path) {
    return parse_server_configs(parse_file(path));
}

// ---------- Application config ----------

AppConfig parse_config(const nlohmann::json& doc, const fs::path& base_dir) {
    if (!doc.is_object()) throw ConfigError("Configuration must be a JSON object");

    AppConfig c;
    c.host = get_as<std::string>(doc, "host", c.host);
    c.port = get_as<int>(doc, "port", c.port);
    if (c.port <= 0 || c.port > 65535) throw ConfigError("'port' out of range");
    c.log_level = get_as<std::string>(doc, "log_level", c.log_level);

    if (auto it = doc.find("anthropic"); it != doc.end() && it->is_object()) {
        const auto& a = *it;
        c.anthropic.api_key = get_as<std::string>(a, "api_key", c.anthropic.api_key);
        c.anthropic.base_url = get_as<std::string>(a, "base_url", c.anthropic.base_url);
        c.anthropic.api_version = get_as<std::string>(a, "api_version", c.anthropic.api_version);
        c.anthropic.model = get_as<std::string>(a, "model", c.anthropic.model);
        c.anthropic.max_tokens = get_as<int>(a, "max_tokens", c.anthropic.max_tokens);
        if (c.anthropic.max_tokens <= 0) throw ConfigError("'anthropic.max_tokens' must be positive");
    }

    if (auto it = doc.find("models"); it != doc.end() && it->is_array()) {
        c.models.clear();
        for (const auto& m : *it) {
            if (!m.is_object()) throw ConfigError("'models' entries must be objects");
            ModelInfo info{get_as<std::string>(m, "id", ""), get_as<std::string>(m, "name", ""),
                           get_as<std::string>(m, "description", "")};
            if (info.id.empty()) throw ConfigError("Model entry without an id");
            if (info.name.empty()) info.name = info.id;
            c.models.push_back(std::move(info));
        }
    }

    c.max_tool_rounds = get_as<int>(doc, "max_tool_rounds", c.max_tool_rounds);
    if (c.max_tool_rounds < 0) throw ConfigError("'max_tool_rounds' must not be negative");
    c.parallel_tool_calls = get_as<bool>(doc, "parallel_tool_calls", c.parallel_tool_calls);
    c.builtin_tool_timeout = get_ms(doc, "builtin_tool_timeout_ms", c.builtin_tool_timeout);
    c.server_call_timeout = get_ms(doc, "server_call_timeout_ms", c.server_call_timeout);
    c.handshake_timeout = get_ms(doc, "handshake_timeout_ms", c.handshake_timeout);
    c.shutdown_grace = get_ms(doc, "shutdown_grace_ms", c.shutdown_grace);
    c.stream_buffer = get_as<std::size_t>(doc, "stream_buffer", c.stream_buffer);
    if (c.stream_buffer == 0) throw ConfigError("'stream_buffer' must be positive");
    c.autoconnect = get_as<bool>(doc, "autoconnect", c.autoconnect);

    if (auto f = get_as<std::string>(doc, "servers_file", ""); !f.empty()) {
        c.servers_file = resolve(base_dir, f);
    }
    auto interval = get_as<long long>(doc, "reload_interval_s", c.reload_interval.count());
    if (interval <= 0) throw ConfigError("'reload_interval_s' must be positive");
    c.reload_interval = std::chrono::seconds(interval);
    if (auto f = get_as<std::string>(doc, "project_data", ""); !f.empty()) {
        c.project_data = resolve(base_dir, f);
    }

    c.servers = parse_server_configs(doc);
    return c;
}

AppConfig load_config(const fs::path& path) {
    return parse_config(parse_file(path), path.parent_path());
}

void apply_env_overrides(AppConfig& config) {
    if (const char* v = std::getenv("ANTHROPIC_API_KEY"); v && *v) config.anthropic.api_key = v;
    if (const char* v = std::getenv("ANTHROPIC_BASE_URL"); v && *v) config.anthropic.base_url = v;
    if (const char* v = std::getenv("FOUNDRY_HOST"); v && *v) config.host = v;
    if (const char* v = std::getenv("FOUNDRY_PORT"); v && *v) {
        char* end = nullptr;
        long port = std::strtol(v, &end, 10);
        if (*end != '\0' || port <= 0 || port > 65535) {
            throw ConfigError(std::string("Invalid FOUNDRY_PORT: ") + v);
        }
        config.port = static_cast<int>(port);
    }
    if (const char* v = std::getenv("FOUNDRY_LOG_LEVEL"); v && *v) config.log_level = v;
}

// ---------- ConfigWatcher ----------

ConfigWatcher::ConfigWatcher(fs::path path, std::chrono::milliseconds interval, Callback on_change)
    : path_(std::move(path)), interval_(interval), on_change_(std::move(on_change)) {}

ConfigWatcher::~ConfigWatcher() {
    stop();
}

ConfigWatcher::Stamp ConfigWatcher::stamp() const {
    Stamp s;
    std::error_code ec;
    auto mtime = fs::last_write_time(path_, ec);
    if (ec) return s;
    auto size = fs::file_size(path_, ec);
    if (ec) return s;
    s.mtime = mtime;
    s.size = size;
    s.exists = true;
    return s;
}

bool ConfigWatcher::poll() {
    Stamp now = stamp();
    if (last_ && *last_ == now) return false;
    last_ = now;
    if (!now.exists) {
        spdlog::warn("server config {} is missing; keeping current servers", path_.string());
        return false;
    }
    std::vector<ServerConfig> configs;
    try {
        configs = load_server_configs(path_);
    } catch (const ConfigError& e) {
        spdlog::error("ignoring server config change: {}", e.what());
        return false;
    }
    spdlog::info("server config {} loaded ({} server(s))", path_.string(), configs.size());
    on_change_(configs);
    return true;
}

void ConfigWatcher::start() {
    if (running_.exchange(true)) return;
    stop_requested_ = false;
    thread_ = std::thread([this] { watch_loop(); });
}

void ConfigWatcher::stop() {
    if (!running_.load()) return;
    stop_requested_ = true;
    if (thread_.joinable()) thread_.join();
    running_ = false;
}

void ConfigWatcher::watch_loop() {
    using namespace std::chrono_literals;
    while (!stop_requested_) {
        auto waited = std::chrono::milliseconds(0);
        while (!stop_requested_ && waited < interval_) {
            std::this_thread::sleep_for(100ms);
            waited += 100ms;
        }
        if (stop_requested_) break;
        try {
            poll();
        } catch (const FoundryError& e) {
            spdlog::error("server config reload failed: {}", e.what());
        }
    }
}

} // namespace foundry
