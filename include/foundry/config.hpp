#pragma once
#include "types.hpp"
#include <atomic>
#include <chrono>
#include <filesystem>
#include <functional>
#include <optional>
#include <string>
#include <thread>
#include <vector>

namespace foundry {

struct ModelInfo {
    std::string id;
    std::string name;
    std::string description;
};

void to_json(nlohmann::json& j, const ModelInfo& m);

struct AnthropicConfig {
    std::string api_key;
    std::string base_url = "https://api.anthropic.com";
    std::string api_version = "2023-06-01";
    std::string model = "claude-opus-4-6";
    int max_tokens = 4096;
};

struct AppConfig {
    std::string host = "127.0.0.1";
    int port = 8000;
    std::string log_level = "info";
    AnthropicConfig anthropic;
    std::vector<ModelInfo> models = default_models();

    int max_tool_rounds = 25;
    bool parallel_tool_calls = false;
    std::chrono::milliseconds builtin_tool_timeout{30000};
    std::chrono::milliseconds server_call_timeout{60000};
    std::chrono::milliseconds handshake_timeout{15000};
    std::chrono::milliseconds shutdown_grace{3000};
    std::size_t stream_buffer = 256;
    bool autoconnect = false;

    std::optional<std::filesystem::path> servers_file;
    std::chrono::seconds reload_interval{2};
    std::optional<std::filesystem::path> project_data;
    std::vector<ServerConfig> servers;

    [[nodiscard]] static std::vector<ModelInfo> default_models();
};

/// Parse a configuration document. Relative paths are resolved against
/// `base_dir`. Throws ConfigError on wrong types or bad values.
[[nodiscard]] AppConfig parse_config(const nlohmann::json& doc,
                                     const std::filesystem::path& base_dir = {});

/// Read and parse a configuration file. Throws ConfigError.
[[nodiscard]] AppConfig load_config(const std::filesystem::path& path);

/// ANTHROPIC_API_KEY, ANTHROPIC_BASE_URL, FOUNDRY_HOST, FOUNDRY_PORT,
/// FOUNDRY_LOG_LEVEL.
void apply_env_overrides(AppConfig& config);

/// Accepts {"servers": [{"id", "command", "args", "env", "enabled"}]} or
/// {"mcpServers": {"<id>": {"command", "args", "env", "disabled"}}}.
/// Throws ConfigError.
[[nodiscard]] std::vector<ServerConfig> parse_server_configs(const nlohmann::json& doc);

[[nodiscard]] std::vector<ServerConfig> load_server_configs(const std::filesystem::path& path);

/// Polls a server declaration file and reports every successfully parsed
/// change. A file that fails to parse is logged and skipped; the previous
/// declarations stay in effect.
class ConfigWatcher {
public:
    using Callback = std::function<void(const std::vector<ServerConfig>&)>;

    ConfigWatcher(std::filesystem::path path, std::chrono::milliseconds interval, Callback on_change);
    ~ConfigWatcher();

    ConfigWatcher(const ConfigWatcher&) = delete;
    ConfigWatcher& operator=(const ConfigWatcher&) = delete;

    void start();
    void stop();

    /// Check once on the calling thread. Returns true if the callback ran.
    bool poll();

    [[nodiscard]] bool running() const noexcept { return running_.load(); }

private:
    struct Stamp {
        std::filesystem::file_time_type mtime{};
        std::uintmax_t size = 0;
        bool exists = false;

        bool operator==(const Stamp& o) const {
            return exists == o.exists && mtime == o.mtime && size == o.size;
        }
        bool operator!=(const Stamp& o) const { return !(*this == o); }
    };

    Stamp stamp() const;
    void watch_loop();

    std::filesystem::path path_;
    std::chrono::milliseconds interval_;
    Callback on_change_;
    std::optional<Stamp> last_;
    std::thread thread_;
    std::atomic<bool> running_{false};
    std::atomic<bool> stop_requested_{false};
};

} // namespace foundry
