#pragma once
#include "server_manager.hpp"
#include "tool_registry.hpp"
#include "types.hpp"
#include "worker_pool.hpp"
#include <chrono>
#include <future>
#include <map>
#include <memory>
#include <mutex>
#include <string>
#include <variant>
#include <vector>

namespace foundry {

/// Single entry point for tool execution. Every outcome, including unknown
/// tools, bad arguments, timeouts and exceptions, comes back as a
/// ToolInvocationResult; nothing is thrown at the caller.
///
/// Asynchronous calls run in lanes: one pool for built-ins and one per tool
/// server, so a server that stops answering only queues its own callers.
/// Built-in handlers execute on a separate bounded pool; a handler that
/// outlives its timeout keeps its worker until it returns.
class ToolRouter {
public:
    struct Options {
        std::chrono::milliseconds builtin_timeout{30000};
        std::chrono::milliseconds server_timeout{60000};
        std::size_t builtin_workers = 8;
        std::size_t workers_per_server = 4;
    };

    ToolRouter(const ToolRegistry& registry, ServerManager& servers, Options opts);

    /// Built-ins followed by the tools of every connected server. Names are
    /// unique; a later duplicate is dropped with a warning.
    [[nodiscard]] std::vector<ToolDescriptor> catalog() const;

    [[nodiscard]] ToolInvocationResult invoke(const std::string& name, const nlohmann::json& args);

    /// invoke() on the lane of the tool's origin.
    [[nodiscard]] std::future<ToolInvocationResult> invoke_async(std::string name, nlohmann::json args);

private:
    struct BuiltinTarget {
        const ToolRegistry::Entry* entry;
    };
    struct RemoteTarget {
        std::string server_id;
        std::string tool;
        nlohmann::json input_schema;
    };
    struct Unavailable {
        std::string reason;
    };
    using Target = std::variant<BuiltinTarget, RemoteTarget, Unavailable>;

    [[nodiscard]] Target resolve(const std::string& name) const;
    WorkerPool& lane_for(const std::string& name);
    ToolInvocationResult run_builtin(const std::string& name, const ToolRegistry::Entry& entry,
                                     const nlohmann::json& args);
    ToolInvocationResult run_remote(const std::string& name, const RemoteTarget& target,
                                    const nlohmann::json& args);

    const ToolRegistry& registry_;
    ServerManager& servers_;
    Options opts_;

    // Destroyed in reverse: server lanes, then the built-in lane, then the
    // handler pool the built-in lane waits on.
    WorkerPool handlers_;
    WorkerPool builtin_lane_;
    std::mutex lanes_mutex_;
    std::map<std::string, std::unique_ptr<WorkerPool>> server_lanes_;
};

} // namespace foundry
