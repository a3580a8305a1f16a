#include "foundry/tool_router.hpp"
#include "foundry/error.hpp"
#include "foundry/logging.hpp"
#include "foundry/schema.hpp"
#include <atomic>
#include <memory>
#include <set>

namespace foundry {

namespace {

ToolInvocationResult normalize(const CallToolResult& r) {
    std::string text = r.joined_text();
    if (r.is_error) {
        return ToolInvocationResult::failure(ToolErrorKind::Execution,
                                             text.empty() ? "Tool reported an error" : text);
    }
    if (r.structured_content) return ToolInvocationResult::success(*r.structured_content);
    return ToolInvocationResult::success(std::move(text));
}

} // anonymous namespace

ToolRouter::ToolRouter(const ToolRegistry& registry, ServerManager& servers, Options opts)
    : registry_(registry),
      servers_(servers),
      opts_(opts),
      handlers_(opts.builtin_workers),
      builtin_lane_(opts.builtin_workers) {}

std::vector<ToolDescriptor> ToolRouter::catalog() const {
    std::vector<ToolDescriptor> out = registry_.descriptors();
    std::set<std::string> seen;
    for (const auto& d : out) seen.insert(d.name);
    for (auto& d : servers_.list_tools()) {
        if (!seen.insert(d.name).second) {
            spdlog::warn("Duplicate tool name '{}' from server '{}' skipped", d.name, d.server_id);
            continue;
        }
        out.push_back(std::move(d));
    }
    return out;
}

ToolRouter::Target ToolRouter::resolve(const std::string& name) const {
    if (const auto* entry = registry_.find(name)) return BuiltinTarget{entry};

    auto parts = split_tool_name(name);
    if (!parts) return Unavailable{"Unknown tool: " + name};

    const auto& [server_id, tool] = *parts;
    auto status = servers_.status(server_id);
    if (!status) return Unavailable{"Unknown tool server '" + server_id + "' for tool " + name};
    if (status->status != ConnectionStatus::Connected) {
        return Unavailable{"Tool server '" + server_id + "' is " + to_string(status->status)};
    }
    for (const auto& d : status->tools) {
        if (d.remote_name == tool) return RemoteTarget{server_id, tool, d.input_schema};
    }
    return Unavailable{"Tool server '" + server_id + "' has no tool named '" + tool + "'"};
}

ToolInvocationResult ToolRouter::invoke(const std::string& name, const nlohmann::json& args) {
    const nlohmann::json& input = args.is_null() ? nlohmann::json::object() : args;
    spdlog::debug("tool call {} {}", name, summarize_for_log(input));

    Target target = resolve(name);
    if (auto* u = std::get_if<Unavailable>(&target)) {
        spdlog::info("tool {} unavailable: {}", name, u->reason);
        return ToolInvocationResult::failure(ToolErrorKind::Unavailable, u->reason);
    }

    const nlohmann::json& schema = std::holds_alternative<BuiltinTarget>(target)
        ? std::get<BuiltinTarget>(target).entry->descriptor.input_schema
        : std::get<RemoteTarget>(target).input_schema;
    if (auto err = validate_arguments(schema, input)) {
        spdlog::info("tool {} rejected arguments: {}", name, *err);
        return ToolInvocationResult::failure(ToolErrorKind::InvalidArgs, "Invalid arguments: " + *err);
    }

    if (auto* b = std::get_if<BuiltinTarget>(&target)) return run_builtin(name, *b->entry, input);
    return run_remote(name, std::get<RemoteTarget>(target), input);
}

std::future<ToolInvocationResult> ToolRouter::invoke_async(std::string name, nlohmann::json args) {
    WorkerPool& lane = lane_for(name);
    return lane.submit([this, name = std::move(name), args = std::move(args)] {
        return invoke(name, args);
    });
}

WorkerPool& ToolRouter::lane_for(const std::string& name) {
    if (registry_.find(name)) return builtin_lane_;
    auto parts = split_tool_name(name);
    // Names that cannot reach a declared server fail fast in invoke(); they
    // never get a lane of their own.
    if (!parts || !servers_.status(parts->first)) return builtin_lane_;

    std::lock_guard<std::mutex> lock(lanes_mutex_);
    auto& lane = server_lanes_[parts->first];
    if (!lane) lane = std::make_unique<WorkerPool>(opts_.workers_per_server);
    return *lane;
}

ToolInvocationResult ToolRouter::run_builtin(const std::string& name, const ToolRegistry::Entry& entry,
                                             const nlohmann::json& args) {
    struct Call {
        std::promise<ToolInvocationResult> promise;
        std::atomic<bool> abandoned{false};
    };
    auto call = std::make_shared<Call>();
    auto fut = call->promise.get_future();
    BuiltinHandler handler = entry.handler;
    handlers_.post([call, handler, args, name] {
        if (call->abandoned) return;  // timed out while queued
        try {
            call->promise.set_value(ToolInvocationResult::success(handler(args)));
        } catch (const std::exception& e) {
            spdlog::warn("built-in tool {} failed: {}", name, e.what());
            call->promise.set_value(ToolInvocationResult::failure(ToolErrorKind::Execution, e.what()));
        } catch (...) {
            spdlog::warn("built-in tool {} failed with a non-standard exception", name);
            call->promise.set_value(
                ToolInvocationResult::failure(ToolErrorKind::Execution, "Tool " + name + " failed"));
        }
    });

    if (fut.wait_for(opts_.builtin_timeout) == std::future_status::timeout) {
        call->abandoned = true;
        spdlog::warn("built-in tool {} timed out after {} ms", name, opts_.builtin_timeout.count());
        return ToolInvocationResult::failure(
            ToolErrorKind::Timeout,
            "Tool " + name + " timed out after " + std::to_string(opts_.builtin_timeout.count()) + " ms");
    }
    return fut.get();
}

ToolInvocationResult ToolRouter::run_remote(const std::string& name, const RemoteTarget& target,
                                            const nlohmann::json& args) {
    try {
        return normalize(servers_.invoke(target.server_id, target.tool, args, opts_.server_timeout));
    } catch (const TimeoutError& e) {
        spdlog::warn("tool {} timed out: {}", name, e.what());
        return ToolInvocationResult::failure(ToolErrorKind::Timeout, e.what());
    } catch (const UnknownServerError& e) {
        return ToolInvocationResult::failure(ToolErrorKind::Unavailable, e.what());
    } catch (const ProtocolError& e) {
        if (e.code == error::InvalidParams) {
            return ToolInvocationResult::failure(ToolErrorKind::InvalidArgs, e.what());
        }
        if (e.code == error::MethodNotFound) {
            return ToolInvocationResult::failure(ToolErrorKind::Unavailable, e.what());
        }
        return ToolInvocationResult::failure(ToolErrorKind::Execution,
                                             "MCP tool execution failed: " + std::string(e.what()));
    } catch (const FoundryError& e) {
        spdlog::warn("tool {} failed: {}", name, e.what());
        return ToolInvocationResult::failure(ToolErrorKind::Execution,
                                             "MCP tool execution failed: " + std::string(e.what()));
    }
}

} // namespace foundry
