/// Scriptable tool server for the integration tests. Speaks newline-delimited
/// JSON-RPC on stdin/stdout; behaviour is chosen with flags:
///
///   --name <s>          server name, prefixed to echo output
///   --page-size <n>     split tools/list into pages of n tools
///   --delay-ms <n>      wait before answering every tools/call
///   --crash-after <n>   exit(3) when the n-th tools/call arrives
///   --ignore-term       ignore SIGTERM and stay alive after stdin closes
///   --bad-frame         answer initialize with a line that is not JSON
///   --fail-handshake    answer initialize with a JSON-RPC error
///   --exit-on-start     print a fatal message to stderr and exit(1)
///   --no-tools          advertise no tools capability
///   --spawn-sleeper     fork a child that keeps stdio open for 30s

#include <foundry/transport/stdio_transport.hpp>
#include <foundry/version.hpp>
#include <atomic>
#include <chrono>
#include <csignal>
#include <cstdlib>
#include <iostream>
#include <string>
#include <thread>
#include <unistd.h>

using namespace foundry;

namespace {

struct Flags {
    std::string name = "fake";
    std::size_t page_size = 0;
    int delay_ms = 0;
    int crash_after = 0;
    bool ignore_term = false;
    bool bad_frame = false;
    bool fail_handshake = false;
    bool exit_on_start = false;
    bool no_tools = false;
    bool spawn_sleeper = false;
};

nlohmann::json object_schema(nlohmann::json properties, nlohmann::json required) {
    return {{"type", "object"}, {"properties", std::move(properties)}, {"required", std::move(required)}};
}

nlohmann::json tool_list() {
    return nlohmann::json::array({
        {{"name", "echo"}, {"description", "Echo text back"},
         {"inputSchema", object_schema({{"text", {{"type", "string"}}}}, {"text"})}},
        {{"name", "add"}, {"description", "Add two integers"},
         {"inputSchema", object_schema({{"a", {{"type", "integer"}}}, {"b", {{"type", "integer"}}}},
                                       {"a", "b"})}},
        {{"name", "slow"}, {"description", "Sleep, then answer"},
         {"inputSchema", object_schema({{"ms", {{"type", "integer"}, {"minimum", 0}}}}, {"ms"})}},
        {{"name", "fail"}, {"description", "Always reports a tool error"},
         {"inputSchema", {{"type", "object"}}}},
        {{"name", "boom"}, {"description", "Always answers with a JSON-RPC error"},
         {"inputSchema", {{"type", "object"}}}},
    });
}

nlohmann::json text_result(const std::string& text, bool is_error = false) {
    return {{"content", nlohmann::json::array({{{"type", "text"}, {"text", text}}})},
            {"isError", is_error}};
}

JsonRpcResponse call_tool(const Flags& flags, const JsonRpcRequest& req) {
    const auto params = req.params.value_or(nlohmann::json::object());
    const std::string tool = params.value("name", "");
    const auto args = params.value("arguments", nlohmann::json::object());

    if (flags.delay_ms > 0) std::this_thread::sleep_for(std::chrono::milliseconds(flags.delay_ms));

    if (tool == "echo") {
        return make_result(req.id, text_result(flags.name + ": " + args.value("text", "")));
    }
    if (tool == "add") {
        if (!args.contains("a") || !args.contains("b")) {
            return make_error(req.id, error::InvalidParams, "a and b are required");
        }
        auto sum = args["a"].get<long long>() + args["b"].get<long long>();
        auto r = text_result(std::to_string(sum));
        r["structuredContent"] = {{"sum", sum}};
        return make_result(req.id, r);
    }
    if (tool == "slow") {
        std::this_thread::sleep_for(std::chrono::milliseconds(args.value("ms", 0)));
        return make_result(req.id, text_result(flags.name + ": done"));
    }
    if (tool == "fail") {
        return make_result(req.id, text_result("something went wrong", true));
    }
    if (tool == "boom") {
        return make_error(req.id, error::InternalError, "boom");
    }
    return make_error(req.id, error::MethodNotFound, "Unknown tool: " + tool);
}

JsonRpcResponse list_tools(const Flags& flags, const JsonRpcRequest& req) {
    auto all = tool_list();
    if (flags.page_size == 0) return make_result(req.id, {{"tools", all}});

    std::size_t start = 0;
    if (req.params && req.params->contains("cursor")) {
        start = std::stoul((*req.params)["cursor"].get<std::string>());
    }
    nlohmann::json page = nlohmann::json::array();
    for (std::size_t i = start; i < all.size() && i < start + flags.page_size; ++i) page.push_back(all[i]);
    nlohmann::json result = {{"tools", page}};
    if (start + flags.page_size < all.size()) result["nextCursor"] = std::to_string(start + flags.page_size);
    return make_result(req.id, result);
}

} // namespace

int main(int argc, char* argv[]) {
    Flags flags;
    for (int i = 1; i < argc; ++i) {
        std::string arg = argv[i];
        auto next = [&]() -> std::string { return i + 1 < argc ? argv[++i] : ""; };
        if (arg == "--name") flags.name = next();
        else if (arg == "--page-size") flags.page_size = std::stoul(next());
        else if (arg == "--delay-ms") flags.delay_ms = std::stoi(next());
        else if (arg == "--crash-after") flags.crash_after = std::stoi(next());
        else if (arg == "--ignore-term") flags.ignore_term = true;
        else if (arg == "--bad-frame") flags.bad_frame = true;
        else if (arg == "--fail-handshake") flags.fail_handshake = true;
        else if (arg == "--exit-on-start") flags.exit_on_start = true;
        else if (arg == "--no-tools") flags.no_tools = true;
        else if (arg == "--spawn-sleeper") flags.spawn_sleeper = true;
        else {
            std::cerr << "unknown flag " << arg << std::endl;
            return 2;
        }
    }

    if (flags.exit_on_start) {
        std::cerr << "fatal: cannot open tool database" << std::endl;
        return 1;
    }
    if (flags.spawn_sleeper && ::fork() == 0) {
        // Inherits stdout and stderr and outlives its parent unless killed.
        std::this_thread::sleep_for(std::chrono::seconds(30));
        std::_Exit(0);
    }
    if (flags.ignore_term) std::signal(SIGTERM, SIG_IGN);
    std::cerr << flags.name << " starting" << std::endl;

    StdioTransport transport;
    std::atomic<int> calls{0};

    transport.start([&](JsonRpcMessage msg) {
        auto* req = std::get_if<JsonRpcRequest>(&msg);
        if (!req) return;

        if (req->method == "initialize") {
            if (flags.bad_frame) {
                const char garbage[] = "this is not json\n";
                ssize_t n = ::write(STDOUT_FILENO, garbage, sizeof(garbage) - 1);
                (void)n;
                return;
            }
            if (flags.fail_handshake) {
                transport.send(make_error(req->id, error::InternalError, "handshake refused"));
                return;
            }
            nlohmann::json caps = nlohmann::json::object();
            if (!flags.no_tools) caps["tools"] = nlohmann::json::object();
            transport.send(make_result(req->id, {
                {"protocolVersion", TOOL_PROTOCOL_VERSION},
                {"capabilities", caps},
                {"serverInfo", {{"name", flags.name}, {"version", "1.0.0"}}},
            }));
        } else if (req->method == "tools/list") {
            transport.send(list_tools(flags, *req));
        } else if (req->method == "tools/call") {
            if (flags.crash_after > 0 && ++calls >= flags.crash_after) {
                std::cerr << "crashing on purpose" << std::endl;
                std::_Exit(3);
            }
            // Answer on a separate thread so slow calls overlap.
            std::thread([&transport, &flags, r = *req] {
                auto resp = call_tool(flags, r);
                try {
                    transport.send(resp);
                } catch (const TransportError&) {
                    // Peer already gone.
                }
            }).detach();
        } else if (req->method == "ping") {
            transport.send(make_result(req->id, nlohmann::json::object()));
        } else {
            transport.send(make_error(req->id, error::MethodNotFound, "Method not found: " + req->method));
        }
    });

    if (flags.ignore_term) {
        for (;;) std::this_thread::sleep_for(std::chrono::seconds(1));
    }
    // Detached call threads may still hold references; leave without unwinding.
    std::_Exit(0);
}
