#include "foundry/server_connection.hpp"
#include "foundry/error.hpp"
#include "foundry/version.hpp"
#include "foundry/transport/stdio_transport.hpp"
#include "foundry/transport/subprocess.hpp"

#include <atomic>
#include <future>
#include <mutex>
#include <thread>
#include <unordered_map>
#include <spdlog/spdlog.h>

namespace foundry {

struct ServerConnection::Impl {
    std::string server_id;
    Options opts;

    std::unique_ptr<Subprocess> process;
    std::unique_ptr<ITransport> transport;
    std::thread reader_thread;
    std::atomic<bool> open{false};
    std::atomic<bool> closing{false};
    std::mutex lifecycle_mutex;

    mutable std::mutex pending_mutex;
    std::unordered_map<std::string, std::promise<JsonRpcResponse>> pending;
    int64_t next_id{1};

    std::mutex error_mutex;
    std::string framing_error;

    ClosedCallback closed_cb;

    Impl(std::string id, Options o) : server_id(std::move(id)), opts(std::move(o)) {}

    void on_message(JsonRpcMessage msg) {
        if (auto* resp = std::get_if<JsonRpcResponse>(&msg)) {
            std::lock_guard<std::mutex> lock(pending_mutex);
            auto it = pending.find(request_key(resp->id));
            if (it == pending.end()) {
                // Late answer to a request we already gave up on.
                spdlog::debug("[{}] dropping late {}", server_id, describe(msg));
                return;
            }
            it->second.set_value(std::move(*resp));
            pending.erase(it);
            return;
        }

        if (auto* req = std::get_if<JsonRpcRequest>(&msg)) {
            // The only server->client request we answer is ping.
            JsonRpcMessage reply = req->method == "ping"
                ? JsonRpcMessage{make_result(req->id, nlohmann::json::object())}
                : JsonRpcMessage{make_error(req->id, error::MethodNotFound,
                                            "Method not supported by client: " + req->method)};
            try {
                transport->send(reply);
            } catch (const TransportError& e) {
                spdlog::debug("[{}] could not answer {}: {}", server_id, req->method, e.what());
            }
            return;
        }

        const auto& notif = std::get<JsonRpcNotification>(msg);
        if (notif.method == "notifications/message" && notif.params) {
            spdlog::debug("[{}] {}", server_id, notif.params->value("data", nlohmann::json()).dump());
        } else if (notif.method == "notifications/tools/list_changed") {
            spdlog::info("[{}] server reports a changed tool list; reconnect to refresh", server_id);
        }
    }

    void on_error(std::exception_ptr ep) {
        try {
            std::rethrow_exception(ep);
        } catch (const ParseError& e) {
            spdlog::error("[{}] protocol framing error: {}", server_id, e.what());
            {
                std::lock_guard<std::mutex> lock(error_mutex);
                if (framing_error.empty()) framing_error = std::string("Protocol framing error: ") + e.what();
            }
            // The stream can no longer be trusted; end the session.
            transport->shutdown();
        } catch (const std::exception& e) {
            spdlog::error("[{}] transport error: {}", server_id, e.what());
        }
    }

    void fail_all_pending(const std::string& reason) {
        std::lock_guard<std::mutex> lock(pending_mutex);
        for (auto& [key, promise] : pending) {
            promise.set_exception(std::make_exception_ptr(TransportError(reason)));
        }
        pending.clear();
    }

    std::string end_reason() {
        {
            std::lock_guard<std::mutex> lock(error_mutex);
            if (!framing_error.empty()) return framing_error;
        }
        if (!process) return "Connection to server '" + server_id + "' closed";

        if (process->wait_for_exit(std::chrono::milliseconds(200))) {
            process->wait_stderr_closed(std::chrono::milliseconds(200));
        }
        std::string reason = "Server process " + process->describe_exit();
        std::string tail = process->stderr_tail();
        while (!tail.empty() && (tail.back() == '\n' || tail.back() == '\r')) tail.pop_back();
        if (!tail.empty()) reason += ": " + tail;
        return reason;
    }

    void start_reader() {
        open = true;
        reader_thread = std::thread([this] {
            transport->start(
                [this](JsonRpcMessage msg) { on_message(std::move(msg)); },
                [this](std::exception_ptr ep) { on_error(std::move(ep)); });
            open = false;

            if (closing) {
                fail_all_pending("Connection to server '" + server_id + "' closed");
                return;
            }
            std::string reason = end_reason();
            spdlog::warn("[{}] session ended: {}", server_id, reason);
            fail_all_pending(reason);
            if (closed_cb) closed_cb(reason);
        });
    }

    JsonRpcResponse send_request(const std::string& method, nlohmann::json params,
                                 std::chrono::milliseconds timeout) {
        if (!open) {
            throw TransportError("Not connected to server '" + server_id + "'");
        }

        int64_t id;
        std::future<JsonRpcResponse> fut;
        {
            std::lock_guard<std::mutex> lock(pending_mutex);
            if (pending.size() >= opts.max_in_flight) {
                throw TransportError("Too many requests in flight to server '" + server_id + "'");
            }
            id = next_id++;
            fut = pending[std::to_string(id)].get_future();
        }

        JsonRpcRequest req;
        req.id = RequestId{id};
        req.method = method;
        req.params = std::move(params);
        try {
            transport->send(req);
        } catch (const TransportError&) {
            std::lock_guard<std::mutex> lock(pending_mutex);
            pending.erase(std::to_string(id));
            throw;
        }

        if (fut.wait_for(timeout) == std::future_status::timeout) {
            {
                std::lock_guard<std::mutex> lock(pending_mutex);
                pending.erase(std::to_string(id));
            }
            cancel_remote(id, "timeout");
            throw TimeoutError(method + " on server '" + server_id + "' timed out after "
                               + std::to_string(timeout.count()) + " ms");
        }
        return fut.get();
    }

    void cancel_remote(int64_t id, const std::string& reason) {
        try {
            transport->send(make_notification("notifications/cancelled",
                                              nlohmann::json{{"requestId", id}, {"reason", reason}}));
        } catch (const TransportError& e) {
            spdlog::debug("[{}] cancel for request {} not sent: {}", server_id, id, e.what());
        }
    }

    static const nlohmann::json& result_of(const JsonRpcResponse& resp) {
        if (resp.error) throw ProtocolError(resp.error->code, resp.error->message);
        if (!resp.result) throw ProtocolError(error::InternalError, "Response without result");
        return *resp.result;
    }
};

ServerConnection::ServerConnection(std::string server_id, Options opts)
    : impl_(std::make_unique<Impl>(std::move(server_id), std::move(opts))) {}

ServerConnection::~ServerConnection() {
    close();
}

void ServerConnection::on_closed(ClosedCallback callback) {
    impl_->closed_cb = std::move(callback);
}

void ServerConnection::launch(const ServerConfig& config) {
    std::lock_guard<std::mutex> lock(impl_->lifecycle_mutex);
    if (impl_->transport) throw TransportError("Connection already started");

    Subprocess::Options popts;
    popts.command = config.command;
    popts.args = config.args;
    popts.env = config.env;
    popts.log_name = impl_->server_id;
    impl_->process = Subprocess::spawn(popts);

    auto [read_fd, write_fd] = impl_->process->release_stdio();
    impl_->transport = std::make_unique<StdioTransport>(read_fd, write_fd);
    impl_->start_reader();
}

void ServerConnection::attach(std::unique_ptr<ITransport> transport) {
    std::lock_guard<std::mutex> lock(impl_->lifecycle_mutex);
    if (impl_->transport) throw TransportError("Connection already started");
    impl_->transport = std::move(transport);
    impl_->start_reader();
}

void ServerConnection::close() {
    std::lock_guard<std::mutex> lock(impl_->lifecycle_mutex);
    if (impl_->closing.exchange(true)) return;
    if (!impl_->transport) return;

    // Drains queued writes, then closes the child's stdin.
    impl_->transport->shutdown();
    if (impl_->process) {
        if (!impl_->process->terminate(impl_->opts.shutdown_grace)) {
            spdlog::warn("[{}] server ignored shutdown and was killed", impl_->server_id);
        }
    }
    if (impl_->reader_thread.joinable()) {
        if (impl_->reader_thread.get_id() == std::this_thread::get_id()) {
            impl_->reader_thread.detach();
        } else {
            impl_->reader_thread.join();
        }
    }
    impl_->open = false;
    impl_->fail_all_pending("Connection to server '" + impl_->server_id + "' closed");
}

InitializeResult ServerConnection::initialize() {
    nlohmann::json params = {
        {"protocolVersion", std::string(TOOL_PROTOCOL_VERSION)},
        {"clientInfo", impl_->opts.client_info},
        {"capabilities", nlohmann::json::object()}
    };
    auto resp = impl_->send_request("initialize", params, impl_->opts.handshake_timeout);

    InitializeResult result;
    try {
        from_json(Impl::result_of(resp), result);
    } catch (const nlohmann::json::exception& e) {
        throw ServerProcessError(std::string("Malformed initialize result: ") + e.what());
    }

    impl_->transport->send(make_notification("notifications/initialized"));
    spdlog::info("[{}] initialized {} {} (protocol {})", impl_->server_id,
                 result.server_info.name, result.server_info.version, result.protocol_version);
    return result;
}

Page<ToolDefinition> ServerConnection::list_tools(const std::optional<std::string>& cursor) {
    nlohmann::json params = nlohmann::json::object();
    if (cursor) params["cursor"] = *cursor;

    auto resp = impl_->send_request("tools/list", params, impl_->opts.handshake_timeout);
    const auto& result = Impl::result_of(resp);

    Page<ToolDefinition> page;
    try {
        page.items = result.at("tools").get<std::vector<ToolDefinition>>();
        if (result.contains("nextCursor") && result.at("nextCursor").is_string()) {
            page.next_cursor = result.at("nextCursor").get<std::string>();
        }
    } catch (const nlohmann::json::exception& e) {
        throw ServerProcessError(std::string("Malformed tools/list result: ") + e.what());
    }
    return page;
}

std::vector<ToolDefinition> ServerConnection::list_all_tools() {
    std::vector<ToolDefinition> tools;
    std::optional<std::string> cursor;
    for (std::size_t i = 0; i < impl_->opts.max_catalog_pages; ++i) {
        auto page = list_tools(cursor);
        for (auto& t : page.items) tools.push_back(std::move(t));
        if (!page.next_cursor || page.next_cursor->empty()) return tools;
        cursor = std::move(page.next_cursor);
    }
    spdlog::warn("[{}] tool catalog truncated after {} pages", impl_->server_id,
                 impl_->opts.max_catalog_pages);
    return tools;
}

CallToolResult ServerConnection::call_tool(const std::string& name, const nlohmann::json& arguments,
                                           std::chrono::milliseconds timeout) {
    nlohmann::json params = {{"name", name}, {"arguments", arguments}};
    auto resp = impl_->send_request("tools/call", params, timeout);
    const auto& result = Impl::result_of(resp);

    CallToolResult out;
    try {
        from_json(result, out);
    } catch (const std::exception& e) {
        throw ProtocolError(error::InternalError, std::string("Malformed tools/call result: ") + e.what());
    }
    return out;
}

bool ServerConnection::is_open() const noexcept {
    return impl_->open;
}

std::size_t ServerConnection::in_flight() const {
    std::lock_guard<std::mutex> lock(impl_->pending_mutex);
    return impl_->pending.size();
}

const std::string& ServerConnection::server_id() const noexcept {
    return impl_->server_id;
}

std::string ServerConnection::stderr_tail() const {
    if (!impl_->process) return std::string();
    if (!impl_->process->running()) impl_->process->wait_stderr_closed(std::chrono::milliseconds(200));
    return impl_->process->stderr_tail();
}

} // namespace foundry
