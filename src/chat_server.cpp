#include "foundry/chat_server.hpp"
#include "foundry/channel.hpp"
#include "foundry/codec.hpp"
#include "foundry/error.hpp"
#include "foundry/stream_encoder.hpp"
#include "foundry/version.hpp"
#include <thread>
#include <httplib.h>
#include <spdlog/spdlog.h>

namespace foundry {

namespace {

const char* const JSON_TYPE = "application/json";

void send_json(httplib::Response& res, const nlohmann::json& body, int status = 200) {
    res.status = status;
    res.set_content(body.dump(-1, ' ', false, nlohmann::json::error_handler_t::replace), JSON_TYPE);
}

void send_error(httplib::Response& res, int status, const std::string& detail) {
    send_json(res, nlohmann::json{{"detail", detail}}, status);
}

std::string user_of(const httplib::Request& req) {
    auto user = req.get_header_value("X-User-Id");
    return user.empty() ? "local" : user;
}

/// Producer side of one SSE response.
struct ChatStream {
    explicit ChatStream(std::size_t capacity) : channel(capacity) {}

    BoundedChannel<std::string> channel;
    CancelToken cancel;
    std::thread producer;

    void release() {
        cancel.cancel();
        channel.close();
        if (producer.joinable()) producer.join();
    }
};

} // namespace

ChatServer::ChatServer(Options opts, ConversationEngine& engine, SessionStore& sessions,
                       ServerManager& servers, std::shared_ptr<const ProjectCatalog> catalog,
                       ServerSource server_source)
    : opts_(std::move(opts)), engine_(engine), sessions_(sessions), servers_(servers),
      catalog_(std::move(catalog)), server_source_(std::move(server_source)),
      server_(std::make_unique<httplib::Server>()) {
    std::size_t threads = opts_.worker_threads;
    server_->new_task_queue = [threads] { return new httplib::ThreadPool(threads); };
    setup_routes();
}

ChatServer::~ChatServer() {
    stop();
}

bool ChatServer::project_known(const std::string& project_id) const {
    return !catalog_ || catalog_->find_project(project_id).has_value();
}

void ChatServer::setup_routes() {
    // ---- Chat ----
    server_->Post(R"(/projects/([^/]+)/ai/chat)",
                  [this](const httplib::Request& req, httplib::Response& res) {
        handle_chat(req.matches[1], user_of(req), req.body, res);
    });

    server_->Get(R"(/projects/([^/]+)/ai/session)",
                 [this](const httplib::Request& req, httplib::Response& res) {
        std::string project_id = req.matches[1];
        auto active = sessions_.active(make_session_key(user_of(req), project_id));
        std::optional<Conversation> conv;
        if (active) conv = sessions_.snapshot(*active);
        if (!conv || conv->turns.empty()) {
            send_json(res, {{"active", false}, {"model", nullptr}, {"project_id", nullptr},
                            {"conversation_id", nullptr}});
            return;
        }
        send_json(res, {{"active", true}, {"model", conv->model}, {"project_id", project_id},
                        {"conversation_id", conv->id}});
    });

    server_->Delete(R"(/projects/([^/]+)/ai/session)",
                    [this](const httplib::Request& req, httplib::Response& res) {
        sessions_.clear(make_session_key(user_of(req), req.matches[1]));
        send_json(res, {{"status", "cleared"}});
    });

    server_->Get(R"(/projects/([^/]+)/ai/models)",
                 [this](const httplib::Request&, httplib::Response& res) {
        send_json(res, opts_.models);
    });

    // ---- Conversations ----
    server_->Get(R"(/projects/([^/]+)/conversations)",
                 [this](const httplib::Request& req, httplib::Response& res) {
        std::string project_id = req.matches[1];
        const auto key = make_session_key(user_of(req), project_id);
        nlohmann::json out = nlohmann::json::array();
        for (const auto& c : sessions_.list(project_id)) {
            if (c.session_key == key) out.push_back(conversation_summary_json(c));
        }
        send_json(res, out);
    });

    // Resolves a conversation visible to this user, or answers 404.
    auto owned = [this](const httplib::Request& req, httplib::Response& res)
        -> std::optional<Conversation> {
        auto conv = sessions_.snapshot(req.matches[2]);
        if (!conv || conv->project_id != req.matches[1].str()
            || conv->session_key != make_session_key(user_of(req), req.matches[1])) {
            send_error(res, 404, "Conversation not found");
            return std::nullopt;
        }
        return conv;
    };

    server_->Get(R"(/projects/([^/]+)/conversations/([^/]+))",
                 [owned](const httplib::Request& req, httplib::Response& res) {
        if (auto conv = owned(req, res)) send_json(res, conversation_detail_json(*conv));
    });

    server_->Patch(R"(/projects/([^/]+)/conversations/([^/]+))",
                   [this, owned](const httplib::Request& req, httplib::Response& res) {
        auto conv = owned(req, res);
        if (!conv) return;
        nlohmann::json body;
        try {
            body = Codec::parse_json(req.body);
        } catch (const ParseError& e) {
            send_error(res, 400, e.what());
            return;
        }
        if (!body.is_object() || !body.contains("title") || !body["title"].is_string()) {
            send_error(res, 422, "'title' must be a string");
            return;
        }
        sessions_.rename(conv->id, body["title"].get<std::string>());
        auto updated = sessions_.snapshot(conv->id);
        if (!updated) {
            send_error(res, 404, "Conversation not found");
            return;
        }
        send_json(res, conversation_summary_json(*updated));
    });

    server_->Delete(R"(/projects/([^/]+)/conversations/([^/]+))",
                    [this, owned](const httplib::Request& req, httplib::Response& res) {
        auto conv = owned(req, res);
        if (!conv) return;
        sessions_.remove(conv->id);
        res.status = 204;
    });

    // ---- Tool servers ----
    server_->Get("/mcp/servers", [this](const httplib::Request&, httplib::Response& res) {
        nlohmann::json out = nlohmann::json::array();
        for (const auto& s : servers_.statuses()) out.push_back(s);
        send_json(res, out);
    });

    server_->Post("/mcp/servers/refresh", [this](const httplib::Request&, httplib::Response& res) {
        if (!server_source_) {
            send_error(res, 400, "No server configuration source");
            return;
        }
        try {
            auto configs = server_source_();
            auto summary = servers_.reload(configs);
            nlohmann::json names = nlohmann::json::array();
            for (const auto& c : configs) names.push_back(c.id);
            send_json(res, {{"server_count", configs.size()}, {"servers", names},
                            {"added", summary.added}, {"removed", summary.removed},
                            {"restarted", summary.restarted}});
        } catch (const ConfigError& e) {
            send_error(res, 400, e.what());
        }
    });

    server_->Post(R"(/mcp/servers/([^/]+)/connect)",
                  [this](const httplib::Request& req, httplib::Response& res) {
        std::string id = req.matches[1];
        try {
            servers_.connect(id);
        } catch (const UnknownServerError& e) {
            send_error(res, 404, e.what());
            return;
        }
        auto status = servers_.status(id);
        if (!status) {
            send_error(res, 404, "Unknown tool server: " + id);
            return;
        }
        send_json(res, *status);
    });

    server_->Post(R"(/mcp/servers/([^/]+)/disconnect)",
                  [this](const httplib::Request& req, httplib::Response& res) {
        std::string id = req.matches[1];
        try {
            servers_.disconnect(id);
        } catch (const UnknownServerError& e) {
            send_error(res, 404, e.what());
            return;
        }
        send_json(res, {{"name", id}, {"status", "disconnected"}});
    });

    server_->Get(R"(/mcp/servers/([^/]+)/tools)",
                 [this](const httplib::Request& req, httplib::Response& res) {
        std::string id = req.matches[1];
        auto status = servers_.status(id);
        if (!status) {
            send_error(res, 404, "Unknown tool server: " + id);
            return;
        }
        nlohmann::json tools = nlohmann::json::array();
        for (const auto& t : status->tools) tools.push_back(t);
        send_json(res, {{"name", id}, {"tools", tools}});
    });

    server_->Get("/health", [](const httplib::Request&, httplib::Response& res) {
        send_json(res, {{"status", "ok"}, {"version", LIBRARY_VERSION}});
    });

    server_->set_exception_handler([](const httplib::Request& req, httplib::Response& res,
                                      std::exception_ptr ep) {
        try {
            std::rethrow_exception(ep);
        } catch (const std::exception& e) {
            spdlog::error("{} {} failed: {}", req.method, req.path, e.what());
        } catch (...) {
            spdlog::error("{} {} failed with a non-standard exception", req.method, req.path);
        }
        send_error(res, 500, "Internal server error");
    });
}

void ChatServer::handle_chat(const std::string& project_id, const std::string& user_id,
                             const std::string& body, httplib::Response& res) {
    nlohmann::json j;
    try {
        j = Codec::parse_json(body);
    } catch (const ParseError& e) {
        send_error(res, 400, std::string("Invalid request body: ") + e.what());
        return;
    }
    if (!j.is_object() || !j.contains("message") || !j["message"].is_string()
        || j["message"].get<std::string>().empty()) {
        send_error(res, 422, "'message' must be a non-empty string");
        return;
    }
    if (!project_known(project_id)) {
        send_error(res, 404, "Project not found");
        return;
    }

    ChatRequest request;
    request.user_id = user_id;
    request.project_id = project_id;
    request.message = j["message"].get<std::string>();
    if (j.contains("context")) request.context = j["context"].get<ChatContext>();
    if (j.contains("model") && j["model"].is_string()) request.model = j["model"].get<std::string>();
    if (j.contains("conversation_id") && j["conversation_id"].is_string()) {
        request.conversation_id = j["conversation_id"].get<std::string>();
    }

    std::shared_ptr<ConversationEngine::Exchange> exchange;
    try {
        exchange = std::make_shared<ConversationEngine::Exchange>(engine_.begin(std::move(request)));
    } catch (const ConversationBusyError& e) {
        send_error(res, 409, e.what());
        return;
    }

    auto stream = std::make_shared<ChatStream>(opts_.stream_buffer);
    stream->producer = std::thread([this, stream, exchange]() mutable {
        auto sink = [stream](StreamEvent ev) {
            return stream->channel.push(StreamEncoder::encode(ev));
        };
        try {
            engine_.run(*exchange, stream->cancel, sink);
        } catch (const std::exception& e) {
            spdlog::error("chat {} crashed: {}", exchange->conversation_id(), e.what());
            sink(Error{std::string("Internal error: ") + e.what()});
        }
        // Unlock the conversation before the client sees the end of the stream.
        exchange.reset();
        stream->channel.close();
    });

    res.set_header("Cache-Control", "no-cache");
    res.set_header("X-Accel-Buffering", "no");
    auto keepalive = opts_.keepalive_interval;
    res.set_chunked_content_provider("text/event-stream",
        [stream, keepalive](size_t /*offset*/, httplib::DataSink& sink) -> bool {
            if (auto frame = stream->channel.pop_for(keepalive)) {
                return sink.write(frame->data(), frame->size());
            }
            if (stream->channel.closed()) {
                sink.done();
                return true;
            }
            const auto ping = StreamEncoder::keepalive();
            return sink.write(ping.data(), ping.size());
        },
        [stream](bool /*success*/) { stream->release(); });
}

int ChatServer::bind() {
    int port = opts_.port;
    if (port == 0) {
        port = server_->bind_to_any_port(opts_.host);
        if (port <= 0) throw TransportError("Failed to bind HTTP server on " + opts_.host);
    } else if (!server_->bind_to_port(opts_.host, port)) {
        throw TransportError("Failed to bind HTTP server on " + opts_.host + ":" + std::to_string(port));
    }
    port_ = port;
    return port;
}

void ChatServer::serve() {
    spdlog::info("listening on http://{}:{}", opts_.host, port_.load());
    if (!server_->listen_after_bind()) {
        throw TransportError("HTTP server on port " + std::to_string(port_.load()) + " stopped unexpectedly");
    }
}

void ChatServer::listen() {
    bind();
    serve();
}

void ChatServer::stop() {
    if (server_ && server_->is_running()) server_->stop();
}

bool ChatServer::is_running() const {
    return server_->is_running();
}

} // namespace foundry
