#include <gtest/gtest.h>
#include "foundry/server_connection.hpp"
#include "foundry/error.hpp"
#include "foundry/transport/stdio_transport.hpp"
#include <unistd.h>
#include <atomic>
#include <future>
#include <mutex>
#include <thread>
#include <vector>

using namespace foundry;
using namespace std::chrono_literals;

namespace {

// In-process tool server on the far side of two pipes.
class FakePeer {
public:
    FakePeer() {
        if (::pipe(to_server_) < 0 || ::pipe(to_client_) < 0) throw std::runtime_error("pipe failed");
        server_ = std::make_unique<StdioTransport>(to_server_[0], to_client_[1]);
        thread_ = std::thread([this] {
            server_->start([this](JsonRpcMessage msg) { handle(std::move(msg)); });
        });
    }

    ~FakePeer() {
        server_->shutdown();
        if (thread_.joinable()) thread_.join();
        for (auto& t : delayed_) t.join();
        server_.reset();
    }

    /// Transport for the client side; owns the client ends of the pipes.
    std::unique_ptr<ITransport> client_transport() {
        return std::make_unique<StdioTransport>(to_client_[0], to_server_[1]);
    }

    /// Close the server side as if the process died.
    void hang_up() { server_->shutdown(); }

    std::atomic<int> cancellations{0};
    std::atomic<bool> initialized{false};

private:
    void reply(JsonRpcMessage msg) {
        try {
            server_->send(msg);
        } catch (const TransportError&) {
            // Client already hung up.
        }
    }

    void handle(JsonRpcMessage msg) {
        if (auto* n = std::get_if<JsonRpcNotification>(&msg)) {
            if (n->method == "notifications/cancelled") ++cancellations;
            if (n->method == "notifications/initialized") initialized = true;
            return;
        }
        if (!std::holds_alternative<JsonRpcRequest>(msg)) return;
        auto req = std::get<JsonRpcRequest>(msg);
        const auto params = req.params.value_or(nlohmann::json::object());

        if (req.method == "initialize") {
            reply(make_result(req.id, {
                {"protocolVersion", params.value("protocolVersion", "")},
                {"capabilities", {{"tools", nlohmann::json::object()}}},
                {"serverInfo", {{"name", "fake"}, {"version", "1.0"}}},
            }));
        } else if (req.method == "tools/list") {
            // Two pages: a then b.
            if (!params.contains("cursor")) {
                reply(make_result(req.id, {{"tools", {{{"name", "echo"}}}}, {"nextCursor", "page2"}}));
            } else {
                reply(make_result(req.id, {{"tools", {{{"name", "slow"}, {"description", "Sleeps"}}}}}));
            }
        } else if (req.method == "tools/call") {
            const std::string name = params.value("name", "");
            const auto args = params.value("arguments", nlohmann::json::object());
            if (name == "echo") {
                reply(make_result(req.id, {{"content", {{{"type", "text"}, {"text", args.value("text", "")}}}}}));
            } else if (name == "slow") {
                int ms = args.value("ms", 200);
                std::lock_guard<std::mutex> lock(mutex_);
                delayed_.emplace_back([this, id = req.id, ms] {
                    std::this_thread::sleep_for(std::chrono::milliseconds(ms));
                    reply(make_result(id, {{"content", {{{"type", "text"}, {"text", "slow done"}}}}}));
                });
            } else if (name == "never") {
                // No answer.
            } else {
                reply(make_error(req.id, error::MethodNotFound, "Unknown tool: " + name));
            }
        } else {
            reply(make_error(req.id, error::MethodNotFound, "Method not found"));
        }
    }

    int to_server_[2]{-1, -1};
    int to_client_[2]{-1, -1};
    std::unique_ptr<StdioTransport> server_;
    std::thread thread_;
    std::mutex mutex_;
    std::vector<std::thread> delayed_;
};

ServerConnection::Options fast_options() {
    ServerConnection::Options o;
    o.handshake_timeout = 2000ms;
    o.shutdown_grace = 200ms;
    return o;
}

} // namespace

TEST(ServerConnection, HandshakeAndPagedCatalog) {
    FakePeer peer;
    ServerConnection conn("fake", fast_options());
    conn.attach(peer.client_transport());
    EXPECT_TRUE(conn.is_open());

    auto init = conn.initialize();
    EXPECT_EQ(init.server_info.name, "fake");
    EXPECT_TRUE(init.capabilities.tools.has_value());

    auto tools = conn.list_all_tools();
    ASSERT_EQ(tools.size(), 2u);
    EXPECT_EQ(tools[0].name, "echo");
    EXPECT_EQ(tools[1].name, "slow");
    EXPECT_EQ(tools[1].description.value(), "Sleeps");

    for (int i = 0; i < 100 && !peer.initialized; ++i) std::this_thread::sleep_for(5ms);
    EXPECT_TRUE(peer.initialized);
    conn.close();
}

TEST(ServerConnection, CatalogPageLimit) {
    FakePeer peer;
    auto opts = fast_options();
    opts.max_catalog_pages = 1;
    ServerConnection conn("fake", opts);
    conn.attach(peer.client_transport());
    EXPECT_EQ(conn.list_all_tools().size(), 1u);
}

TEST(ServerConnection, CallTool) {
    FakePeer peer;
    ServerConnection conn("fake", fast_options());
    conn.attach(peer.client_transport());
    auto r = conn.call_tool("echo", {{"text", "hi"}}, 2000ms);
    EXPECT_FALSE(r.is_error);
    EXPECT_EQ(r.joined_text(), "hi");
}

TEST(ServerConnection, ErrorResponseThrowsProtocolError) {
    FakePeer peer;
    ServerConnection conn("fake", fast_options());
    conn.attach(peer.client_transport());
    try {
        (void)conn.call_tool("missing", {}, 2000ms);
        FAIL() << "expected ProtocolError";
    } catch (const ProtocolError& e) {
        EXPECT_EQ(e.code, error::MethodNotFound);
    }
}

TEST(ServerConnection, ConcurrentCallsCompleteOutOfOrder) {
    FakePeer peer;
    ServerConnection conn("fake", fast_options());
    conn.attach(peer.client_transport());

    auto slow = std::async(std::launch::async, [&] {
        return conn.call_tool("slow", {{"ms", 300}}, 2000ms);
    });
    std::this_thread::sleep_for(20ms);
    auto start = std::chrono::steady_clock::now();
    auto fast = conn.call_tool("echo", {{"text", "quick"}}, 2000ms);
    EXPECT_LT(std::chrono::steady_clock::now() - start, 250ms);
    EXPECT_EQ(fast.joined_text(), "quick");
    EXPECT_EQ(slow.get().joined_text(), "slow done");
}

TEST(ServerConnection, TimeoutSendsCancellation) {
    FakePeer peer;
    ServerConnection conn("fake", fast_options());
    conn.attach(peer.client_transport());

    EXPECT_THROW((void)conn.call_tool("never", {}, 100ms), TimeoutError);
    EXPECT_EQ(conn.in_flight(), 0u);
    for (int i = 0; i < 100 && peer.cancellations == 0; ++i) std::this_thread::sleep_for(5ms);
    EXPECT_EQ(peer.cancellations.load(), 1);

    // The connection is still usable.
    EXPECT_EQ(conn.call_tool("echo", {{"text", "still here"}}, 2000ms).joined_text(), "still here");
}

TEST(ServerConnection, PeerHangupFailsPendingAndNotifies) {
    FakePeer peer;
    ServerConnection conn("fake", fast_options());
    std::promise<std::string> closed;
    conn.on_closed([&closed](const std::string& reason) { closed.set_value(reason); });
    conn.attach(peer.client_transport());

    auto pending = std::async(std::launch::async, [&] {
        return conn.call_tool("never", {}, 5000ms);
    });
    while (conn.in_flight() == 0) std::this_thread::sleep_for(1ms);
    peer.hang_up();

    EXPECT_THROW(pending.get(), TransportError);
    auto fut = closed.get_future();
    ASSERT_EQ(fut.wait_for(2s), std::future_status::ready);
    EXPECT_EQ(fut.get(), "Connection to server 'fake' closed");
    EXPECT_FALSE(conn.is_open());
    EXPECT_THROW((void)conn.call_tool("echo", {}, 100ms), TransportError);
}

TEST(ServerConnection, InFlightLimit) {
    FakePeer peer;
    auto opts = fast_options();
    opts.max_in_flight = 1;
    ServerConnection conn("fake", opts);
    conn.attach(peer.client_transport());

    auto first = std::async(std::launch::async, [&] {
        return conn.call_tool("slow", {{"ms", 200}}, 2000ms);
    });
    while (conn.in_flight() == 0) std::this_thread::sleep_for(1ms);
    EXPECT_THROW((void)conn.call_tool("echo", {}, 100ms), TransportError);
    EXPECT_EQ(first.get().joined_text(), "slow done");
}

TEST(ServerConnection, NotConnectedBeforeAttach) {
    ServerConnection conn("idle", fast_options());
    EXPECT_FALSE(conn.is_open());
    EXPECT_THROW((void)conn.call_tool("echo", {}, 100ms), TransportError);
}
