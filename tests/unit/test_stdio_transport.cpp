#include <gtest/gtest.h>
#include "foundry/transport/stdio_transport.hpp"
#include <unistd.h>
#include <chrono>
#include <condition_variable>
#include <mutex>
#include <thread>
#include <vector>

using namespace foundry;
using namespace std::chrono_literals;

namespace {

// Transport under test reads from `in` and writes to `out`; the test plays
// the peer on the other ends.
class PipePeer {
public:
    PipePeer() {
        if (::pipe(in_) < 0 || ::pipe(out_) < 0) throw std::runtime_error("pipe failed");
        transport = std::make_unique<StdioTransport>(in_[0], out_[1]);
    }

    ~PipePeer() {
        transport->shutdown();
        if (reader_.joinable()) reader_.join();
        transport.reset();
        if (in_[1] >= 0) ::close(in_[1]);
        ::close(out_[0]);
    }

    void start() {
        reader_ = std::thread([this] {
            transport->start(
                [this](JsonRpcMessage msg) {
                    std::lock_guard<std::mutex> lock(mutex_);
                    messages_.push_back(std::move(msg));
                    cv_.notify_all();
                },
                [this](std::exception_ptr) {
                    std::lock_guard<std::mutex> lock(mutex_);
                    ++errors_;
                    cv_.notify_all();
                });
            std::lock_guard<std::mutex> lock(mutex_);
            finished_ = true;
            cv_.notify_all();
        });
        // Wait for the read loop to be live.
        for (int i = 0; i < 200 && !transport->is_connected(); ++i) std::this_thread::sleep_for(1ms);
    }

    void write_raw(const std::string& text) {
        ASSERT_EQ(::write(in_[1], text.data(), text.size()), static_cast<ssize_t>(text.size()));
    }

    void close_peer_write() {
        ::close(in_[1]);
        in_[1] = -1;
    }

    std::string read_line() {
        std::string line;
        char c;
        while (::read(out_[0], &c, 1) == 1) {
            if (c == '\n') break;
            line += c;
        }
        return line;
    }

    bool wait_messages(std::size_t n) {
        std::unique_lock<std::mutex> lock(mutex_);
        return cv_.wait_for(lock, 2s, [&] { return messages_.size() >= n; });
    }

    bool wait_errors(int n) {
        std::unique_lock<std::mutex> lock(mutex_);
        return cv_.wait_for(lock, 2s, [&] { return errors_ >= n; });
    }

    bool wait_finished() {
        std::unique_lock<std::mutex> lock(mutex_);
        return cv_.wait_for(lock, 2s, [&] { return finished_; });
    }

    std::vector<JsonRpcMessage> messages() {
        std::lock_guard<std::mutex> lock(mutex_);
        return messages_;
    }

    std::unique_ptr<StdioTransport> transport;

private:
    int in_[2]{-1, -1};
    int out_[2]{-1, -1};
    std::thread reader_;
    std::mutex mutex_;
    std::condition_variable cv_;
    std::vector<JsonRpcMessage> messages_;
    int errors_ = 0;
    bool finished_ = false;
};

} // namespace

TEST(StdioTransport, NotConnectedBeforeStart) {
    int fds[2];
    ASSERT_EQ(::pipe(fds), 0);
    StdioTransport t(fds[0], fds[1]);
    EXPECT_FALSE(t.is_connected());
}

TEST(StdioTransport, ShutdownBeforeStartRejectsSends) {
    int fds[2];
    ASSERT_EQ(::pipe(fds), 0);
    StdioTransport t(fds[0], fds[1]);
    t.shutdown();
    EXPECT_THROW(t.send(make_notification("notifications/initialized")), TransportError);
}

TEST(StdioTransport, ReceivesFramesSplitAcrossWrites) {
    PipePeer peer;
    peer.start();
    peer.write_raw(R"({"jsonrpc":"2.0","id":1,"result":{"tools":[]}})" "\n"
                   R"({"jsonrpc":"2.0","method":"notifications/tools/list_changed"})");
    peer.write_raw("\r\n\n");
    ASSERT_TRUE(peer.wait_messages(2));

    auto msgs = peer.messages();
    ASSERT_TRUE(std::holds_alternative<JsonRpcResponse>(msgs[0]));
    EXPECT_EQ(std::get<int64_t>(std::get<JsonRpcResponse>(msgs[0]).id), 1);
    ASSERT_TRUE(std::holds_alternative<JsonRpcNotification>(msgs[1]));
    EXPECT_EQ(std::get<JsonRpcNotification>(msgs[1]).method, "notifications/tools/list_changed");
}

TEST(StdioTransport, SendWritesOneLinePerMessage) {
    PipePeer peer;
    peer.start();
    JsonRpcRequest req;
    req.id = int64_t{7};
    req.method = "tools/call";
    req.params = nlohmann::json{{"name", "echo"}, {"arguments", {{"text", "a\nb"}}}};
    peer.transport->send(req);

    auto line = peer.read_line();
    auto parsed = Codec::parse(line);
    ASSERT_TRUE(std::holds_alternative<JsonRpcRequest>(parsed));
    EXPECT_EQ(std::get<JsonRpcRequest>(parsed), req);
}

TEST(StdioTransport, BadFrameReportedAndSkipped) {
    PipePeer peer;
    peer.start();
    peer.write_raw("this is not json\n");
    ASSERT_TRUE(peer.wait_errors(1));
    peer.write_raw(R"({"jsonrpc":"2.0","id":"a","result":{}})" "\n");
    ASSERT_TRUE(peer.wait_messages(1));
}

TEST(StdioTransport, PeerEofEndsReadLoop) {
    PipePeer peer;
    peer.start();
    EXPECT_TRUE(peer.transport->is_connected());
    peer.close_peer_write();
    ASSERT_TRUE(peer.wait_finished());
    EXPECT_FALSE(peer.transport->is_connected());
}

TEST(StdioTransport, ShutdownWakesIdleReader) {
    PipePeer peer;
    peer.start();
    peer.transport->shutdown();
    ASSERT_TRUE(peer.wait_finished());
    EXPECT_THROW(peer.transport->send(make_notification("x")), TransportError);
}
