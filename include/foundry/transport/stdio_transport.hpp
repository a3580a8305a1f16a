#pragma once
#include "transport.hpp"
#include "../codec.hpp"
#include <atomic>
#include <condition_variable>
#include <cstddef>
#include <mutex>
#include <queue>
#include <thread>

namespace foundry {

/// Newline-delimited JSON-RPC over a pair of file descriptors: a child
/// process's stdout (read) and stdin (write), or the process's own stdio
/// when acting as a tool server.
///
/// Reading happens on the thread that calls start(); writes go through a
/// queue drained by a background writer thread.
class StdioTransport : public ITransport {
public:
    struct Options {
        /// Frames longer than this are a protocol error.
        std::size_t max_frame_bytes = 16 * 1024 * 1024;
        /// Close write_fd once the writer drains after shutdown(). Closing a
        /// child's stdin is how it is asked to exit.
        bool close_write_on_shutdown = true;
    };

    /// Use the process's own stdin/stdout.
    StdioTransport();

    /// Take ownership of the given descriptors.
    StdioTransport(int read_fd, int write_fd);
    StdioTransport(int read_fd, int write_fd, Options opts);

    ~StdioTransport() override;

    void start(MessageCallback on_message, ErrorCallback on_error = nullptr) override;
    void send(const JsonRpcMessage& msg) override;
    void shutdown() override;
    bool is_connected() const override;

private:
    void read_loop(const MessageCallback& on_message, const ErrorCallback& on_error);
    void write_loop();
    void wake_reader();
    void close_write_end();

    Options opts_;
    int read_fd_;
    int write_fd_;
    bool owns_fds_;

    std::atomic<bool> running_{false};
    std::atomic<bool> connected_{false};
    std::atomic<bool> shutdown_requested_{false};

    std::thread writer_thread_;

    std::mutex write_mutex_;
    std::queue<std::string> write_queue_;
    std::condition_variable write_cv_;

    int wakeup_pipe_[2]{-1, -1};
};

} // namespace foundry
