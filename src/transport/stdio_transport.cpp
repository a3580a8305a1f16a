#include "foundry/transport/stdio_transport.hpp"
#include "foundry/error.hpp"
#include <fcntl.h>
#include <poll.h>
#include <unistd.h>
#include <cerrno>
#include <cstring>

namespace foundry {

namespace {

void report(const ErrorCallback& on_error, std::exception_ptr ep) {
    if (on_error) on_error(std::move(ep));
}

} // anonymous namespace

StdioTransport::StdioTransport()
    : StdioTransport(STDIN_FILENO, STDOUT_FILENO, Options{}) {
    owns_fds_ = false;
    opts_.close_write_on_shutdown = false;
}

StdioTransport::StdioTransport(int read_fd, int write_fd)
    : StdioTransport(read_fd, write_fd, Options{}) {}

StdioTransport::StdioTransport(int read_fd, int write_fd, Options opts)
    : opts_(opts), read_fd_(read_fd), write_fd_(write_fd), owns_fds_(true) {
    // Created up front so a shutdown() racing start() can always wake poll().
    if (::pipe(wakeup_pipe_) < 0) {
        throw TransportError(std::string("Failed to create wakeup pipe: ") + std::strerror(errno));
    }
    for (int fd : wakeup_pipe_) {
        ::fcntl(fd, F_SETFD, FD_CLOEXEC);
    }
    int flags = ::fcntl(wakeup_pipe_[1], F_GETFL, 0);
    ::fcntl(wakeup_pipe_[1], F_SETFL, flags | O_NONBLOCK);
}

StdioTransport::~StdioTransport() {
    shutdown();
    if (writer_thread_.joinable()) writer_thread_.join();
    if (owns_fds_) {
        if (read_fd_ >= 0)  ::close(read_fd_);
        if (write_fd_ >= 0) ::close(write_fd_);
    }
    if (wakeup_pipe_[0] >= 0) ::close(wakeup_pipe_[0]);
    if (wakeup_pipe_[1] >= 0) ::close(wakeup_pipe_[1]);
}

void StdioTransport::start(MessageCallback on_message, ErrorCallback on_error) {
    if (shutdown_requested_.load()) return;
    if (running_.exchange(true)) return;
    connected_ = true;

    writer_thread_ = std::thread([this]() { write_loop(); });
    read_loop(on_message, on_error);

    connected_ = false;
    running_ = false;
    write_cv_.notify_all();
}

void StdioTransport::read_loop(const MessageCallback& on_message, const ErrorCallback& on_error) {
    std::string buffer;
    buffer.reserve(4096);
    char chunk[4096];

    while (running_) {
        struct pollfd fds[2];
        fds[0].fd = read_fd_;
        fds[0].events = POLLIN;
        fds[0].revents = 0;
        fds[1].fd = wakeup_pipe_[0];
        fds[1].events = POLLIN;
        fds[1].revents = 0;

        int ret = ::poll(fds, 2, -1);
        if (ret < 0) {
            if (errno == EINTR) continue;
            report(on_error, std::make_exception_ptr(
                TransportError(std::string("poll failed: ") + std::strerror(errno))));
            return;
        }

        if (fds[1].revents & POLLIN) return;
        // POLLHUP without POLLIN still needs a read() to observe EOF.
        if (!(fds[0].revents & (POLLIN | POLLHUP | POLLERR))) continue;

        ssize_t n = ::read(read_fd_, chunk, sizeof(chunk));
        if (n < 0) {
            if (errno == EINTR || errno == EAGAIN || errno == EWOULDBLOCK) continue;
            if (running_) {
                report(on_error, std::make_exception_ptr(
                    TransportError(std::string("Read error: ") + std::strerror(errno))));
            }
            return;
        }
        if (n == 0) return;  // peer closed its end

        buffer.append(chunk, static_cast<size_t>(n));

        size_t pos = 0;
        while (true) {
            size_t nl = buffer.find('\n', pos);
            if (nl == std::string::npos) break;

            std::string_view line(buffer.data() + pos, nl - pos);
            pos = nl + 1;
            if (!line.empty() && line.back() == '\r') line.remove_suffix(1);
            if (line.empty()) continue;

            JsonRpcMessage msg;
            try {
                msg = Codec::parse(line);
            } catch (const ParseError&) {
                report(on_error, std::current_exception());
                continue;
            }
            on_message(std::move(msg));
        }
        if (pos > 0) buffer.erase(0, pos);

        if (buffer.size() > opts_.max_frame_bytes) {
            report(on_error, std::make_exception_ptr(ParseError(
                "Frame exceeds " + std::to_string(opts_.max_frame_bytes) + " bytes")));
            return;
        }
    }
}

void StdioTransport::write_loop() {
    while (true) {
        std::string frame;
        {
            std::unique_lock<std::mutex> lock(write_mutex_);
            write_cv_.wait(lock, [this] {
                return !write_queue_.empty() || !running_;
            });
            if (write_queue_.empty()) break;
            frame = std::move(write_queue_.front());
            write_queue_.pop();
        }

        frame += '\n';
        const char* data = frame.data();
        size_t remaining = frame.size();
        while (remaining > 0) {
            ssize_t written = ::write(write_fd_, data, remaining);
            if (written < 0) {
                if (errno == EINTR) continue;
                // Peer is gone; the reader will see EOF.
                connected_ = false;
                std::lock_guard<std::mutex> lock(write_mutex_);
                write_queue_ = {};
                remaining = 0;
                break;
            }
            data += written;
            remaining -= static_cast<size_t>(written);
        }
    }
    close_write_end();
}

void StdioTransport::close_write_end() {
    if (owns_fds_ && opts_.close_write_on_shutdown && write_fd_ >= 0) {
        ::close(write_fd_);
        write_fd_ = -1;
    }
}

void StdioTransport::send(const JsonRpcMessage& msg) {
    // Messages queued before start() are drained once the writer runs.
    if (shutdown_requested_.load()) {
        throw TransportError("Transport shut down");
    }
    std::string serialized = Codec::serialize(msg);
    {
        std::lock_guard<std::mutex> lock(write_mutex_);
        write_queue_.push(std::move(serialized));
    }
    write_cv_.notify_one();
}

void StdioTransport::wake_reader() {
    if (wakeup_pipe_[1] >= 0) {
        char b = 1;
        ssize_t rc = ::write(wakeup_pipe_[1], &b, 1);
        (void)rc;  // a full pipe already wakes the reader
    }
}

void StdioTransport::shutdown() {
    shutdown_requested_ = true;
    if (!running_.exchange(false)) {
        write_cv_.notify_all();
        return;
    }
    connected_ = false;
    write_cv_.notify_all();
    wake_reader();
}

bool StdioTransport::is_connected() const {
    return connected_;
}

} // namespace foundry
