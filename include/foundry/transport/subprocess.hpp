#pragma once
#include <sys/types.h>
#include <chrono>
#include <condition_variable>
#include <map>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <thread>
#include <vector>

namespace foundry {

/// A child process with piped stdin/stdout/stderr.
///
/// stdin/stdout are handed to a transport with release_stdio(); stderr is
/// drained by a background thread into a bounded tail buffer (and the debug
/// log) so a chatty child never blocks on a full pipe.
class Subprocess {
public:
    struct Options {
        std::string command;
        std::vector<std::string> args;
        std::map<std::string, std::string> env;  // merged over the parent's environment
        std::string log_name;                    // prefix for forwarded stderr lines
        std::size_t stderr_tail_bytes = 4096;
    };

    /// Fork and exec. Throws ServerProcessError if the program cannot be
    /// started (exec failures are reported back through a CLOEXEC pipe).
    static std::unique_ptr<Subprocess> spawn(const Options& opts);

    ~Subprocess();

    Subprocess(const Subprocess&) = delete;
    Subprocess& operator=(const Subprocess&) = delete;

    [[nodiscard]] pid_t pid() const noexcept { return pid_; }

    /// Transfer ownership of {stdout read end, stdin write end}.
    std::pair<int, int> release_stdio();

    /// Non-blocking reap. Returns the raw wait status once the child exited.
    std::optional<int> poll_exit();

    /// Block up to `timeout` for the child to exit.
    bool wait_for_exit(std::chrono::milliseconds timeout);

    /// Close stdin, then SIGTERM, then SIGKILL, each sent to the child's
    /// whole process group, and reap. Returns false if the child had to be
    /// killed.
    bool terminate(std::chrono::milliseconds grace);

    [[nodiscard]] bool running();

    /// Last bytes the child wrote to stderr.
    [[nodiscard]] std::string stderr_tail() const;

    /// Block up to `timeout` until the child's stderr reached EOF, so the
    /// tail is complete.
    bool wait_stderr_closed(std::chrono::milliseconds timeout);

    /// "exited with status 3" / "killed by signal 9" / "running".
    [[nodiscard]] std::string describe_exit();

private:
    Subprocess() = default;
    void drain_stderr();
    void signal_group(int sig);
    void reap_group();

    Options opts_;
    pid_t pid_ = -1;
    int stdin_fd_ = -1;
    int stdout_fd_ = -1;
    int stderr_fd_ = -1;
    int stderr_wake_[2]{-1, -1};

    std::mutex exit_mutex_;
    std::optional<int> exit_status_;

    std::thread stderr_thread_;
    mutable std::mutex stderr_mutex_;
    std::string stderr_tail_;
    std::condition_variable stderr_cv_;
    bool stderr_closed_ = false;
};

} // namespace foundry
