#include "foundry/transport/subprocess.hpp"
#include "foundry/error.hpp"
#include <fcntl.h>
#include <poll.h>
#include <signal.h>
#include <sys/wait.h>
#include <unistd.h>
#include <cerrno>
#include <cstring>
#include <spdlog/spdlog.h>

extern char** environ;

namespace foundry {

namespace {

void ignore_sigpipe_once() {
    static std::once_flag flag;
    std::call_once(flag, [] { ::signal(SIGPIPE, SIG_IGN); });
}

void close_fd(int& fd) {
    if (fd >= 0) {
        ::close(fd);
        fd = -1;
    }
}

struct Pipe {
    int fds[2]{-1, -1};
    ~Pipe() {
        close_fd(fds[0]);
        close_fd(fds[1]);
    }
    void open() {
        if (::pipe2(fds, O_CLOEXEC) < 0) {
            throw ServerProcessError(std::string("pipe failed: ") + std::strerror(errno));
        }
    }
    int release(int end) {
        int fd = fds[end];
        fds[end] = -1;
        return fd;
    }
};

std::vector<std::string> build_environment(const std::map<std::string, std::string>& overrides) {
    std::map<std::string, std::string> merged;
    for (char** e = environ; e && *e; ++e) {
        std::string entry(*e);
        auto eq = entry.find('=');
        if (eq == std::string::npos) continue;
        merged[entry.substr(0, eq)] = entry.substr(eq + 1);
    }
    for (const auto& [k, v] : overrides) merged[k] = v;

    std::vector<std::string> out;
    out.reserve(merged.size());
    for (const auto& [k, v] : merged) out.push_back(k + "=" + v);
    return out;
}

} // anonymous namespace

std::unique_ptr<Subprocess> Subprocess::spawn(const Options& opts) {
    if (opts.command.empty()) {
        throw ServerProcessError("Empty command");
    }
    ignore_sigpipe_once();

    Pipe in, out, err, exec_status, wake;
    in.open();
    out.open();
    err.open();
    exec_status.open();
    wake.open();
    ::fcntl(wake.fds[1], F_SETFL, ::fcntl(wake.fds[1], F_GETFL, 0) | O_NONBLOCK);

    // Everything the child touches is prepared before fork().
    std::vector<std::string> argv_store;
    argv_store.push_back(opts.command);
    argv_store.insert(argv_store.end(), opts.args.begin(), opts.args.end());
    std::vector<char*> argv;
    for (auto& a : argv_store) argv.push_back(a.data());
    argv.push_back(nullptr);

    std::vector<std::string> env_store = build_environment(opts.env);
    std::vector<char*> envp;
    for (auto& e : env_store) envp.push_back(e.data());
    envp.push_back(nullptr);

    pid_t pid = ::fork();
    if (pid < 0) {
        throw ServerProcessError(std::string("fork failed: ") + std::strerror(errno));
    }
    if (pid == 0) {
        // Own process group, so shutdown reaches anything the server forks.
        ::setpgid(0, 0);
        ::dup2(in.fds[0], STDIN_FILENO);
        ::dup2(out.fds[1], STDOUT_FILENO);
        ::dup2(err.fds[1], STDERR_FILENO);
        ::signal(SIGPIPE, SIG_DFL);
        ::execvpe(argv[0], argv.data(), envp.data());
        int code = errno;
        ssize_t rc = ::write(exec_status.fds[1], &code, sizeof(code));
        (void)rc;
        ::_exit(127);
    }

    // Also set from the parent so terminate() never races the child's setpgid.
    ::setpgid(pid, pid);

    close_fd(exec_status.fds[1]);
    int child_errno = 0;
    ssize_t n;
    do {
        n = ::read(exec_status.fds[0], &child_errno, sizeof(child_errno));
    } while (n < 0 && errno == EINTR);
    if (n == static_cast<ssize_t>(sizeof(child_errno))) {
        int status = 0;
        ::waitpid(pid, &status, 0);
        throw ServerProcessError("Failed to launch '" + opts.command + "': " + std::strerror(child_errno));
    }

    std::unique_ptr<Subprocess> proc(new Subprocess());
    proc->opts_ = opts;
    proc->pid_ = pid;
    proc->stdin_fd_ = in.release(1);
    proc->stdout_fd_ = out.release(0);
    proc->stderr_fd_ = err.release(0);
    proc->stderr_wake_[0] = wake.release(0);
    proc->stderr_wake_[1] = wake.release(1);
    proc->stderr_thread_ = std::thread([p = proc.get()] { p->drain_stderr(); });

    spdlog::debug("Spawned '{}' as pid {}", opts.command, pid);
    return proc;
}

Subprocess::~Subprocess() {
    if (pid_ > 0 && !poll_exit()) {
        terminate(std::chrono::milliseconds(500));
    }
    close_fd(stdin_fd_);
    close_fd(stdout_fd_);
    // A descendant that outlived the group kill may still hold the pipe
    // open; collect what is buffered, then stop the drain regardless.
    if (stderr_thread_.joinable()) {
        wait_stderr_closed(std::chrono::milliseconds(200));
        if (stderr_wake_[1] >= 0) {
            char b = 1;
            ssize_t rc = ::write(stderr_wake_[1], &b, 1);
            (void)rc;
        }
        stderr_thread_.join();
    }
    close_fd(stderr_fd_);
    close_fd(stderr_wake_[0]);
    close_fd(stderr_wake_[1]);
}

std::pair<int, int> Subprocess::release_stdio() {
    std::pair<int, int> fds{stdout_fd_, stdin_fd_};
    stdout_fd_ = -1;
    stdin_fd_ = -1;
    return fds;
}

void Subprocess::drain_stderr() {
    char chunk[1024];
    std::string line;
    while (true) {
        pollfd fds[2];
        fds[0] = {stderr_fd_, POLLIN, 0};
        fds[1] = {stderr_wake_[0], POLLIN, 0};
        int ready = ::poll(fds, 2, -1);
        if (ready < 0) {
            if (errno == EINTR) continue;
            break;
        }
        if (fds[1].revents != 0) break;

        ssize_t n = ::read(stderr_fd_, chunk, sizeof(chunk));
        if (n < 0 && (errno == EINTR || errno == EAGAIN)) continue;
        if (n <= 0) break;

        {
            std::lock_guard<std::mutex> lock(stderr_mutex_);
            stderr_tail_.append(chunk, static_cast<size_t>(n));
            if (stderr_tail_.size() > opts_.stderr_tail_bytes) {
                stderr_tail_.erase(0, stderr_tail_.size() - opts_.stderr_tail_bytes);
            }
        }

        line.append(chunk, static_cast<size_t>(n));
        size_t nl;
        while ((nl = line.find('\n')) != std::string::npos) {
            if (nl > 0) spdlog::debug("[{}] {}", opts_.log_name, line.substr(0, nl));
            line.erase(0, nl + 1);
        }
        if (line.size() > 4096) line.clear();
    }
    if (!line.empty()) spdlog::debug("[{}] {}", opts_.log_name, line);

    std::lock_guard<std::mutex> lock(stderr_mutex_);
    stderr_closed_ = true;
    stderr_cv_.notify_all();
}

std::optional<int> Subprocess::poll_exit() {
    std::lock_guard<std::mutex> lock(exit_mutex_);
    if (exit_status_) return exit_status_;
    if (pid_ <= 0) return std::nullopt;

    int status = 0;
    pid_t r = ::waitpid(pid_, &status, WNOHANG);
    if (r == pid_) {
        exit_status_ = status;
    } else if (r < 0 && errno == ECHILD) {
        exit_status_ = 0;
    }
    return exit_status_;
}

bool Subprocess::wait_for_exit(std::chrono::milliseconds timeout) {
    auto deadline = std::chrono::steady_clock::now() + timeout;
    while (true) {
        if (poll_exit()) return true;
        if (std::chrono::steady_clock::now() >= deadline) return false;
        std::this_thread::sleep_for(std::chrono::milliseconds(10));
    }
}

bool Subprocess::terminate(std::chrono::milliseconds grace) {
    if (poll_exit()) return true;

    // A closed stdin is the polite request; give it half the grace period.
    close_fd(stdin_fd_);
    if (wait_for_exit(grace / 2)) {
        reap_group();
        return true;
    }

    signal_group(SIGTERM);
    if (wait_for_exit(grace / 2)) {
        reap_group();
        return true;
    }

    spdlog::warn("[{}] pid {} ignored SIGTERM, killing", opts_.log_name, pid_);
    signal_group(SIGKILL);
    if (!wait_for_exit(std::chrono::milliseconds(2000))) {
        spdlog::error("[{}] pid {} survived SIGKILL", opts_.log_name, pid_);
    }
    return false;
}

void Subprocess::signal_group(int sig) {
    if (pid_ <= 0) return;
    // The group is gone once its last member exits; fall back to the leader.
    if (::kill(-pid_, sig) < 0 && errno == ESRCH) ::kill(pid_, sig);
}

void Subprocess::reap_group() {
    // The server is gone; descendants it left behind go with it.
    if (pid_ > 0) ::kill(-pid_, SIGKILL);
}

bool Subprocess::running() {
    return !poll_exit().has_value();
}

std::string Subprocess::stderr_tail() const {
    std::lock_guard<std::mutex> lock(stderr_mutex_);
    return stderr_tail_;
}

bool Subprocess::wait_stderr_closed(std::chrono::milliseconds timeout) {
    std::unique_lock<std::mutex> lock(stderr_mutex_);
    return stderr_cv_.wait_for(lock, timeout, [this] { return stderr_closed_; });
}

std::string Subprocess::describe_exit() {
    auto status = poll_exit();
    if (!status) return "running";
    if (WIFEXITED(*status)) return "exited with status " + std::to_string(WEXITSTATUS(*status));
    if (WIFSIGNALED(*status)) return "killed by signal " + std::to_string(WTERMSIG(*status));
    return "exited";
}

} // namespace foundry
