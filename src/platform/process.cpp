#include "process.hpp"
#include "platform.hpp"

#include <unistd.h>
#include <sys/wait.h>
#include <signal.h>
#include <fcntl.h>
#include <poll.h>
#include <cerrno>
#include <cstring>

#include <chrono>
#include <mutex>
#include <optional>
#include <fmt/format.h>

namespace platform {

static void close_fd(int& fd) {
    if (fd >= 0) {
        close(fd);
        fd = -1;
    }
}

static int decode_status(int status) {
    if (WIFEXITED(status)) return WEXITSTATUS(status);
    if (WIFSIGNALED(status)) return 128 + WTERMSIG(status);
    return -1;
}

// ── ProcessHandle ────────────────────────────────────────────

ProcessHandle::ProcessHandle() = default;

ProcessHandle::~ProcessHandle() {
    close_fd(stdin_fd_);
    close_fd(output_fd_);
    if (pid_ > 0 && !reaped_) try_reap(false);
}

ProcessHandle::ProcessHandle(ProcessHandle&& other) noexcept {
    *this = std::move(other);
}

ProcessHandle& ProcessHandle::operator=(ProcessHandle&& other) noexcept {
    if (this != &other) {
        close_fd(stdin_fd_);
        close_fd(output_fd_);
        pid_ = other.pid_;
        group_leader_ = other.group_leader_;
        reaped_ = other.reaped_;
        exit_code_ = other.exit_code_;
        stdin_fd_ = other.stdin_fd_;
        output_fd_ = other.output_fd_;
        error_ = std::move(other.error_);
        other.pid_ = -1;
        other.reaped_ = false;
        other.exit_code_ = -1;
        other.stdin_fd_ = -1;
        other.output_fd_ = -1;
    }
    return *this;
}

bool ProcessHandle::valid() const {
    return pid_ > 0;
}

bool ProcessHandle::try_reap(bool block) {
    if (pid_ <= 0) return true;
    if (reaped_) return true;

    int status = 0;
    pid_t ret;
    do {
        ret = waitpid(pid_, &status, block ? 0 : WNOHANG);
    } while (ret < 0 && errno == EINTR);

    if (ret == pid_) {
        reaped_ = true;
        exit_code_ = decode_status(status);
        return true;
    }
    if (ret < 0) {
        // ECHILD: someone else reaped it; the status is lost
        reaped_ = true;
        exit_code_ = -1;
        return true;
    }
    return false;
}

bool ProcessHandle::running() {
    if (pid_ <= 0) return false;
    return !try_reap(false);
}

int ProcessHandle::wait(int timeout_ms) {
    if (pid_ <= 0) return -1;
    if (timeout_ms < 0) {
        try_reap(true);
        return exit_code_;
    }
    int elapsed = 0;
    while (elapsed < timeout_ms) {
        if (try_reap(false)) return exit_code_;
        sleep_ms(20);
        elapsed += 20;
    }
    return try_reap(false) ? exit_code_ : -1;
}

void ProcessHandle::signal_child(int sig) {
    if (pid_ <= 0) return;
    if (group_leader_) {
        kill(-pid_, sig);
    } else if (!reaped_) {
        kill(pid_, sig);
    }
}

void ProcessHandle::terminate(int grace_ms) {
    if (pid_ <= 0) return;
    if (!reaped_) {
        signal_child(SIGTERM);
        for (int waited = 0; waited < grace_ms; waited += 50) {
            if (try_reap(false)) break;
            sleep_ms(50);
        }
        if (!reaped_) {
            signal_child(SIGKILL);
            try_reap(true);
        }
    }
    // Grandchildren may outlive the leader; the group id stays addressable
    // while any member is alive.
    if (group_leader_) kill(-pid_, SIGKILL);
}

void ProcessHandle::close_stdin() {
    close_fd(stdin_fd_);
}

void ProcessHandle::close_output() {
    close_fd(output_fd_);
}

// ── spawn ────────────────────────────────────────────────────

ProcessHandle spawn(const std::string& program,
                    const std::vector<std::string>& args,
                    const SpawnOptions& options) {
    ProcessHandle handle;

    // Everything the child touches is prepared before fork
    std::vector<const char*> argv;
    argv.push_back(program.c_str());
    for (const auto& a : args) argv.push_back(a.c_str());
    argv.push_back(nullptr);
    const char* workdir = options.working_dir.empty() ? nullptr : options.working_dir.c_str();

    int in_pipe[2] = {-1, -1};
    int out_pipe[2] = {-1, -1};
    int status_pipe[2] = {-1, -1};

    auto close_all = [&]() {
        for (int* p : {in_pipe, out_pipe, status_pipe}) {
            close_fd(p[0]);
            close_fd(p[1]);
        }
    };

    if ((options.pipe_stdin && pipe2(in_pipe, O_CLOEXEC) != 0) ||
        (options.capture_output && pipe2(out_pipe, O_CLOEXEC) != 0) ||
        pipe2(status_pipe, O_CLOEXEC) != 0) {
        handle.error_ = fmt::format("pipe failed: {}", std::strerror(errno));
        close_all();
        return handle;
    }

    pid_t pid = fork();
    if (pid < 0) {
        handle.error_ = fmt::format("fork failed: {}", std::strerror(errno));
        close_all();
        return handle;
    }

    if (pid == 0) {
        // Child process: async-signal-safe calls only
        if (options.new_process_group) setpgid(0, 0);

        if (options.pipe_stdin) {
            dup2(in_pipe[0], STDIN_FILENO);
        } else {
            int devnull = open("/dev/null", O_RDONLY);
            if (devnull >= 0) {
                dup2(devnull, STDIN_FILENO);
                close(devnull);
            }
        }

        if (options.capture_output) {
            dup2(out_pipe[1], STDOUT_FILENO);
            dup2(out_pipe[1], STDERR_FILENO);
        }

        // The parent ignores SIGPIPE; exec does not reset ignored signals
        signal(SIGPIPE, SIG_DFL);

        int report[2] = {0, 0};
        if (workdir && chdir(workdir) != 0) {
            report[0] = 1;
            report[1] = errno;
            (void)!write(status_pipe[1], report, sizeof(report));
            _exit(127);
        }

        execvp(program.c_str(), const_cast<char* const*>(argv.data()));
        report[0] = 2;
        report[1] = errno;
        (void)!write(status_pipe[1], report, sizeof(report));
        _exit(127);  // exec failed
    }

    // Parent
    if (options.new_process_group) setpgid(pid, pid);
    close_fd(in_pipe[0]);
    close_fd(out_pipe[1]);
    close_fd(status_pipe[1]);

    // The status pipe closes on successful exec (CLOEXEC) or carries an errno
    int report[2] = {0, 0};
    ssize_t n;
    do {
        n = read(status_pipe[0], report, sizeof(report));
    } while (n < 0 && errno == EINTR);
    close_fd(status_pipe[0]);

    if (n == static_cast<ssize_t>(sizeof(report))) {
        int status = 0;
        while (waitpid(pid, &status, 0) < 0 && errno == EINTR) {}
        close_fd(in_pipe[1]);
        close_fd(out_pipe[0]);
        if (report[0] == 1) {
            handle.error_ = fmt::format("cannot enter directory '{}': {}",
                                        options.working_dir, std::strerror(report[1]));
        } else {
            handle.error_ = fmt::format("cannot execute '{}': {}",
                                        program, std::strerror(report[1]));
        }
        return handle;
    }

    handle.pid_ = pid;
    handle.group_leader_ = options.new_process_group;
    handle.stdin_fd_ = in_pipe[1];
    handle.output_fd_ = out_pipe[0];
    return handle;
}

// ── run_capture ──────────────────────────────────────────────

static void ignore_sigpipe() {
    static std::once_flag once;
    std::call_once(once, []() { signal(SIGPIPE, SIG_IGN); });
}

static void set_nonblocking(int fd) {
    if (fd < 0) return;
    int flags = fcntl(fd, F_GETFL, 0);
    if (flags >= 0) fcntl(fd, F_SETFL, flags | O_NONBLOCK);
}

// Read everything currently available. Closes the pipe on EOF or error.
static void drain_output(ProcessHandle& proc, std::string& out) {
    char buf[4096];
    while (proc.output_fd() >= 0) {
        ssize_t n = read(proc.output_fd(), buf, sizeof(buf));
        if (n > 0) {
            out.append(buf, static_cast<size_t>(n));
        } else if (n == 0) {
            proc.close_output();
        } else if (errno == EINTR) {
            continue;
        } else if (errno == EAGAIN || errno == EWOULDBLOCK) {
            return;
        } else {
            proc.close_output();
        }
    }
}

static void feed_input(ProcessHandle& proc, const std::string& input, size_t& written) {
    while (proc.stdin_fd() >= 0 && written < input.size()) {
        ssize_t n = write(proc.stdin_fd(), input.data() + written, input.size() - written);
        if (n > 0) {
            written += static_cast<size_t>(n);
        } else if (n < 0 && errno == EINTR) {
            continue;
        } else if (n < 0 && (errno == EAGAIN || errno == EWOULDBLOCK)) {
            return;
        } else {
            // EPIPE: the child stopped reading
            proc.close_stdin();
            return;
        }
    }
    if (written >= input.size()) proc.close_stdin();
}

CaptureResult run_capture(const std::string& program,
                          const std::vector<std::string>& args,
                          const CaptureOptions& options) {
    ignore_sigpipe();

    CaptureResult result;

    SpawnOptions spawn_opts;
    spawn_opts.working_dir = options.working_dir;
    spawn_opts.pipe_stdin = true;
    spawn_opts.capture_output = true;
    spawn_opts.new_process_group = true;

    ProcessHandle proc = spawn(program, args, spawn_opts);
    if (!proc.valid()) {
        result.end = CaptureEnd::SpawnFailed;
        result.error = proc.error();
        return result;
    }

    set_nonblocking(proc.stdin_fd());
    set_nonblocking(proc.output_fd());

    size_t written = 0;
    if (options.input.empty()) proc.close_stdin();

    using steady = std::chrono::steady_clock;
    std::optional<steady::time_point> deadline;
    if (options.timeout_ms >= 0) {
        deadline = steady::now() + std::chrono::milliseconds(options.timeout_ms);
    }

    while (true) {
        struct pollfd fds[2];
        nfds_t nfds = 0;
        int out_idx = -1, in_idx = -1;
        if (proc.output_fd() >= 0) {
            out_idx = static_cast<int>(nfds);
            fds[nfds++] = {proc.output_fd(), POLLIN, 0};
        }
        if (proc.stdin_fd() >= 0) {
            in_idx = static_cast<int>(nfds);
            fds[nfds++] = {proc.stdin_fd(), POLLOUT, 0};
        }

        int wait_ms = options.poll_interval_ms;
        if (deadline) {
            auto remaining = std::chrono::duration_cast<std::chrono::milliseconds>(
                *deadline - steady::now()).count();
            if (remaining < wait_ms) wait_ms = remaining > 0 ? static_cast<int>(remaining) : 0;
        }

        int rc = poll(nfds ? fds : nullptr, nfds, wait_ms);
        if (rc > 0) {
            if (out_idx >= 0 && (fds[out_idx].revents & (POLLIN | POLLHUP | POLLERR))) {
                drain_output(proc, result.output);
            }
            if (in_idx >= 0 && (fds[in_idx].revents & (POLLOUT | POLLHUP | POLLERR))) {
                feed_input(proc, options.input, written);
            }
        }

        if (!proc.running()) {
            // All output the child wrote before exiting is already in the pipe
            drain_output(proc, result.output);
            result.end = CaptureEnd::Exited;
            break;
        }

        if (options.should_stop && options.should_stop()) {
            proc.terminate(options.kill_grace_ms);
            drain_output(proc, result.output);
            result.end = CaptureEnd::Stopped;
            break;
        }

        if (deadline && steady::now() >= *deadline) {
            proc.terminate(options.kill_grace_ms);
            drain_output(proc, result.output);
            result.end = CaptureEnd::TimedOut;
            break;
        }
    }

    proc.close_stdin();
    proc.close_output();
    result.exit_code = proc.exit_code();
    return result;
}

} // namespace platform
