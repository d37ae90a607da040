#pragma once

#include <string>
#include <vector>
#include <functional>

namespace platform {

struct SpawnOptions {
    std::string working_dir;         // empty = inherit the parent's cwd
    bool pipe_stdin = false;         // expose a writable stdin pipe
    bool capture_output = false;     // stdout and stderr share one readable pipe
    bool new_process_group = false;  // child leads its own process group
};

// Opaque handle to a spawned child process.
class ProcessHandle {
public:
    ProcessHandle();
    ~ProcessHandle();

    ProcessHandle(ProcessHandle&& other) noexcept;
    ProcessHandle& operator=(ProcessHandle&& other) noexcept;
    ProcessHandle(const ProcessHandle&) = delete;
    ProcessHandle& operator=(const ProcessHandle&) = delete;

    // True if the process handle is valid (was successfully spawned).
    bool valid() const;

    // Why spawning failed (chdir or exec errno text). Empty when valid.
    const std::string& error() const { return error_; }

    // True if the process is still running. Reaps the child once it exits.
    bool running();

    // Wait for the process to exit. Returns exit code (128+signal if killed).
    // timeout_ms = -1 means indefinite wait; returns -1 on timeout.
    int wait(int timeout_ms = -1);

    // Exit code after the child was reaped, -1 before.
    int exit_code() const { return exit_code_; }

    // SIGTERM (to the whole group when the child leads one), then SIGKILL
    // after grace_ms. Always reaps the child.
    void terminate(int grace_ms = 2000);

    int stdin_fd() const { return stdin_fd_; }
    int output_fd() const { return output_fd_; }
    void close_stdin();
    void close_output();

    int native_handle() const { return pid_; }

private:
    int pid_ = -1;
    bool group_leader_ = false;
    bool reaped_ = false;
    int exit_code_ = -1;
    int stdin_fd_ = -1;
    int output_fd_ = -1;
    std::string error_;

    bool try_reap(bool block);
    void signal_child(int sig);

    friend ProcessHandle spawn(const std::string& program,
                               const std::vector<std::string>& args,
                               const SpawnOptions& options);
};

// Spawn a child process. The program is resolved through PATH.
ProcessHandle spawn(const std::string& program,
                    const std::vector<std::string>& args,
                    const SpawnOptions& options = {});

// ── Captured execution ───────────────────────────────────────

enum class CaptureEnd {
    Exited,       // child exited on its own
    TimedOut,     // deadline elapsed, child terminated
    Stopped,      // should_stop() returned true, child terminated
    SpawnFailed,  // child never ran
};

struct CaptureOptions {
    std::string working_dir;
    std::string input;                    // written to the child's stdin, then closed
    int timeout_ms = -1;                  // -1 = no deadline
    std::function<bool()> should_stop;    // polled while the child runs
    int poll_interval_ms = 50;
    int kill_grace_ms = 2000;
};

struct CaptureResult {
    CaptureEnd end = CaptureEnd::SpawnFailed;
    int exit_code = -1;
    std::string output;                   // stdout+stderr, interleaved as written
    std::string error;                    // spawn failure description
};

// Run a program in its own process group, feed `input` on stdin and collect
// combined output until it exits, the deadline passes or should_stop fires.
CaptureResult run_capture(const std::string& program,
                          const std::vector<std::string>& args,
                          const CaptureOptions& options = {});

} // namespace platform
