#pragma once

#include <string>
#include <vector>

namespace agentbox {

struct ProcLimits {
    int timeout_ms{2000};           // one-shot runs only
    size_t stdout_max_bytes{64 * 1024};

    int rlimit_cpu_sec{0};          // CPU time seconds, 0 = unlimited
    size_t rlimit_as_mb{0};         // virtual memory MB, 0 = unlimited
    size_t rlimit_fsize_mb{0};      // max file size MB, 0 = unlimited
    int rlimit_nofile{0};           // max open fds, 0 = unchanged
    int rlimit_nproc{0};            // max processes (best-effort), 0 = unchanged

    bool no_new_privs{true};

    // seccomp-BPF syscall allowlist (Linux only, requires no_new_privs).
    bool enable_seccomp{false};
    bool seccomp_allow_network{false};
};

struct ProcResult {
    int exit_code{127};
    bool timed_out{false};
    bool output_truncated{false};
    std::string output; // stdout+stderr merged
    std::string error;  // internal runner error, not child stderr
};

// Run a process (argv[0] is executable), capture stdout+stderr (merged),
// enforce timeout and rlimits (POSIX best-effort). Returns true if process started.
bool proc_run_capture_sandboxed(const std::vector<std::string>& argv,
                               const std::string& cwd,
                               const ProcLimits& lim,
                               ProcResult* res);

// A long-lived child in its own process group, with three pipes.
// The caller owns the descriptors and must reap the pid.
struct ChildProcess {
    int pid{-1};
    int stdin_fd{-1};    // write end
    int stdout_fd{-1};   // read end, non-blocking
    int stderr_fd{-1};   // read end, non-blocking
};

// Start argv with the same child-side hardening as the one-shot runner
// (process group, umask, fd scrub, no_new_privs, rlimits, optional seccomp,
// PDEATHSIG). Exec failure shows up as the child exiting with 127.
// Returns false and fills *err when the child could not be created.
bool proc_spawn_sandboxed(const std::vector<std::string>& argv,
                          const std::string& cwd,
                          const ProcLimits& lim,
                          ChildProcess* child,
                          std::string* err);

// Writes all of data to fd (typically ChildProcess::stdin_fd). A reader that
// has gone away shows up as false with errno EPIPE. SIGPIPE is blocked in the
// calling thread for the duration, so the process-wide disposition is never
// touched. Returns false with errno set on any other write error as well.
bool proc_write_all(int fd, const char* data, size_t n);

// Closes every descriptor of `child` that is still open and sets it to -1.
void proc_close_fds(ChildProcess* child);

// Sends `sig` to the child's process group, then to the pid itself.
void proc_signal_group(int pid, int sig);

// Non-blocking reap. Returns true once the child has exited and stores the
// shell-style exit code (128+signal for signals).
bool proc_try_reap(int pid, int* exit_code);

// Wait up to timeout_ms for exit, then SIGKILL the group and reap.
// Returns the exit code.
int proc_reap_with_deadline(int pid, int timeout_ms);

// Small helper: split a command string into argv tokens.
// Supports basic quotes (single/double) and backslash escaping inside double quotes.
// Returns empty vector on parse error.
std::vector<std::string> split_argv_quoted(const std::string& cmd);

} // namespace agentbox
