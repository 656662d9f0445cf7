#include "agentbox/proc.h"
#include "agentbox/sandbox.h"

#include <algorithm>
#include <cerrno>
#include <cstring>
#include <cctype>
#include <chrono>
#include <csignal>
#include <cstdlib>
#include <ctime>

#include <unistd.h>
#include <fcntl.h>
#include <sys/stat.h>
#include <sys/types.h>
#include <sys/wait.h>
#include <sys/resource.h>
#include <poll.h>
#include <pthread.h>
#ifdef __linux__
  #include <sys/prctl.h>
#endif

namespace agentbox {

std::vector<std::string> split_argv_quoted(const std::string& cmd) {
    std::vector<std::string> out;
    std::string cur;
    enum { NORM, SQ, DQ } st = NORM;
    bool esc = false;
    bool have = false;   // distinguishes "" (empty token) from no token

    auto flush = [&]() {
        if (have) {
            out.push_back(cur);
            cur.clear();
            have = false;
        }
    };

    for (char c : cmd) {
        if (st == NORM) {
            if (c == ' ' || c == '\t' || c == '\n' || c == '\r') {
                flush();
                continue;
            }
            if (c == '\'') { st = SQ; have = true; continue; }
            if (c == '"') { st = DQ; esc = false; have = true; continue; }
            cur.push_back(c);
            have = true;
        } else if (st == SQ) {
            if (c == '\'') { st = NORM; continue; }
            cur.push_back(c);
        } else { // DQ
            if (esc) {
                cur.push_back(c);
                esc = false;
                continue;
            }
            if (c == '\\') { esc = true; continue; }
            if (c == '"') { st = NORM; continue; }
            cur.push_back(c);
        }
    }
    if (st != NORM) return {};
    flush();
    return out;
}

namespace {

bool env_true(const char* key) {
    const char* v = std::getenv(key);
    if (!v) return false;
    std::string s = v;
    for (auto& c : s) c = (char)std::tolower((unsigned char)c);
    return (s == "1" || s == "true" || s == "yes" || s == "on");
}

// Optional operator-provided wrapper (e.g., nsjail/firejail/bwrap), prepended
// to every sandboxed argv when AGENTBOX_PROC_WRAPPER_ENABLE is set.
std::vector<std::string> with_wrapper(const std::vector<std::string>& argv) {
    if (!env_true("AGENTBOX_PROC_WRAPPER_ENABLE")) return argv;
    const char* w = std::getenv("AGENTBOX_PROC_WRAPPER");
    if (!w) return argv;
    auto toks = split_argv_quoted(w);
    if (toks.empty()) return argv;
    toks.insert(toks.end(), argv.begin(), argv.end());
    return toks;
}

void set_rlimit(int resource, rlim_t v) {
    struct rlimit rl;
    rl.rlim_cur = v;
    rl.rlim_max = v;
    (void)setrlimit(resource, &rl);
}

void set_nonblocking(int fd) {
    int flags = fcntl(fd, F_GETFL, 0);
    if (flags >= 0) (void)fcntl(fd, F_SETFL, flags | O_NONBLOCK);
}

void set_cloexec(int fd) {
    int flags = fcntl(fd, F_GETFD, 0);
    if (flags >= 0) (void)fcntl(fd, F_SETFD, flags | FD_CLOEXEC);
}

// Runs in the forked child, after stdio has been wired. Never returns.
[[noreturn]] void exec_child(const std::vector<char*>& cargv, const std::string& cwd, const ProcLimits& lim) {
    // isolate process group so timeout/teardown can kill the whole subtree
    (void)setpgid(0, 0);

    // tighten default file permissions for any files created by the child
    (void)umask(077);

    // best-effort: close inherited fds beyond stdin/stdout/stderr
    long maxfd = sysconf(_SC_OPEN_MAX);
    if (maxfd < 256) maxfd = 256;
    if (maxfd > 65536) maxfd = 65536;
    for (int fd = 3; fd < maxfd; fd++) {
        (void)close(fd);
    }

    if (!cwd.empty() && chdir(cwd.c_str()) != 0) {
        _exit(126);
    }

    // scrub dangerous loader env vars
    unsetenv("LD_PRELOAD");
    unsetenv("LD_LIBRARY_PATH");

#ifdef __linux__
    if (lim.no_new_privs) {
        (void)prctl(PR_SET_NO_NEW_PRIVS, 1, 0, 0, 0);
    }
    (void)prctl(PR_SET_PDEATHSIG, SIGKILL);
#endif

    if (lim.rlimit_cpu_sec > 0) set_rlimit(RLIMIT_CPU, (rlim_t)lim.rlimit_cpu_sec);
    if (lim.rlimit_as_mb > 0) set_rlimit(RLIMIT_AS, (rlim_t)lim.rlimit_as_mb * 1024ULL * 1024ULL);
    if (lim.rlimit_fsize_mb > 0) set_rlimit(RLIMIT_FSIZE, (rlim_t)lim.rlimit_fsize_mb * 1024ULL * 1024ULL);
    if (lim.rlimit_nofile > 0) set_rlimit(RLIMIT_NOFILE, (rlim_t)lim.rlimit_nofile);
#ifdef RLIMIT_NPROC
    if (lim.rlimit_nproc > 0) set_rlimit(RLIMIT_NPROC, (rlim_t)lim.rlimit_nproc);
#endif

    // seccomp must come after no_new_privs; a failure to install is fatal
    // for the child since the caller asked for it explicitly
    if (lim.enable_seccomp) {
        SeccompProfile prof;
        prof.allow_network = lim.seccomp_allow_network;
        if (!install_seccomp_filter(prof).empty()) _exit(125);
    }

    execvp(cargv[0], cargv.data());
    _exit(127);
}

std::vector<char*> to_cargv(const std::vector<std::string>& argv) {
    std::vector<char*> cargv;
    cargv.reserve(argv.size() + 1);
    for (const auto& s : argv) cargv.push_back(const_cast<char*>(s.c_str()));
    cargv.push_back(nullptr);
    return cargv;
}

int decode_status(int status) {
    if (WIFEXITED(status)) return WEXITSTATUS(status);
    if (WIFSIGNALED(status)) return 128 + WTERMSIG(status);
    return 128;
}

} // namespace

bool proc_run_capture_sandboxed(const std::vector<std::string>& argv,
                               const std::string& cwd,
                               const ProcLimits& lim,
                               ProcResult* res) {
    if (!res) return false;
    *res = ProcResult{};

    if (argv.empty() || argv[0].empty()) {
        res->error = "empty argv";
        return false;
    }
    const std::vector<std::string> eff_argv = with_wrapper(argv);
    std::vector<char*> cargv = to_cargv(eff_argv);

    int pipefd[2];
    if (pipe(pipefd) != 0) {
        res->error = std::string("pipe failed: ") + std::strerror(errno);
        return false;
    }
    set_nonblocking(pipefd[0]);

    pid_t pid = fork();
    if (pid < 0) {
        close(pipefd[0]); close(pipefd[1]);
        res->error = std::string("fork failed: ") + std::strerror(errno);
        return false;
    }

    if (pid == 0) {
        int devnull = open("/dev/null", O_RDONLY);
        if (devnull >= 0) { (void)dup2(devnull, STDIN_FILENO); close(devnull); }
        (void)dup2(pipefd[1], STDOUT_FILENO);
        (void)dup2(pipefd[1], STDERR_FILENO);
        close(pipefd[0]);
        close(pipefd[1]);
        exec_child(cargv, cwd, lim);
    }

    // parent
    (void)setpgid(pid, pid);
    close(pipefd[1]);

    auto start = std::chrono::steady_clock::now();
    std::string out;
    out.reserve(std::min<size_t>(lim.stdout_max_bytes, 64 * 1024));

    auto append = [&](const char* buf, size_t n) {
        size_t can = lim.stdout_max_bytes > out.size() ? (lim.stdout_max_bytes - out.size()) : 0;
        size_t take = std::min(n, can);
        if (take < n) res->output_truncated = true;
        out.append(buf, take);
    };
    auto drain = [&]() {
        char buf[4096];
        while (true) {
            ssize_t n = read(pipefd[0], buf, sizeof(buf));
            if (n > 0) { append(buf, (size_t)n); continue; }
            if (n == -1 && errno == EINTR) continue;
            break; // EAGAIN, EOF or error
        }
    };

    int status = 0;
    while (true) {
        drain();

        pid_t w = waitpid(pid, &status, WNOHANG);
        if (w == pid) break;

        int elapsed_ms = (int)std::chrono::duration_cast<std::chrono::milliseconds>(
            std::chrono::steady_clock::now() - start).count();
        if (lim.timeout_ms > 0 && elapsed_ms > lim.timeout_ms) {
            res->timed_out = true;
            proc_signal_group(pid, SIGKILL);
            (void)waitpid(pid, &status, 0);
            break;
        }

        struct pollfd pfd;
        pfd.fd = pipefd[0];
        pfd.events = POLLIN;
        int slice = 50;
        if (lim.timeout_ms > 0) {
            int remaining = lim.timeout_ms - elapsed_ms;
            if (remaining < slice) slice = std::max(1, remaining);
        }
        (void)poll(&pfd, 1, slice);
    }

    drain();
    close(pipefd[0]);

    res->output = std::move(out);
    res->exit_code = decode_status(status);
    return true;
}

bool proc_spawn_sandboxed(const std::vector<std::string>& argv,
                          const std::string& cwd,
                          const ProcLimits& lim,
                          ChildProcess* child,
                          std::string* err) {
    std::string scratch;
    if (!err) err = &scratch;
    if (!child) { *err = "null child"; return false; }
    *child = ChildProcess{};
    if (argv.empty() || argv[0].empty()) {
        *err = "empty argv";
        return false;
    }
    const std::vector<std::string> eff_argv = with_wrapper(argv);
    std::vector<char*> cargv = to_cargv(eff_argv);

    int in_pipe[2] = {-1, -1}, out_pipe[2] = {-1, -1}, err_pipe[2] = {-1, -1};
    auto close_all = [&]() {
        for (int fd : {in_pipe[0], in_pipe[1], out_pipe[0], out_pipe[1], err_pipe[0], err_pipe[1]}) {
            if (fd >= 0) close(fd);
        }
    };
    if (pipe(in_pipe) != 0 || pipe(out_pipe) != 0 || pipe(err_pipe) != 0) {
        *err = std::string("pipe failed: ") + std::strerror(errno);
        close_all();
        return false;
    }
    // parent ends must not leak into later children
    set_cloexec(in_pipe[1]);
    set_cloexec(out_pipe[0]);
    set_cloexec(err_pipe[0]);

    pid_t pid = fork();
    if (pid < 0) {
        *err = std::string("fork failed: ") + std::strerror(errno);
        close_all();
        return false;
    }

    if (pid == 0) {
        (void)dup2(in_pipe[0], STDIN_FILENO);
        (void)dup2(out_pipe[1], STDOUT_FILENO);
        (void)dup2(err_pipe[1], STDERR_FILENO);
        exec_child(cargv, cwd, lim);
    }

    (void)setpgid(pid, pid);
    close(in_pipe[0]);
    close(out_pipe[1]);
    close(err_pipe[1]);
    set_nonblocking(out_pipe[0]);
    set_nonblocking(err_pipe[0]);

    child->pid = pid;
    child->stdin_fd = in_pipe[1];
    child->stdout_fd = out_pipe[0];
    child->stderr_fd = err_pipe[0];
    return true;
}

bool proc_write_all(int fd, const char* data, size_t n) {
    sigset_t pipe_set, old_mask, pending;
    sigemptyset(&pipe_set);
    sigaddset(&pipe_set, SIGPIPE);
    sigemptyset(&pending);
    (void)sigpending(&pending);
    const bool was_pending = sigismember(&pending, SIGPIPE) == 1;
    (void)pthread_sigmask(SIG_BLOCK, &pipe_set, &old_mask);

    bool ok = true;
    int saved = 0;
    size_t off = 0;
    while (off < n) {
        ssize_t w = ::write(fd, data + off, n - off);
        if (w < 0) {
            if (errno == EINTR) continue;
            saved = errno;
            ok = false;
            break;
        }
        off += (size_t)w;
    }

    // consume the SIGPIPE this write raised so it is not delivered on unmask
    if (!ok && saved == EPIPE && !was_pending) {
        struct timespec zero{0, 0};
        while (sigtimedwait(&pipe_set, nullptr, &zero) < 0 && errno == EINTR) {
        }
    }
    (void)pthread_sigmask(SIG_SETMASK, &old_mask, nullptr);
    if (!ok) errno = saved;
    return ok;
}

void proc_close_fds(ChildProcess* child) {
    if (!child) return;
    for (int* fd : {&child->stdin_fd, &child->stdout_fd, &child->stderr_fd}) {
        if (*fd >= 0) {
            close(*fd);
            *fd = -1;
        }
    }
}

void proc_signal_group(int pid, int sig) {
    if (pid <= 0) return;
    (void)kill(-pid, sig);
    (void)kill(pid, sig);
}

bool proc_try_reap(int pid, int* exit_code) {
    if (pid <= 0) return true;
    int status = 0;
    pid_t w = waitpid(pid, &status, WNOHANG);
    if (w == pid) {
        if (exit_code) *exit_code = decode_status(status);
        return true;
    }
    if (w < 0 && errno == ECHILD) {
        // already reaped elsewhere
        if (exit_code) *exit_code = 128;
        return true;
    }
    return false;
}

int proc_reap_with_deadline(int pid, int timeout_ms) {
    int code = 128;
    auto start = std::chrono::steady_clock::now();
    while (!proc_try_reap(pid, &code)) {
        int elapsed_ms = (int)std::chrono::duration_cast<std::chrono::milliseconds>(
            std::chrono::steady_clock::now() - start).count();
        if (elapsed_ms >= timeout_ms) {
            proc_signal_group(pid, SIGKILL);
            int status = 0;
            if (waitpid(pid, &status, 0) == pid) code = decode_status(status);
            return code;
        }
        struct timespec ts{0, 10 * 1000 * 1000};
        nanosleep(&ts, nullptr);
    }
    return code;
}

} // namespace agentbox
