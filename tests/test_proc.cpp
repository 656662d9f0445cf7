#include "test_common.h"

#include "agentbox/proc.h"

#include <cerrno>
#include <csignal>
#include <string>
#include <vector>

#include <poll.h>
#include <unistd.h>

using namespace agentbox;

static std::string read_until(int fd, const std::string& want, int timeout_ms) {
    std::string got;
    char buf[256];
    int waited = 0;
    while (got.find(want) == std::string::npos && waited < timeout_ms) {
        struct pollfd pfd;
        pfd.fd = fd;
        pfd.events = POLLIN;
        pfd.revents = 0;
        int n = poll(&pfd, 1, 50);
        waited += 50;
        if (n <= 0) continue;
        ssize_t k = read(fd, buf, sizeof(buf));
        if (k > 0) got.append(buf, (size_t)k);
        else if (k == 0) break;
        else if (errno != EAGAIN && errno != EINTR) break;
    }
    return got;
}

int main() {
    // Test 1: quoted argv splitting
    {
        auto v = split_argv_quoted("firejail --quiet 'a b' \"c \\\"d\\\"\" ''");
        expect_eq_ll((long long)v.size(), 5, "token count");
        expect_eq_str(v[2], "a b", "single quotes");
        expect_eq_str(v[3], "c \"d\"", "escaped double quotes");
        expect_eq_str(v[4], "", "empty quoted token");
        expect_true(split_argv_quoted("'unterminated").empty(), "parse error yields empty");
    }

    // Test 2: one-shot capture with exit code and merged stderr
    {
        ProcLimits lim;
        ProcResult res;
        bool ok = proc_run_capture_sandboxed({"/bin/sh", "-c", "echo out; echo err 1>&2; exit 3"}, "", lim, &res);
        expect_true(ok, "process should start: " + res.error);
        expect_eq_ll(res.exit_code, 3, "exit code");
        expect_true(contains(res.output, "out") && contains(res.output, "err"), "stdout and stderr merged");
        expect_true(!res.timed_out, "no timeout");
    }

    // Test 3: timeout and output cap
    {
        ProcLimits lim;
        lim.timeout_ms = 200;
        ProcResult res;
        expect_true(proc_run_capture_sandboxed({"/bin/sh", "-c", "sleep 5"}, "", lim, &res), "sleep starts");
        expect_true(res.timed_out, "sleep should time out");

        ProcLimits small;
        small.stdout_max_bytes = 10;
        ProcResult big;
        expect_true(proc_run_capture_sandboxed({"/bin/sh", "-c", "yes | head -c 1000"}, "", small, &big), "yes starts");
        expect_eq_ll((long long)big.output.size(), 10, "output capped");
        expect_true(big.output_truncated, "truncation flagged");
    }

    // Test 4: cwd and exec failure
    {
        ProcLimits lim;
        ProcResult res;
        expect_true(proc_run_capture_sandboxed({"/bin/pwd"}, "/", lim, &res), "pwd starts");
        expect_eq_str(res.output, "/\n", "child runs in cwd");

        ProcResult missing;
        expect_true(proc_run_capture_sandboxed({"/nonexistent/binary"}, "", lim, &missing), "fork still succeeds");
        expect_eq_ll(missing.exit_code, 127, "exec failure exit code");
    }

    // Test 5: long-lived child with pipes
    {
        ProcLimits lim;
        ChildProcess child;
        std::string err;
        expect_true(proc_spawn_sandboxed({"/bin/cat"}, "", lim, &child, &err), "cat spawns: " + err);
        expect_true(child.pid > 0 && child.stdin_fd >= 0 && child.stdout_fd >= 0, "descriptors set");

        const std::string ping = "ping\n";
        expect_true(write(child.stdin_fd, ping.data(), ping.size()) == (ssize_t)ping.size(), "write to child");
        expect_true(contains(read_until(child.stdout_fd, "ping", 2000), "ping"), "echo from child");

        int code = -1;
        expect_true(!proc_try_reap(child.pid, &code), "child still running");
        close(child.stdin_fd);
        child.stdin_fd = -1;
        expect_eq_ll(proc_reap_with_deadline(child.pid, 2000), 0, "cat exits cleanly on EOF");
        proc_close_fds(&child);
        expect_true(child.stdout_fd == -1 && child.stderr_fd == -1, "fds closed");
    }

    // Test 6: group kill of a stuck child
    {
        ProcLimits lim;
        ChildProcess child;
        std::string err;
        expect_true(proc_spawn_sandboxed({"/bin/sh", "-c", "sleep 30"}, "", lim, &child, &err), "sleep spawns");
        proc_signal_group(child.pid, SIGKILL);
        expect_eq_ll(proc_reap_with_deadline(child.pid, 2000), 128 + SIGKILL, "killed by SIGKILL");
        proc_close_fds(&child);
    }

    // Test 7: writing to a child that has exited fails with EPIPE instead of
    // raising SIGPIPE, and the process-wide disposition stays untouched
    {
        ProcLimits lim;
        ChildProcess child;
        std::string err;
        expect_true(proc_spawn_sandboxed({"/bin/true"}, "", lim, &child, &err), "true spawns");
        expect_eq_ll(proc_reap_with_deadline(child.pid, 2000), 0, "true exits");

        struct sigaction sa;
        expect_true(sigaction(SIGPIPE, nullptr, &sa) == 0, "query SIGPIPE");
        expect_true(sa.sa_handler == SIG_DFL, "spawn leaves SIGPIPE at default");

        const std::string frame = "AGBX 2\n{}";
        errno = 0;
        bool ok = proc_write_all(child.stdin_fd, frame.data(), frame.size());
        expect_true(!ok, "write to a dead reader fails");
        expect_eq_ll(errno, EPIPE, "EPIPE reported");

        sigset_t pending;
        sigemptyset(&pending);
        sigpending(&pending);
        expect_true(sigismember(&pending, SIGPIPE) == 0, "no SIGPIPE left pending");
        proc_close_fds(&child);
    }

    std::cerr << "test_proc: ALL PASSED" << std::endl;
    return 0;
}
