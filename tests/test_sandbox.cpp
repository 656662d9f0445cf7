#include "test_common.h"
#include "agentbox/sandbox.h"

#include <algorithm>
#include <csignal>

#ifdef __linux__
#include <unistd.h>
#include <sys/prctl.h>
#include <sys/socket.h>
#include <sys/syscall.h>
#include <sys/types.h>
#include <sys/wait.h>
#endif

static bool has(const std::vector<unsigned int>& v, long nr) {
    return std::find(v.begin(), v.end(), (unsigned int)nr) != v.end();
}

int main() {
    bool avail = agentbox::seccomp_available();
#ifdef __linux__
    expect_true(avail, "seccomp should be available on Linux");
#else
    expect_true(!avail, "seccomp should not be available on non-Linux");
    expect_true(agentbox::install_seccomp_filter(agentbox::SeccompProfile{}).empty(),
                "install_seccomp_filter should no-op on non-Linux");
#endif

#ifdef __linux__
    // Test 1: network syscalls follow the profile
    {
        agentbox::SeccompProfile closed;
        agentbox::SeccompProfile open;
        open.allow_network = true;
        auto a = agentbox::seccomp_allowlist(closed);
        auto b = agentbox::seccomp_allowlist(open);
        expect_true(has(a, SYS_read) && has(a, SYS_write) && has(a, SYS_execve), "basic I/O allowed");
        expect_true(!has(a, SYS_ptrace), "ptrace blocked");
        expect_true(!has(a, SYS_socket), "socket blocked without network");
        expect_true(has(b, SYS_socket), "socket allowed with network");
        expect_true(b.size() > a.size(), "network profile is a superset");
    }

    // Test 2: a filtered child can still write
    {
        pid_t pid = fork();
        if (pid == 0) {
            prctl(PR_SET_NO_NEW_PRIVS, 1, 0, 0, 0);
            std::string err = agentbox::install_seccomp_filter(agentbox::SeccompProfile{});
            if (!err.empty()) _exit(1);
            const char* msg = "seccomp_ok\n";
            ssize_t n = write(STDOUT_FILENO, msg, 11);
            _exit(n > 0 ? 0 : 2);
        }
        int status = 0;
        waitpid(pid, &status, 0);
        expect_true(WIFEXITED(status) && WEXITSTATUS(status) == 0,
                    "child with seccomp should exit cleanly after write()");
    }

    // Test 3: a filtered child dies on socket()
    {
        pid_t pid = fork();
        if (pid == 0) {
            prctl(PR_SET_NO_NEW_PRIVS, 1, 0, 0, 0);
            if (!agentbox::install_seccomp_filter(agentbox::SeccompProfile{}).empty()) _exit(1);
            int fd = socket(AF_INET, SOCK_STREAM, 0);
            _exit(fd >= 0 ? 0 : 3);
        }
        int status = 0;
        waitpid(pid, &status, 0);
        expect_true(WIFSIGNALED(status) && WTERMSIG(status) == SIGSYS, "socket() kills the child");
    }
#endif

    std::cerr << "test_sandbox: ALL PASSED" << std::endl;
    return 0;
}
