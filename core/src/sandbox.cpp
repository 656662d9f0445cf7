#include "agentbox/sandbox.h"

#if defined(__linux__)

#include <cerrno>
#include <cstddef>
#include <cstdint>
#include <cstring>

#include <linux/audit.h>
#include <linux/filter.h>
#include <linux/seccomp.h>
#include <sys/prctl.h>
#include <sys/syscall.h>

#if defined(__x86_64__)
  #define AGENTBOX_AUDIT_ARCH AUDIT_ARCH_X86_64
#elif defined(__aarch64__)
  #define AGENTBOX_AUDIT_ARCH AUDIT_ARCH_AARCH64
#else
  #define AGENTBOX_AUDIT_ARCH 0
#endif

#define AGENTBOX_BPF_STMT(code, k) { (unsigned short)(code), 0, 0, (unsigned int)(k) }
#define AGENTBOX_BPF_JUMP(code, k, jt, jf) { (unsigned short)(code), (unsigned char)(jt), (unsigned char)(jf), (unsigned int)(k) }

// Appends SYS_<name> when this architecture defines it.
#define AGENTBOX_ALLOW(v, name) (v).push_back((unsigned int)SYS_##name)

namespace agentbox {

std::vector<unsigned int> seccomp_allowlist(const SeccompProfile& profile) {
    std::vector<unsigned int> v;

    // file I/O
    AGENTBOX_ALLOW(v, read);
    AGENTBOX_ALLOW(v, write);
    AGENTBOX_ALLOW(v, readv);
    AGENTBOX_ALLOW(v, writev);
    AGENTBOX_ALLOW(v, pread64);
    AGENTBOX_ALLOW(v, pwrite64);
    AGENTBOX_ALLOW(v, close);
    AGENTBOX_ALLOW(v, lseek);
    AGENTBOX_ALLOW(v, openat);
    AGENTBOX_ALLOW(v, fstat);
    AGENTBOX_ALLOW(v, newfstatat);
    AGENTBOX_ALLOW(v, statx);
    AGENTBOX_ALLOW(v, faccessat);
    AGENTBOX_ALLOW(v, readlinkat);
    AGENTBOX_ALLOW(v, getdents64);
    AGENTBOX_ALLOW(v, getcwd);
    AGENTBOX_ALLOW(v, chdir);
    AGENTBOX_ALLOW(v, fchdir);
    AGENTBOX_ALLOW(v, mkdirat);
    AGENTBOX_ALLOW(v, unlinkat);
    AGENTBOX_ALLOW(v, renameat);
    AGENTBOX_ALLOW(v, fchmod);
    AGENTBOX_ALLOW(v, fchmodat);
    AGENTBOX_ALLOW(v, ftruncate);
    AGENTBOX_ALLOW(v, fsync);
    AGENTBOX_ALLOW(v, fdatasync);
    AGENTBOX_ALLOW(v, fcntl);
    AGENTBOX_ALLOW(v, ioctl);
    AGENTBOX_ALLOW(v, dup);
    AGENTBOX_ALLOW(v, dup3);
    AGENTBOX_ALLOW(v, pipe2);
    AGENTBOX_ALLOW(v, ppoll);
    AGENTBOX_ALLOW(v, pselect6);
    AGENTBOX_ALLOW(v, epoll_create1);
    AGENTBOX_ALLOW(v, epoll_ctl);
    AGENTBOX_ALLOW(v, epoll_pwait);
    AGENTBOX_ALLOW(v, eventfd2);
#ifdef SYS_open
    AGENTBOX_ALLOW(v, open);
#endif
#ifdef SYS_stat
    AGENTBOX_ALLOW(v, stat);
    AGENTBOX_ALLOW(v, lstat);
#endif
#ifdef SYS_access
    AGENTBOX_ALLOW(v, access);
#endif
#ifdef SYS_readlink
    AGENTBOX_ALLOW(v, readlink);
#endif
#ifdef SYS_getdents
    AGENTBOX_ALLOW(v, getdents);
#endif
#ifdef SYS_mkdir
    AGENTBOX_ALLOW(v, mkdir);
    AGENTBOX_ALLOW(v, rmdir);
    AGENTBOX_ALLOW(v, unlink);
    AGENTBOX_ALLOW(v, rename);
#endif
#ifdef SYS_dup2
    AGENTBOX_ALLOW(v, dup2);
#endif
#ifdef SYS_pipe
    AGENTBOX_ALLOW(v, pipe);
#endif
#ifdef SYS_poll
    AGENTBOX_ALLOW(v, poll);
#endif
#ifdef SYS_select
    AGENTBOX_ALLOW(v, select);
#endif
#ifdef SYS_epoll_wait
    AGENTBOX_ALLOW(v, epoll_wait);
#endif
#ifdef SYS_faccessat2
    AGENTBOX_ALLOW(v, faccessat2);
#endif
#ifdef SYS_renameat2
    AGENTBOX_ALLOW(v, renameat2);
#endif

    // memory
    AGENTBOX_ALLOW(v, mmap);
    AGENTBOX_ALLOW(v, mprotect);
    AGENTBOX_ALLOW(v, munmap);
    AGENTBOX_ALLOW(v, mremap);
    AGENTBOX_ALLOW(v, madvise);
    AGENTBOX_ALLOW(v, brk);

    // signals
    AGENTBOX_ALLOW(v, rt_sigaction);
    AGENTBOX_ALLOW(v, rt_sigprocmask);
    AGENTBOX_ALLOW(v, rt_sigreturn);
    AGENTBOX_ALLOW(v, sigaltstack);
    AGENTBOX_ALLOW(v, kill);
    AGENTBOX_ALLOW(v, tgkill);

    // processes and threads (pip runs as a subprocess)
    AGENTBOX_ALLOW(v, clone);
    AGENTBOX_ALLOW(v, execve);
    AGENTBOX_ALLOW(v, exit);
    AGENTBOX_ALLOW(v, exit_group);
    AGENTBOX_ALLOW(v, wait4);
    AGENTBOX_ALLOW(v, waitid);
    AGENTBOX_ALLOW(v, set_tid_address);
    AGENTBOX_ALLOW(v, set_robust_list);
    AGENTBOX_ALLOW(v, futex);
    AGENTBOX_ALLOW(v, sched_yield);
    AGENTBOX_ALLOW(v, sched_getaffinity);
    AGENTBOX_ALLOW(v, getpid);
    AGENTBOX_ALLOW(v, getppid);
    AGENTBOX_ALLOW(v, gettid);
    AGENTBOX_ALLOW(v, getpgid);
    AGENTBOX_ALLOW(v, setpgid);
    AGENTBOX_ALLOW(v, getuid);
    AGENTBOX_ALLOW(v, geteuid);
    AGENTBOX_ALLOW(v, getgid);
    AGENTBOX_ALLOW(v, getegid);
    AGENTBOX_ALLOW(v, getgroups);
    AGENTBOX_ALLOW(v, getrlimit);
    AGENTBOX_ALLOW(v, prlimit64);
    AGENTBOX_ALLOW(v, getrusage);
    AGENTBOX_ALLOW(v, umask);
    AGENTBOX_ALLOW(v, uname);
    AGENTBOX_ALLOW(v, prctl);
#ifdef SYS_clone3
    AGENTBOX_ALLOW(v, clone3);
#endif
#ifdef SYS_fork
    AGENTBOX_ALLOW(v, fork);
    AGENTBOX_ALLOW(v, vfork);
#endif
#ifdef SYS_getpgrp
    AGENTBOX_ALLOW(v, getpgrp);
#endif
#ifdef SYS_arch_prctl
    AGENTBOX_ALLOW(v, arch_prctl);
#endif
#ifdef SYS_rseq
    AGENTBOX_ALLOW(v, rseq);
#endif

    // time and randomness
    AGENTBOX_ALLOW(v, clock_gettime);
    AGENTBOX_ALLOW(v, clock_getres);
    AGENTBOX_ALLOW(v, clock_nanosleep);
    AGENTBOX_ALLOW(v, gettimeofday);
    AGENTBOX_ALLOW(v, nanosleep);
    AGENTBOX_ALLOW(v, getrandom);
    AGENTBOX_ALLOW(v, sysinfo);
#ifdef SYS_time
    AGENTBOX_ALLOW(v, time);
#endif

    if (profile.allow_network) {
        AGENTBOX_ALLOW(v, socket);
        AGENTBOX_ALLOW(v, socketpair);
        AGENTBOX_ALLOW(v, connect);
        AGENTBOX_ALLOW(v, bind);
        AGENTBOX_ALLOW(v, listen);
        AGENTBOX_ALLOW(v, accept);
        AGENTBOX_ALLOW(v, accept4);
        AGENTBOX_ALLOW(v, sendto);
        AGENTBOX_ALLOW(v, recvfrom);
        AGENTBOX_ALLOW(v, sendmsg);
        AGENTBOX_ALLOW(v, recvmsg);
        AGENTBOX_ALLOW(v, shutdown);
        AGENTBOX_ALLOW(v, getsockname);
        AGENTBOX_ALLOW(v, getpeername);
        AGENTBOX_ALLOW(v, setsockopt);
        AGENTBOX_ALLOW(v, getsockopt);
    }
    return v;
}

std::string install_seccomp_filter(const SeccompProfile& profile) {
#if AGENTBOX_AUDIT_ARCH == 0
    (void)profile;
    return "seccomp: unsupported architecture";
#else
    std::vector<unsigned int> allow = seccomp_allowlist(profile);
    const size_t n = allow.size();
    // JEQ jump offsets are 8 bits wide
    if (n + 4 > 255) return "seccomp: allowlist too long";

    // Layout:
    //   [0] load arch
    //   [1] JEQ arch -> skip kill
    //   [2] KILL
    //   [3] load nr
    //   [4 .. 4+n-1] JEQ allow[s] -> ALLOW, or MPROTECT for mprotect
    //   [4+n]   KILL (default deny)
    //   [4+n+1] MPROTECT: load args[2] (prot)
    //   [4+n+2] JSET PROT_EXEC -> KILL
    //   [4+n+3] ALLOW
    //   [4+n+4] KILL
    //   [4+n+5] ALLOW
    std::vector<struct sock_filter> f;
    f.reserve(n + 10);

    f.push_back(AGENTBOX_BPF_STMT(BPF_LD | BPF_W | BPF_ABS, offsetof(struct seccomp_data, arch)));
    f.push_back(AGENTBOX_BPF_JUMP(BPF_JMP | BPF_JEQ | BPF_K, AGENTBOX_AUDIT_ARCH, 1, 0));
    f.push_back(AGENTBOX_BPF_STMT(BPF_RET | BPF_K, SECCOMP_RET_KILL_PROCESS));
    f.push_back(AGENTBOX_BPF_STMT(BPF_LD | BPF_W | BPF_ABS, offsetof(struct seccomp_data, nr)));

    const unsigned int mprotect_nr = (unsigned int)SYS_mprotect;
    for (size_t s = 0; s < n; s++) {
        unsigned char jt = (allow[s] == mprotect_nr) ? (unsigned char)(n - s)
                                                     : (unsigned char)(n + 4 - s);
        f.push_back(AGENTBOX_BPF_JUMP(BPF_JMP | BPF_JEQ | BPF_K, allow[s], jt, 0));
    }

    f.push_back(AGENTBOX_BPF_STMT(BPF_RET | BPF_K, SECCOMP_RET_KILL_PROCESS));
    f.push_back(AGENTBOX_BPF_STMT(BPF_LD | BPF_W | BPF_ABS,
                                  offsetof(struct seccomp_data, args) + 2 * sizeof(uint64_t)));
    f.push_back(AGENTBOX_BPF_JUMP(BPF_JMP | BPF_JSET | BPF_K, 0x4, 1, 0));
    f.push_back(AGENTBOX_BPF_STMT(BPF_RET | BPF_K, SECCOMP_RET_ALLOW));
    f.push_back(AGENTBOX_BPF_STMT(BPF_RET | BPF_K, SECCOMP_RET_KILL_PROCESS));
    f.push_back(AGENTBOX_BPF_STMT(BPF_RET | BPF_K, SECCOMP_RET_ALLOW));

    struct sock_fprog prog = {};
    prog.len = (unsigned short)f.size();
    prog.filter = f.data();

    if (prctl(PR_SET_SECCOMP, SECCOMP_MODE_FILTER, &prog, 0, 0) != 0) {
        return std::string("seccomp install failed: ") + std::strerror(errno);
    }
    return "";
#endif
}

bool seccomp_available() {
    // 0: available and inactive, 2: filter already active, -1/EINVAL: absent
    return prctl(PR_GET_SECCOMP, 0, 0, 0, 0) >= 0;
}

} // namespace agentbox

#else // !__linux__

namespace agentbox {

std::vector<unsigned int> seccomp_allowlist(const SeccompProfile&) {
    return {};
}

std::string install_seccomp_filter(const SeccompProfile&) {
    return "";
}

bool seccomp_available() {
    return false;
}

} // namespace agentbox

#endif
