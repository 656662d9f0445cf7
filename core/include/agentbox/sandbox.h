#pragma once

// seccomp-BPF syscall allowlist for sandbox children.
//
// Allowlist-only: a syscall not on the list kills the process (SIGSYS).
// Opt-in via ProcLimits.enable_seccomp / AGENTBOX_SECCOMP_ENABLE=1.
//
// The list is built from <sys/syscall.h> names, so it follows whatever
// architecture the build targets; syscalls an architecture lacks are
// simply skipped. mprotect is allowed only without PROT_EXEC.
//
// BLOCKED (notable): ptrace, mount, umount2, pivot_root, reboot, setns,
// unshare, kexec_load, init_module, finit_module, bpf, personality, and
// the socket family unless SeccompProfile.allow_network is set.

#include <string>
#include <vector>

namespace agentbox {

struct SeccompProfile {
    bool allow_network{false};
};

// Syscall numbers the profile allows on this architecture.
std::vector<unsigned int> seccomp_allowlist(const SeccompProfile& profile);

// Install the filter on the calling process. Must be called AFTER
// prctl(PR_SET_NO_NEW_PRIVS, 1). Returns empty string on success, error
// message on failure. On non-Linux platforms, returns success (no-op).
std::string install_seccomp_filter(const SeccompProfile& profile);

// Check if seccomp is available on this system.
bool seccomp_available();

} // namespace agentbox
