#pragma once

#include <cstddef>
#include <string>
#include <vector>

namespace agentbox {

enum class Profile { DEV, PROD };

// Detect profile from AGENTBOX_PROFILE env var. Default: DEV.
Profile detect_profile();

const char* profile_name(Profile p);

// Apply profile defaults: sets env vars that are not already set.
// DEV: lenient (no seccomp, generous timeouts)
// PROD: strict (seccomp on, memory cap, tight timeouts)
void apply_profile_defaults(Profile p);

enum class Backend { PROCESS, DOCKER };

const char* backend_name(Backend b);

struct SandboxConfig {
    Backend backend{Backend::PROCESS};
    std::string python{"python3"};
    std::string docker_image{"python:3.11-slim"};
    std::string docker_bin{"docker"};
    // `docker run --user` value; empty keeps the image's user.
    std::string docker_user;

    int exec_timeout_ms{30000};
    int startup_timeout_ms{20000};
    int interrupt_grace_ms{2000};
    int install_timeout_ms{300000};
    size_t output_max_bytes{1024 * 1024};

    bool enable_seccomp{false};
    bool seccomp_allow_network{false};
    size_t rlimit_as_mb{0};
    int rlimit_cpu_sec{0};

    // Parent of per-session work directories; empty means $TMPDIR or /tmp.
    std::string work_root;

    // Extra `pip install` arguments, e.g. {"--no-index"} for offline runs.
    std::vector<std::string> pip_extra_args;
};

// Reads the AGENTBOX_* environment (after profile defaults, if applied).
// Unparseable numbers keep the built-in default.
SandboxConfig sandbox_config_from_env();

// Small env helpers shared by the CLI.
std::string env_string(const char* name, const std::string& def);
long long env_int(const char* name, long long def);
bool env_flag(const char* name, bool def);

} // namespace agentbox
