#include "agentbox/config.h"
#include "agentbox/proc.h"

#include <algorithm>
#include <cctype>
#include <cerrno>
#include <cstdlib>

namespace agentbox {

static std::string lower(std::string s) {
    std::transform(s.begin(), s.end(), s.begin(),
                   [](unsigned char c) { return std::tolower(c); });
    return s;
}

Profile detect_profile() {
    const char* env = std::getenv("AGENTBOX_PROFILE");
    if (!env) return Profile::DEV;

    std::string val = lower(env);
    if (val == "prod" || val == "production") return Profile::PROD;
    return Profile::DEV;
}

const char* profile_name(Profile p) {
    switch (p) {
        case Profile::PROD: return "prod";
        case Profile::DEV:  return "dev";
    }
    return "dev";
}

void apply_profile_defaults(Profile p) {
    // SAFETY: Must be called before any worker threads are created.
    // setenv() is not thread-safe with getenv() on some platforms.
    constexpr int NO_OVERWRITE = 0;

    switch (p) {
        case Profile::DEV:
            setenv("AGENTBOX_SECCOMP_ENABLE",      "0",     NO_OVERWRITE);
            setenv("AGENTBOX_EXEC_TIMEOUT_MS",     "60000", NO_OVERWRITE);
            setenv("AGENTBOX_STARTUP_TIMEOUT_MS",  "30000", NO_OVERWRITE);
            break;

        case Profile::PROD:
            setenv("AGENTBOX_SECCOMP_ENABLE",      "1",     NO_OVERWRITE);
            setenv("AGENTBOX_EXEC_TIMEOUT_MS",     "20000", NO_OVERWRITE);
            setenv("AGENTBOX_STARTUP_TIMEOUT_MS",  "20000", NO_OVERWRITE);
            setenv("AGENTBOX_RLIMIT_AS_MB",        "2048",  NO_OVERWRITE);
            setenv("AGENTBOX_RLIMIT_CPU_SEC",      "300",   NO_OVERWRITE);
            // pip may only use what the image already ships
            setenv("AGENTBOX_PIP_EXTRA_ARGS",      "--no-index", NO_OVERWRITE);
            break;
    }
}

const char* backend_name(Backend b) {
    switch (b) {
        case Backend::PROCESS: return "process";
        case Backend::DOCKER:  return "docker";
    }
    return "process";
}

std::string env_string(const char* name, const std::string& def) {
    const char* v = std::getenv(name);
    if (!v || !*v) return def;
    return v;
}

long long env_int(const char* name, long long def) {
    const char* v = std::getenv(name);
    if (!v || !*v) return def;
    errno = 0;
    char* end = nullptr;
    long long n = std::strtoll(v, &end, 10);
    if (errno != 0 || end == v || *end != '\0' || n < 0) return def;
    return n;
}

bool env_flag(const char* name, bool def) {
    const char* v = std::getenv(name);
    if (!v || !*v) return def;
    std::string s = lower(v);
    if (s == "1" || s == "true" || s == "yes" || s == "on") return true;
    if (s == "0" || s == "false" || s == "no" || s == "off") return false;
    return def;
}

SandboxConfig sandbox_config_from_env() {
    SandboxConfig c;

    std::string backend = lower(env_string("AGENTBOX_BACKEND", "process"));
    c.backend = (backend == "docker") ? Backend::DOCKER : Backend::PROCESS;

    c.python = env_string("AGENTBOX_PYTHON", c.python);
    c.docker_image = env_string("AGENTBOX_DOCKER_IMAGE", c.docker_image);
    c.docker_bin = env_string("AGENTBOX_DOCKER_BIN", c.docker_bin);
    c.docker_user = env_string("AGENTBOX_DOCKER_USER", c.docker_user);

    c.exec_timeout_ms = (int)env_int("AGENTBOX_EXEC_TIMEOUT_MS", c.exec_timeout_ms);
    c.startup_timeout_ms = (int)env_int("AGENTBOX_STARTUP_TIMEOUT_MS", c.startup_timeout_ms);
    c.interrupt_grace_ms = (int)env_int("AGENTBOX_INTERRUPT_GRACE_MS", c.interrupt_grace_ms);
    c.install_timeout_ms = (int)env_int("AGENTBOX_INSTALL_TIMEOUT_MS", c.install_timeout_ms);
    c.output_max_bytes = (size_t)env_int("AGENTBOX_OUTPUT_MAX_BYTES", (long long)c.output_max_bytes);

    c.enable_seccomp = env_flag("AGENTBOX_SECCOMP_ENABLE", c.enable_seccomp);
    c.seccomp_allow_network = env_flag("AGENTBOX_SECCOMP_ALLOW_NETWORK", c.seccomp_allow_network);
    c.rlimit_as_mb = (size_t)env_int("AGENTBOX_RLIMIT_AS_MB", (long long)c.rlimit_as_mb);
    c.rlimit_cpu_sec = (int)env_int("AGENTBOX_RLIMIT_CPU_SEC", c.rlimit_cpu_sec);

    c.work_root = env_string("AGENTBOX_WORK_ROOT", "");

    std::string pip = env_string("AGENTBOX_PIP_EXTRA_ARGS", "");
    if (!pip.empty()) c.pip_extra_args = split_argv_quoted(pip);

    return c;
}

} // namespace agentbox
