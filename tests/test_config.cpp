#include "test_common.h"
#include "agentbox/config.h"
#include <cstdlib>

static std::string getenv_str(const char* k) {
    const char* v = std::getenv(k);
    return v ? v : "";
}

int main() {
    // Test 1: Default profile is DEV
    unsetenv("AGENTBOX_PROFILE");
    auto p = agentbox::detect_profile();
    expect_true(p == agentbox::Profile::DEV, "default should be DEV");

    // Test 2: PROD detection, case insensitive
    setenv("AGENTBOX_PROFILE", "prod", 1);
    expect_true(agentbox::detect_profile() == agentbox::Profile::PROD, "should detect PROD");
    setenv("AGENTBOX_PROFILE", "PRODUCTION", 1);
    expect_true(agentbox::detect_profile() == agentbox::Profile::PROD, "should detect PRODUCTION");

    // Test 3: Apply defaults (won't override existing)
    setenv("AGENTBOX_EXEC_TIMEOUT_MS", "42", 1);
    unsetenv("AGENTBOX_SECCOMP_ENABLE");
    agentbox::apply_profile_defaults(agentbox::Profile::PROD);
    expect_eq_str(getenv_str("AGENTBOX_EXEC_TIMEOUT_MS"), "42", "should NOT override pre-existing env var");
    expect_eq_str(getenv_str("AGENTBOX_SECCOMP_ENABLE"), "1", "PROD should enable seccomp");
    expect_eq_str(getenv_str("AGENTBOX_PIP_EXTRA_ARGS"), "--no-index", "PROD installs offline");

    // Test 4: names
    expect_eq_str(agentbox::profile_name(agentbox::Profile::DEV), "dev", "dev name");
    expect_eq_str(agentbox::profile_name(agentbox::Profile::PROD), "prod", "prod name");
    expect_eq_str(agentbox::backend_name(agentbox::Backend::DOCKER), "docker", "docker name");

    // Test 5: sandbox config from env
    {
        setenv("AGENTBOX_BACKEND", "Docker", 1);
        setenv("AGENTBOX_DOCKER_IMAGE", "python:3.12", 1);
        setenv("AGENTBOX_OUTPUT_MAX_BYTES", "4096", 1);
        setenv("AGENTBOX_INTERRUPT_GRACE_MS", "-5", 1);
        setenv("AGENTBOX_STARTUP_TIMEOUT_MS", "soon", 1);
        setenv("AGENTBOX_SECCOMP_ALLOW_NETWORK", "yes", 1);
        setenv("AGENTBOX_PIP_EXTRA_ARGS", "--no-index --find-links '/opt/wheel house'", 1);

        auto c = agentbox::sandbox_config_from_env();
        expect_true(c.backend == agentbox::Backend::DOCKER, "backend parsed");
        expect_eq_str(c.docker_image, "python:3.12", "image parsed");
        expect_eq_ll(c.exec_timeout_ms, 42, "exec timeout parsed");
        expect_eq_ll((long long)c.output_max_bytes, 4096, "output cap parsed");
        expect_eq_ll(c.interrupt_grace_ms, 2000, "negative value keeps default");
        expect_eq_ll(c.startup_timeout_ms, 20000, "garbage keeps default");
        expect_true(c.enable_seccomp, "seccomp flag from profile");
        expect_true(c.seccomp_allow_network, "network flag parsed");
        expect_eq_ll((long long)c.pip_extra_args.size(), 3, "pip args split");
        expect_eq_str(c.pip_extra_args[2], "/opt/wheel house", "quoted pip arg");
    }

    // Test 6: built-in defaults
    {
        const char* keys[] = {"AGENTBOX_BACKEND", "AGENTBOX_DOCKER_IMAGE", "AGENTBOX_OUTPUT_MAX_BYTES",
                              "AGENTBOX_INTERRUPT_GRACE_MS", "AGENTBOX_STARTUP_TIMEOUT_MS",
                              "AGENTBOX_SECCOMP_ALLOW_NETWORK", "AGENTBOX_PIP_EXTRA_ARGS",
                              "AGENTBOX_EXEC_TIMEOUT_MS", "AGENTBOX_SECCOMP_ENABLE",
                              "AGENTBOX_RLIMIT_AS_MB", "AGENTBOX_RLIMIT_CPU_SEC", "AGENTBOX_PROFILE"};
        for (const char* k : keys) unsetenv(k);
        auto c = agentbox::sandbox_config_from_env();
        expect_true(c.backend == agentbox::Backend::PROCESS, "default backend");
        expect_eq_str(c.python, "python3", "default python");
        expect_eq_ll(c.exec_timeout_ms, 30000, "default exec timeout");
        expect_true(!c.enable_seccomp, "seccomp off by default");
        expect_true(c.pip_extra_args.empty(), "no pip args by default");
    }

    std::cerr << "test_config: ALL PASSED" << std::endl;
    return 0;
}
