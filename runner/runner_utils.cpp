#include "runner_utils.h"

#include "agentbox/json_util.h"
#include "agentbox/value.h"

#include <chrono>
#include <cstdlib>
#include <fstream>
#include <iostream>
#include <random>
#include <sstream>
#include <stdexcept>

namespace agentbox {

std::string slurp(const std::string& path) {
    std::ifstream f(path, std::ios::binary);
    if (!f) throw std::runtime_error("cannot open: " + path);
    std::stringstream ss; ss << f.rdbuf();
    return ss.str();
}

std::string gen_run_id() {
    const char* det = std::getenv("AGENTBOX_DETERMINISTIC_RUN_ID");

    uint64_t seed = 0;
    if (det && std::string(det) == "1") {
        seed = 1234567ULL;
    } else {
        uint64_t t = (uint64_t)std::chrono::high_resolution_clock::now().time_since_epoch().count();
        uint64_t r = 0x9e3779b97f4a7c15ULL;
        try {
            std::random_device rd;
            r = ((uint64_t)rd() << 32) ^ (uint64_t)rd();
        } catch (const std::exception& e) {
            std::cerr << "random_device unavailable (" << e.what() << "), using clock seed\n";
        }
        seed = t ^ r;
    }

    std::mt19937_64 rng{seed};
    uint64_t a = rng();
    uint64_t b = rng();
    std::ostringstream oss;
    oss << std::hex << a << b;
    return oss.str();
}

bool state_from_json_text(const std::string& text, StateMap* out, std::string* err) {
    json_util::Doc d;
    if (!json_util::parse_ok(text, &d) || !d.root || !json_object_is_type(d.root, json_type_object)) {
        *err = "state must be a JSON object";
        return false;
    }
    StateMap m;
    json_object_object_foreach(d.root, k, v) {
        Value val;
        if (!value_from_json(v, &val, err)) {
            *err = std::string(k) + ": " + *err;
            return false;
        }
        m[k] = std::move(val);
    }
    *out = std::move(m);
    return true;
}

CliLogging make_cli_logging(const std::string& run_id) {
    CliLogging c;
    c.logger = std::make_unique<AgentLogger>(std::cerr, log_level_from_name(env_string("AGENTBOX_LOG_LEVEL", "info")));
    const std::string ev = env_string("AGENTBOX_EVENT_LOG", "");
    if (!ev.empty()) {
        c.events = std::make_unique<EventLog>(run_id, ev);
        if (!c.events->ok()) {
            c.logger->error("cannot open event log " + ev);
            c.events.reset();
        } else {
            c.logger->attach(c.events.get());
        }
    }
    return c;
}

SandboxConfig cli_sandbox_config() {
    apply_profile_defaults(detect_profile());
    return sandbox_config_from_env();
}

} // namespace agentbox
