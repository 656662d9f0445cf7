#pragma once

#include "agentbox/config.h"
#include "agentbox/log.h"
#include "agentbox/state_channel.h"

#include <memory>
#include <string>

namespace agentbox {

std::string slurp(const std::string& path);
std::string gen_run_id();

// JSON object text of wire values -> StateMap.
bool state_from_json_text(const std::string& text, StateMap* out, std::string* err);

// Leveled log on stderr (AGENTBOX_LOG_LEVEL) plus an optional JSONL event
// log (AGENTBOX_EVENT_LOG=<path>).
struct CliLogging {
    std::unique_ptr<EventLog> events;
    std::unique_ptr<AgentLogger> logger;
};
CliLogging make_cli_logging(const std::string& run_id);

// Profile defaults first, then the AGENTBOX_* environment.
SandboxConfig cli_sandbox_config();

} // namespace agentbox
