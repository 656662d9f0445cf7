#include "agentbox/errors.h"

namespace agentbox {

const char* error_kind_name(ErrorKind k) {
    switch (k) {
        case ErrorKind::PARSING:                 return "ParsingError";
        case ErrorKind::EXECUTION:               return "ExecutionError";
        case ErrorKind::EXECUTION_TIMEOUT:       return "ExecutionTimeout";
        case ErrorKind::RESULT_DECODE:           return "ResultDecodeError";
        case ErrorKind::NAME_ERROR:              return "NameError";
        case ErrorKind::STEP_LIMIT:              return "StepLimitExceeded";
        case ErrorKind::GENERATION:              return "GenerationError";
        case ErrorKind::ENVIRONMENT_UNAVAILABLE: return "EnvironmentUnavailable";
        case ErrorKind::DEPENDENCY_INSTALL:      return "DependencyInstallError";
        case ErrorKind::TOOL_SETUP:              return "ToolSetupError";
    }
    return "AgentError";
}

json_object* AgentError::to_json() const {
    json_object* o = json_object_new_object();
    json_object_object_add(o, "type", json_object_new_string(kind_name()));
    std::string msg = what();
    json_object_object_add(o, "message", json_object_new_string_len(msg.c_str(), (int)msg.size()));
    return o;
}

} // namespace agentbox
