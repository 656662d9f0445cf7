#pragma once

#include <json-c/json.h>

#include <stdexcept>
#include <string>

namespace agentbox {

enum class ErrorKind {
    PARSING,
    EXECUTION,
    EXECUTION_TIMEOUT,
    RESULT_DECODE,
    NAME_ERROR,
    STEP_LIMIT,
    GENERATION,
    ENVIRONMENT_UNAVAILABLE,
    DEPENDENCY_INSTALL,
    TOOL_SETUP,
};

const char* error_kind_name(ErrorKind k);

// Base of every error the agent core reports.
//
// All kinds are "reported": the owning loop records them on the current
// ActionStep and keeps going. StepLimitExceeded is the one terminal kind.
class AgentError : public std::runtime_error {
public:
    AgentError(ErrorKind kind, const std::string& message)
        : std::runtime_error(message), kind_(kind) {}

    ErrorKind kind() const { return kind_; }
    const char* kind_name() const { return error_kind_name(kind_); }
    virtual bool is_terminal() const { return false; }

    // {"type": <kind name>, "message": <what()>}; caller owns the object.
    json_object* to_json() const;

private:
    ErrorKind kind_;
};

// Model output did not contain a usable action.
class ParsingError : public AgentError {
public:
    explicit ParsingError(const std::string& message)
        : AgentError(ErrorKind::PARSING, message) {}
};

// Sandboxed code failed. diagnostics() holds everything the environment
// printed, interpreter traceback included ("SyntaxError" shows up there).
class ExecutionError : public AgentError {
public:
    ExecutionError(const std::string& message, std::string diagnostics)
        : AgentError(ErrorKind::EXECUTION, message), diagnostics_(std::move(diagnostics)) {}

    const std::string& diagnostics() const { return diagnostics_; }

protected:
    ExecutionError(ErrorKind kind, const std::string& message, std::string diagnostics)
        : AgentError(kind, message), diagnostics_(std::move(diagnostics)) {}

private:
    std::string diagnostics_;
};

using CodeExecutionError = ExecutionError;

class ExecutionTimeout : public ExecutionError {
public:
    ExecutionTimeout(const std::string& message, std::string partial_output)
        : ExecutionError(ErrorKind::EXECUTION_TIMEOUT, message, std::move(partial_output)) {}
};

// The final-answer artifact was missing, truncated or not a valid wire value.
class ResultDecodeError : public ExecutionError {
public:
    ResultDecodeError(const std::string& message, std::string diagnostics = {})
        : ExecutionError(ErrorKind::RESULT_DECODE, message, std::move(diagnostics)) {}
};

class VariableNotFound : public ExecutionError {
public:
    VariableNotFound(std::string name, std::string diagnostics)
        : ExecutionError(ErrorKind::NAME_ERROR, "name '" + name + "' is not defined", std::move(diagnostics)),
          name_(std::move(name)) {}

    const std::string& name() const { return name_; }

private:
    std::string name_;
};

class StepLimitExceeded : public AgentError {
public:
    explicit StepLimitExceeded(int max_steps)
        : AgentError(ErrorKind::STEP_LIMIT, "Reached max steps (" + std::to_string(max_steps) + ")"),
          max_steps_(max_steps) {}

    bool is_terminal() const override { return true; }
    int max_steps() const { return max_steps_; }

private:
    int max_steps_;
};

class GenerationError : public AgentError {
public:
    explicit GenerationError(const std::string& message)
        : AgentError(ErrorKind::GENERATION, message) {}
};

// --- construction-time failures of the sandbox ---

class EnvironmentUnavailable : public AgentError {
public:
    explicit EnvironmentUnavailable(const std::string& message)
        : AgentError(ErrorKind::ENVIRONMENT_UNAVAILABLE, message) {}
};

class DependencyInstallError : public AgentError {
public:
    DependencyInstallError(std::string package, std::string install_log)
        : AgentError(ErrorKind::DEPENDENCY_INSTALL, "failed to install package '" + package + "'"),
          package_(std::move(package)), install_log_(std::move(install_log)) {}

    const std::string& package() const { return package_; }
    const std::string& install_log() const { return install_log_; }

private:
    std::string package_;
    std::string install_log_;
};

class ToolSetupError : public AgentError {
public:
    ToolSetupError(const std::string& message, std::string diagnostics)
        : AgentError(ErrorKind::TOOL_SETUP, message), diagnostics_(std::move(diagnostics)) {}

    const std::string& diagnostics() const { return diagnostics_; }

private:
    std::string diagnostics_;
};

} // namespace agentbox
