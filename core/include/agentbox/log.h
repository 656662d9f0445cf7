#pragma once

#include <json-c/json.h>

#include <fstream>
#include <mutex>
#include <ostream>
#include <string>

namespace agentbox {

enum class LogLevel { ERROR = 0, INFO = 1, DEBUG = 2 };

const char* log_level_name(LogLevel l);
// "error"/"info"/"debug" (any case); unknown -> INFO.
LogLevel log_level_from_name(const std::string& s);

// Structured run log: one canonical JSON line per event,
//   {"event","payload","run_id","step","ts"} with sorted keys.
class EventLog {
public:
    EventLog(std::string run_id, const std::string& path);

    bool ok() const { return out_.good(); }
    const std::string& path() const { return path_; }

    // Takes ownership of `payload` (may be nullptr).
    void event(int step, const std::string& name, json_object* payload);

private:
    std::string run_id_;
    std::string path_;
    std::ofstream out_;
    std::mutex mu_;
};

// Leveled text logger handed to components explicitly. Lines go to the
// stream given at construction; an attached EventLog also receives
// every structured event.
class AgentLogger {
public:
    explicit AgentLogger(std::ostream& out, LogLevel level = LogLevel::INFO)
        : out_(&out), level_(level) {}

    AgentLogger(const AgentLogger&) = delete;
    AgentLogger& operator=(const AgentLogger&) = delete;

    LogLevel level() const { return level_; }
    void set_level(LogLevel l) { level_ = l; }
    bool enabled(LogLevel l) const { return (int)l <= (int)level_; }

    void attach(EventLog* events) { events_ = events; }

    void log(LogLevel l, const std::string& msg);
    void error(const std::string& msg) { log(LogLevel::ERROR, msg); }
    void info(const std::string& msg) { log(LogLevel::INFO, msg); }
    void debug(const std::string& msg) { log(LogLevel::DEBUG, msg); }

    // Forwards to the attached EventLog (payload ownership is taken either way).
    void event(int step, const std::string& name, json_object* payload);

private:
    std::ostream* out_;
    LogLevel level_;
    EventLog* events_{nullptr};
    std::mutex mu_;
};

// Logger that drops everything; default for components built without one.
AgentLogger& null_logger();

} // namespace agentbox
