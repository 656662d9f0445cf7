#include "agentbox/log.h"
#include "agentbox/json_util.h"

#include <algorithm>
#include <cctype>
#include <chrono>
#include <ctime>
#include <iomanip>
#include <sstream>
#include <streambuf>

namespace agentbox {

static std::string iso_now() {
    using namespace std::chrono;
    auto now = system_clock::now();
    std::time_t t = system_clock::to_time_t(now);
    std::tm tm{};
    gmtime_r(&t, &tm);
    std::ostringstream oss;
    oss << std::put_time(&tm, "%Y-%m-%dT%H:%M:%SZ");
    return oss.str();
}

const char* log_level_name(LogLevel l) {
    switch (l) {
        case LogLevel::ERROR: return "ERROR";
        case LogLevel::INFO:  return "INFO";
        case LogLevel::DEBUG: return "DEBUG";
    }
    return "INFO";
}

LogLevel log_level_from_name(const std::string& s) {
    std::string v = s;
    std::transform(v.begin(), v.end(), v.begin(),
                   [](unsigned char c) { return std::tolower(c); });
    if (v == "error") return LogLevel::ERROR;
    if (v == "debug") return LogLevel::DEBUG;
    return LogLevel::INFO;
}

EventLog::EventLog(std::string run_id, const std::string& path)
    : run_id_(std::move(run_id)), path_(path), out_(path, std::ios::out | std::ios::trunc) {}

void EventLog::event(int step, const std::string& name, json_object* payload) {
    json_util::Doc line(json_object_new_object());
    json_object_object_add(line.root, "event", json_util::new_string(name));
    json_object_object_add(line.root, "payload", payload);
    json_object_object_add(line.root, "run_id", json_util::new_string(run_id_));
    json_object_object_add(line.root, "step", json_object_new_int(step));
    json_object_object_add(line.root, "ts", json_util::new_string(iso_now()));

    std::string text = json_util::canonical(line.root);
    std::lock_guard<std::mutex> lk(mu_);
    out_ << text << "\n";
    out_.flush();
}

void AgentLogger::log(LogLevel l, const std::string& msg) {
    if (!enabled(l)) return;
    std::lock_guard<std::mutex> lk(mu_);
    (*out_) << "[" << iso_now() << "] " << log_level_name(l) << " " << msg << "\n";
    out_->flush();
}

void AgentLogger::event(int step, const std::string& name, json_object* payload) {
    if (!events_) {
        if (payload) json_object_put(payload);
        return;
    }
    events_->event(step, name, payload);
}

namespace {
class NullBuf : public std::streambuf {
protected:
    int overflow(int c) override { return c; }
};
} // namespace

AgentLogger& null_logger() {
    static NullBuf buf;
    static std::ostream sink(&buf);
    static AgentLogger logger(sink, LogLevel::ERROR);
    return logger;
}

} // namespace agentbox
