#pragma once

#include "config.h"
#include "frame.h"
#include "log.h"
#include "proc.h"
#include "state_channel.h"
#include "tool_source.h"
#include "value.h"

#include <atomic>
#include <cstdint>
#include <mutex>
#include <optional>
#include <set>
#include <string>
#include <vector>

namespace agentbox {

struct ExecutorOptions {
    std::vector<std::string> packages;        // pip-installed at construction
    std::vector<ToolDefinition> tools;
    StateMap initial_state;

    // Docker backend: publish `host:port:port` when port > 0.
    std::string host{"127.0.0.1"};
    int port{0};

    SandboxConfig config;
    AgentLogger* logger{nullptr};             // not owned; null -> silent
};

struct ExecutionResult {
    Value result;            // null unless a final answer or an image marker
    std::string log;         // everything the snippet printed
    bool is_final_answer{false};
};

// Mount point of the work directory inside a docker container.
inline constexpr const char* kDockerGuestDir = "/agentbox";

// Command line that starts the guest driver for config.backend: the
// interpreter itself, or `docker run` around it with the work directory
// mounted at kDockerGuestDir. `host:port:port` is published when port > 0.
std::vector<std::string> sandbox_command(const SandboxConfig& config, const std::string& work_dir,
                                         const std::string& container, const std::string& host, int port);

// First `IMAGE_BASE64:<base64>` line of a log as an IMAGE value (format
// sniffed from magic bytes); lines that do not decode are skipped.
std::optional<Value> find_image_marker(const std::string& log);

// What a turn driver needs from a code runner.
class CodeExecutor {
public:
    virtual ~CodeExecutor() = default;
    virtual ExecutionResult execute(const std::string& code, const StateMap& extra_state = {}) = 0;
};

// One isolated Python environment with a persistent namespace.
//
// Construction acquires the environment (fresh work directory, backend
// spawned with the guest driver, ready frame), installs packages,
// materializes tools and pushes the initial state. Any failure tears the
// partial environment down before the exception leaves the constructor.
//
// Calls are serialized by an internal mutex. cleanup() may be called from
// another thread while a call is blocked: it kills the environment first,
// and the blocked call fails with EnvironmentUnavailable.
class SandboxExecutor : public CodeExecutor {
public:
    explicit SandboxExecutor(ExecutorOptions opts);
    ~SandboxExecutor() override;

    SandboxExecutor(const SandboxExecutor&) = delete;
    SandboxExecutor& operator=(const SandboxExecutor&) = delete;

    // Final-answer mode is chosen by match_final_answer(code).
    ExecutionResult execute(const std::string& code, const StateMap& extra_state = {}) override;

    // Explicit mode. With return_final_answer and a trailing
    // `final_answer(<expr>)`, the call is rewritten to the emit hook.
    ExecutionResult run_code(const std::string& code, bool return_final_answer,
                             const StateMap& extra_state = {});

    // Runs code, returns only its log.
    std::string execute_code(const std::string& code);

    // Merges `vars` into the guest namespace (update, not replace).
    void send_variables(const StateMap& vars);

    // Throws VariableNotFound when `name` is undefined or not an identifier.
    Value get_variable(const std::string& name);

    // Already-installed packages are skipped.
    void install_packages(const std::vector<std::string>& packages);
    const std::set<std::string>& installed_packages() const { return installed_; }

    // Stops and removes the environment and its work directory. Idempotent.
    void cleanup() noexcept;

    bool alive() const { return !dead_.load(); }
    const std::string& work_dir() const { return work_dir_; }
    const std::string& container_name() const { return container_; }

private:
    struct CallReply {
        bool ok{false};
        bool final{false};
        std::string output;
        std::string error;
        std::string error_type;
        std::optional<uint64_t> artifact_size;
        std::string artifact_fnv;
        std::string artifact_path;   // host side
    };

    enum class Wait { FRAME, TIMEOUT, CLOSED, PROTOCOL };

    void start();
    std::vector<std::string> backend_argv() const;
    ProcLimits backend_limits() const;

    CallReply call(const std::string& code, int timeout_ms, const char* what);
    // deadline_ms is on the steady clock; negative waits forever.
    Wait next_frame(int64_t deadline_ms, std::string* payload);
    bool write_frame(const std::string& payload);
    void drain_stderr();
    // nullopt when the capture file cannot be opened (errno is kept).
    std::optional<std::string> read_capture(const std::string& path) const;
    Value read_artifact(const CallReply& r);
    std::string stage_state(const StateMap& vars, std::string* host_path);
    void kill_session(const char* reason);

    std::string guest_path(const std::string& file) const;
    std::string host_path(const std::string& file) const;

    ExecutorOptions opts_;
    AgentLogger* log_;

    std::mutex io_mu_;
    ChildProcess child_;
    std::atomic<int> pid_{-1};
    std::atomic<bool> dead_{true};
    std::atomic<bool> stopping_{false};
    bool cleaned_{false};

    FrameReader reader_;
    std::string diag_;               // tail of the backend's own stderr
    std::string work_dir_;
    std::string guest_dir_;
    std::string container_;
    uint64_t call_seq_{0};
    std::atomic<uint64_t> state_seq_{0};
    bool container_removed_{false};
    std::set<std::string> installed_;
};

} // namespace agentbox
