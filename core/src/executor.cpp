#include "agentbox/executor.h"
#include "agentbox/codec.h"
#include "agentbox/driver.h"
#include "agentbox/errors.h"
#include "agentbox/final_answer.h"
#include "agentbox/json_util.h"

#include <algorithm>
#include <cerrno>
#include <chrono>
#include <csignal>
#include <cstdlib>
#include <cstring>
#include <filesystem>
#include <fstream>
#include <iterator>
#include <stdexcept>

#include <poll.h>
#include <unistd.h>

namespace fs = std::filesystem;

namespace agentbox {

namespace {

constexpr size_t kDiagMax = 64 * 1024;
constexpr int kReapMs = 2000;
constexpr const char* kImageMarker = "IMAGE_BASE64:";

int64_t now_ms() {
    using namespace std::chrono;
    return duration_cast<milliseconds>(steady_clock::now().time_since_epoch()).count();
}

int64_t deadline_after(int timeout_ms) {
    return timeout_ms > 0 ? now_ms() + timeout_ms : -1;
}

std::string make_work_dir(const std::string& root, std::string* err) {
    std::string base = root;
    if (base.empty()) {
        const char* t = std::getenv("TMPDIR");
        base = (t && *t) ? t : "/tmp";
    }
    std::error_code ec;
    fs::create_directories(base, ec);
    std::string tmpl = base + "/agentbox-XXXXXX";
    std::vector<char> buf(tmpl.begin(), tmpl.end());
    buf.push_back('\0');
    if (!mkdtemp(buf.data())) {
        *err = base + ": " + std::strerror(errno);
        return "";
    }
    return std::string(buf.data());
}

void remove_quiet(const std::string& path) {
    std::error_code ec;
    fs::remove(path, ec);
}

// Removes a staged file when the call that reads it is over.
struct FileGuard {
    std::string path;
    ~FileGuard() {
        if (!path.empty()) remove_quiet(path);
    }
};

} // namespace

std::optional<Value> find_image_marker(const std::string& log) {
    const size_t mlen = std::strlen(kImageMarker);
    size_t pos = 0;
    while (pos < log.size()) {
        size_t eol = log.find('\n', pos);
        size_t len = (eol == std::string::npos) ? std::string::npos : eol - pos;
        if (log.compare(pos, mlen, kImageMarker) == 0) {
            std::string payload = log.substr(pos + mlen, len == std::string::npos ? len : len - mlen);
            auto raw = codec::base64_decode(payload);
            if (raw && !raw->empty()) return Value::image(sniff_image_format(*raw), *raw);
        }
        if (eol == std::string::npos) break;
        pos = eol + 1;
    }
    return std::nullopt;
}

SandboxExecutor::SandboxExecutor(ExecutorOptions opts)
    : opts_(std::move(opts)), log_(opts_.logger ? opts_.logger : &null_logger()) {
    try {
        start();
        if (!opts_.packages.empty()) install_packages(opts_.packages);

        if (!opts_.tools.empty()) {
            std::string src;
            try {
                src = tools_bootstrap_source(opts_.tools);
            } catch (const std::invalid_argument& e) {
                throw ToolSetupError(std::string("invalid tool definition: ") + e.what(), "");
            }
            CallReply r;
            try {
                r = call(src, opts_.config.exec_timeout_ms, "tools");
            } catch (const ExecutionError& e) {
                throw ToolSetupError("tool bootstrap failed", e.diagnostics());
            }
            if (!r.ok) throw ToolSetupError("tool bootstrap failed:\n" + r.error, r.output + r.error);
            log_->info("materialized " + std::to_string(opts_.tools.size()) + " tool(s)");
        }

        if (!opts_.initial_state.empty()) send_variables(opts_.initial_state);
    } catch (...) {
        cleanup();
        throw;
    }
}

SandboxExecutor::~SandboxExecutor() {
    cleanup();
}

std::string SandboxExecutor::host_path(const std::string& file) const {
    return work_dir_ + "/" + file;
}

std::string SandboxExecutor::guest_path(const std::string& file) const {
    return guest_dir_ + "/" + file;
}

std::vector<std::string> sandbox_command(const SandboxConfig& c, const std::string& work_dir,
                                         const std::string& container, const std::string& host, int port) {
    std::vector<std::string> py = {c.python, "-u", "-c", guest_driver_source()};
    if (c.backend == Backend::PROCESS) return py;

    std::vector<std::string> a = {
        c.docker_bin, "run", "-i", "--rm",
        "--name", container,
        "-v", work_dir + ":" + kDockerGuestDir,
        "-w", kDockerGuestDir,
    };
    if (!c.docker_user.empty()) {
        a.push_back("--user");
        a.push_back(c.docker_user);
    }
    if (port > 0) {
        const std::string p = std::to_string(port);
        a.push_back("-p");
        a.push_back(host + ":" + p + ":" + p);
    }
    if (c.rlimit_as_mb > 0) {
        a.push_back("--memory");
        a.push_back(std::to_string(c.rlimit_as_mb) + "m");
    }
    if (c.rlimit_cpu_sec > 0) {
        const std::string s = std::to_string(c.rlimit_cpu_sec);
        a.push_back("--ulimit");
        a.push_back("cpu=" + s + ":" + s);
    }
    a.push_back(c.docker_image);
    a.insert(a.end(), py.begin(), py.end());
    return a;
}

std::vector<std::string> SandboxExecutor::backend_argv() const {
    return sandbox_command(opts_.config, work_dir_, container_, opts_.host, opts_.port);
}

ProcLimits SandboxExecutor::backend_limits() const {
    const SandboxConfig& c = opts_.config;
    ProcLimits lim;
    lim.stdout_max_bytes = c.output_max_bytes;
    lim.no_new_privs = true;
    // the container runtime enforces limits for the docker backend; the
    // client process itself stays unrestricted
    if (c.backend == Backend::PROCESS) {
        lim.rlimit_as_mb = c.rlimit_as_mb;
        lim.rlimit_cpu_sec = c.rlimit_cpu_sec;
        lim.enable_seccomp = c.enable_seccomp;
        lim.seccomp_allow_network = c.seccomp_allow_network;
    }
    return lim;
}

void SandboxExecutor::start() {
    std::string err;
    work_dir_ = make_work_dir(opts_.config.work_root, &err);
    if (work_dir_.empty()) throw EnvironmentUnavailable("cannot create work directory: " + err);

    if (opts_.config.backend == Backend::DOCKER) {
        guest_dir_ = kDockerGuestDir;
        container_ = fs::path(work_dir_).filename().string();
    } else {
        guest_dir_ = work_dir_;
    }

    log_->info(std::string("starting sandbox (") + backend_name(opts_.config.backend) + ") in " + work_dir_);
    if (!proc_spawn_sandboxed(backend_argv(), work_dir_, backend_limits(), &child_, &err)) {
        throw EnvironmentUnavailable("cannot start sandbox: " + err);
    }
    pid_ = child_.pid;
    dead_ = false;

    std::string payload;
    Wait w = next_frame(deadline_after(opts_.config.startup_timeout_ms), &payload);
    if (w == Wait::FRAME) {
        json_util::Doc d;
        if (json_util::parse_ok(payload, &d) && json_util::get_string(d.root, "op").value_or("") == "ready") {
            log_->debug("sandbox ready: " + payload);
            return;
        }
    }

    drain_stderr();
    std::string why;
    switch (w) {
        case Wait::TIMEOUT: why = "sandbox did not become ready within " +
                                  std::to_string(opts_.config.startup_timeout_ms) + " ms"; break;
        case Wait::CLOSED:  why = "sandbox exited during startup"; break;
        default:            why = "unexpected startup message from sandbox"; break;
    }
    std::string detail = diag_;
    kill_session("startup failed");
    throw EnvironmentUnavailable(detail.empty() ? why : why + ":\n" + detail);
}

bool SandboxExecutor::write_frame(const std::string& payload) {
    if (child_.stdin_fd < 0) return false;
    const std::string data = encode_frame(payload);
    return proc_write_all(child_.stdin_fd, data.data(), data.size());
}

void SandboxExecutor::drain_stderr() {
    if (child_.stderr_fd < 0) return;
    char buf[4096];
    for (;;) {
        ssize_t n = ::read(child_.stderr_fd, buf, sizeof(buf));
        if (n > 0) {
            diag_.append(buf, (size_t)n);
            continue;
        }
        if (n < 0 && errno == EINTR) continue;
        if (n == 0) {
            close(child_.stderr_fd);
            child_.stderr_fd = -1;
        }
        break;
    }
    if (diag_.size() > kDiagMax) diag_.erase(0, diag_.size() - kDiagMax);
}

SandboxExecutor::Wait SandboxExecutor::next_frame(int64_t deadline_ms, std::string* payload) {
    char buf[65536];
    bool eof = false;
    for (;;) {
        FrameReader::Status st = reader_.next(payload);
        if (st == FrameReader::Status::FRAME) return Wait::FRAME;
        if (st != FrameReader::Status::NEED_MORE) return Wait::PROTOCOL;
        if (eof || child_.stdout_fd < 0) return Wait::CLOSED;

        int wait_ms = -1;
        if (deadline_ms >= 0) {
            int64_t left = deadline_ms - now_ms();
            if (left <= 0) return Wait::TIMEOUT;
            wait_ms = (int)std::min<int64_t>(left, 1000);
        }

        struct pollfd pfd[2];
        pfd[0].fd = child_.stdout_fd;
        pfd[0].events = POLLIN;
        pfd[0].revents = 0;
        pfd[1].fd = child_.stderr_fd;
        pfd[1].events = POLLIN;
        pfd[1].revents = 0;

        int n = poll(pfd, 2, wait_ms);
        if (n < 0) {
            if (errno == EINTR) continue;
            return Wait::CLOSED;
        }
        if (n == 0) continue;

        if (pfd[1].revents) drain_stderr();
        if (pfd[0].revents) {
            for (;;) {
                ssize_t k = ::read(child_.stdout_fd, buf, sizeof(buf));
                if (k > 0) {
                    reader_.feed(buf, (size_t)k);
                    continue;
                }
                if (k < 0 && errno == EINTR) continue;
                if (k < 0 && (errno == EAGAIN || errno == EWOULDBLOCK)) break;
                eof = true;
                break;
            }
        }
    }
}

std::optional<std::string> SandboxExecutor::read_capture(const std::string& path) const {
    std::ifstream in(path, std::ios::binary);
    if (!in) return std::nullopt;
    const size_t cap = opts_.config.output_max_bytes;
    std::string out;
    out.resize(cap + 1);
    in.read(&out[0], (std::streamsize)(cap + 1));
    out.resize((size_t)in.gcount());
    if (out.size() > cap) {
        out.resize(cap);
        out += "\n[output truncated]\n";
    }
    return out;
}

void SandboxExecutor::kill_session(const char* reason) {
    if (child_.pid > 0) {
        log_->debug(std::string("stopping sandbox: ") + reason);
        proc_signal_group(child_.pid, SIGKILL);
        proc_close_fds(&child_);
        (void)proc_reap_with_deadline(child_.pid, kReapMs);
        child_.pid = -1;
    } else {
        proc_close_fds(&child_);
    }
    pid_ = -1;
    dead_ = true;

    if (opts_.config.backend == Backend::DOCKER && !container_.empty() && !container_removed_) {
        container_removed_ = true;
        ProcLimits lim;
        lim.timeout_ms = 20000;
        ProcResult res;
        if (!proc_run_capture_sandboxed({opts_.config.docker_bin, "rm", "-f", container_}, "", lim, &res)) {
            log_->error("docker rm failed: " + res.error);
        } else if (res.exit_code != 0) {
            // --rm usually got there first
            log_->debug("docker rm -f " + container_ + ": " + res.output);
        }
    }
}

SandboxExecutor::CallReply SandboxExecutor::call(const std::string& code, int timeout_ms, const char* what) {
    std::lock_guard<std::mutex> lk(io_mu_);
    if (dead_.load() || stopping_.load()) {
        throw EnvironmentUnavailable("sandbox environment is not running");
    }

    const uint64_t id = ++call_seq_;
    const std::string stem = "call-" + std::to_string(id);
    CallReply r;
    r.artifact_path = host_path(stem + ".json");
    const std::string capture = host_path(stem + ".out");
    remove_quiet(r.artifact_path);
    remove_quiet(r.artifact_path + ".part");

    json_util::Doc req(json_object_new_object());
    json_object_object_add(req.root, "op", json_object_new_string("exec"));
    json_object_object_add(req.root, "id", json_object_new_int64((int64_t)id));
    json_object_object_add(req.root, "code", json_util::new_string(code));
    json_object_object_add(req.root, "artifact", json_util::new_string(guest_path(stem + ".json")));
    json_object_object_add(req.root, "capture", json_util::new_string(guest_path(stem + ".out")));

    const int64_t t0 = now_ms();
    if (!write_frame(json_util::to_plain(req.root))) {
        kill_session("control channel closed");
        throw EnvironmentUnavailable("sandbox control channel is closed");
    }

    auto discard_files = [&]() {
        remove_quiet(r.artifact_path);
        remove_quiet(r.artifact_path + ".part");
        remove_quiet(capture);
    };

    json_util::Doc reply;
    bool interrupted = false;
    int64_t deadline = deadline_after(timeout_ms);
    std::string payload;
    for (;;) {
        Wait w = next_frame(deadline, &payload);
        if (w == Wait::FRAME) {
            json_util::Doc d;
            if (!json_util::parse_ok(payload, &d) || !d.root) {
                discard_files();
                kill_session("malformed frame");
                throw EnvironmentUnavailable("sandbox sent a malformed frame");
            }
            if (json_util::get_string(d.root, "op").value_or("") != "done" ||
                json_util::get_int(d.root, "id").value_or(-1) != (int64_t)id) {
                log_->debug("ignoring frame: " + payload.substr(0, 200));
                continue;
            }
            reply = std::move(d);
            break;
        }
        if (w == Wait::TIMEOUT && !interrupted) {
            interrupted = true;
            log_->info(std::string(what) + " call " + std::to_string(id) + " exceeded " +
                       std::to_string(timeout_ms) + " ms, interrupting");
            proc_signal_group(child_.pid, SIGINT);
            deadline = deadline_after(std::max(opts_.config.interrupt_grace_ms, 1));
            continue;
        }

        std::string out = read_capture(capture).value_or("");
        discard_files();
        if (stopping_.load()) {
            kill_session("shut down during call");
            throw EnvironmentUnavailable("sandbox environment was shut down during execution");
        }
        if (w == Wait::TIMEOUT) {
            kill_session("interrupt not honored");
            log_->error("sandbox killed after ignoring interrupt; further calls will fail");
            throw ExecutionTimeout("Code execution timed out after " + std::to_string(timeout_ms) + " ms", out);
        }
        if (w == Wait::CLOSED) {
            drain_stderr();
            std::string diag = out;
            if (!diag_.empty()) diag += diag_;
            kill_session("sandbox exited");
            throw ExecutionError("sandbox process exited during execution\n" + diag, diag);
        }
        kill_session("protocol error");
        throw EnvironmentUnavailable("sandbox control channel is corrupt");
    }

    auto captured = read_capture(capture);
    if (!captured) {
        const std::string why = std::strerror(errno);
        discard_files();
        log_->error("cannot read captured output " + capture + ": " + why);
        throw EnvironmentUnavailable("cannot read captured output " + capture + ": " + why);
    }
    r.output = std::move(*captured);
    remove_quiet(capture);
    r.ok = json_util::get_bool(reply.root, "ok").value_or(false);
    r.final = json_util::get_bool(reply.root, "final").value_or(false);
    r.error = json_util::get_string(reply.root, "error").value_or("");
    r.error_type = json_util::get_string(reply.root, "error_type").value_or("");
    auto size = json_util::get_int(reply.root, "artifact_size");
    if (size && *size >= 0) r.artifact_size = (uint64_t)*size;
    r.artifact_fnv = json_util::get_string(reply.root, "artifact_fnv").value_or("");

    json_object* ev = json_object_new_object();
    json_object_object_add(ev, "what", json_object_new_string(what));
    json_object_object_add(ev, "ok", json_object_new_boolean(r.ok));
    json_object_object_add(ev, "final", json_object_new_boolean(r.final));
    json_object_object_add(ev, "error_type", json_util::new_string(r.error_type));
    json_object_object_add(ev, "duration_ms", json_object_new_int64(now_ms() - t0));
    log_->event((int)id, "sandbox_call", ev);

    if (interrupted) {
        remove_quiet(r.artifact_path);
        throw ExecutionTimeout("Code execution timed out after " + std::to_string(timeout_ms) + " ms",
                               r.output + r.error);
    }
    if (!r.artifact_size) remove_quiet(r.artifact_path);
    return r;
}

Value SandboxExecutor::read_artifact(const CallReply& r) {
    if (!r.artifact_size) throw ResultDecodeError("no result artifact was written", r.output);
    std::ifstream in(r.artifact_path, std::ios::binary);
    if (!in) throw ResultDecodeError("result artifact is missing", r.output);
    std::string text((std::istreambuf_iterator<char>(in)), std::istreambuf_iterator<char>());
    in.close();
    remove_quiet(r.artifact_path);
    return state_channel::decode_artifact(text, *r.artifact_size, r.artifact_fnv);
}

std::string SandboxExecutor::stage_state(const StateMap& vars, std::string* host_file) {
    state_channel::check_names(vars);
    const std::string name = "state-" + std::to_string(++state_seq_) + ".json";
    *host_file = host_path(name);
    std::ofstream out(*host_file, std::ios::binary | std::ios::trunc);
    out << state_channel::encode(vars);
    out.close();
    if (!out) throw ExecutionError("cannot write state file " + *host_file, "");
    return state_channel::loader_snippet(guest_path(name));
}

ExecutionResult SandboxExecutor::execute(const std::string& code, const StateMap& extra_state) {
    return run_code(code, match_final_answer(code).has_value(), extra_state);
}

ExecutionResult SandboxExecutor::run_code(const std::string& code, bool return_final_answer,
                                          const StateMap& extra_state) {
    FileGuard staged;
    std::string program;
    if (!extra_state.empty()) program = stage_state(extra_state, &staged.path);

    std::optional<FinalAnswerMatch> m;
    if (return_final_answer) m = match_final_answer(code);
    program += m ? rewrite_final_answer(*m, guest_hooks::kFinal) : code;

    CallReply r = call(program, opts_.config.exec_timeout_ms, "exec");
    if (!r.ok) {
        std::string diag = r.output;
        if (!diag.empty() && diag.back() != '\n') diag += "\n";
        diag += r.error;
        throw ExecutionError(diag.empty() ? "code execution failed" : diag, diag);
    }

    ExecutionResult out;
    out.log = r.output;
    if (r.final) {
        out.is_final_answer = true;
        out.result = read_artifact(r);
    } else if (auto img = find_image_marker(r.output)) {
        out.result = std::move(*img);
    }
    return out;
}

std::string SandboxExecutor::execute_code(const std::string& code) {
    return run_code(code, false).log;
}

void SandboxExecutor::send_variables(const StateMap& vars) {
    if (vars.empty()) return;
    FileGuard staged;
    std::string loader = stage_state(vars, &staged.path);
    CallReply r = call(loader, opts_.config.exec_timeout_ms, "state");
    if (!r.ok) throw ExecutionError("failed to load variables:\n" + r.error, r.output + r.error);
    log_->debug("sent " + std::to_string(vars.size()) + " variable(s)");
}

Value SandboxExecutor::get_variable(const std::string& name) {
    if (!is_identifier(name)) throw VariableNotFound(name, "not a valid identifier");
    CallReply r = call(state_channel::fetch_snippet(name), opts_.config.exec_timeout_ms, "fetch");
    if (!r.ok) {
        if (r.error_type == "NameError") throw VariableNotFound(name, r.error);
        throw ExecutionError(r.error, r.output + r.error);
    }
    return read_artifact(r);
}

void SandboxExecutor::install_packages(const std::vector<std::string>& packages) {
    for (const auto& pkg : packages) {
        if (pkg.empty() || installed_.count(pkg)) continue;

        std::vector<std::string> args = opts_.config.pip_extra_args;
        args.push_back(pkg);
        std::string code = std::string(guest_hooks::kPip) + "([";
        for (size_t i = 0; i < args.size(); i++) {
            if (i) code += ", ";
            code += py_string_literal(args[i]);
        }
        code += "])\n";

        log_->info("installing package " + pkg);
        CallReply r;
        try {
            r = call(code, opts_.config.install_timeout_ms, "install");
        } catch (const ExecutionError& e) {
            throw DependencyInstallError(pkg, e.diagnostics());
        }
        if (!r.ok) throw DependencyInstallError(pkg, r.output + r.error);
        installed_.insert(pkg);
    }
}

void SandboxExecutor::cleanup() noexcept {
    stopping_ = true;
    const bool idle = io_mu_.try_lock();
    if (!idle) {
        // a call is blocked on the guest; killing it makes the call return
        int pid = pid_.load();
        if (pid > 0) proc_signal_group(pid, SIGKILL);
        io_mu_.lock();
    }
    std::lock_guard<std::mutex> lk(io_mu_, std::adopt_lock);
    if (cleaned_) return;
    cleaned_ = true;

    if (idle && !dead_.load() && child_.pid > 0) {
        json_util::Doc bye(json_object_new_object());
        json_object_object_add(bye.root, "op", json_object_new_string("shutdown"));
        if (write_frame(json_util::to_plain(bye.root))) {
            int code = proc_reap_with_deadline(child_.pid, kReapMs);
            log_->debug("sandbox exited with " + std::to_string(code));
            child_.pid = -1;
        }
    }
    kill_session("cleanup");

    if (!work_dir_.empty()) {
        std::error_code ec;
        fs::remove_all(work_dir_, ec);
        if (ec) log_->error("cannot remove " + work_dir_ + ": " + ec.message());
    }
}

} // namespace agentbox
