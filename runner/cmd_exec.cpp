#include "cmd_exec.h"
#include "runner_utils.h"

#include "agentbox/errors.h"
#include "agentbox/executor.h"
#include "agentbox/json_util.h"

#include <iostream>

using namespace agentbox;

int cmd_exec(int argc, char** argv) {
    if (argc < 3) {
        std::cerr << "usage: agentbox_cli exec <code.py> [state.json]\n";
        std::cerr << "env: AGENTBOX_BACKEND=process|docker, AGENTBOX_PYTHON, AGENTBOX_EXEC_TIMEOUT_MS\n";
        return 2;
    }

    std::string code, state_text;
    try {
        code = slurp(argv[2]);
        if (argc > 3) state_text = slurp(argv[3]);
    } catch (const std::exception& e) {
        std::cerr << e.what() << "\n";
        return 2;
    }

    StateMap state;
    if (!state_text.empty()) {
        std::string err;
        if (!state_from_json_text(state_text, &state, &err)) {
            std::cerr << "bad state file: " << err << "\n";
            return 2;
        }
    }

    CliLogging logging = make_cli_logging(gen_run_id());
    ExecutorOptions opts;
    opts.config = cli_sandbox_config();
    opts.logger = logging.logger.get();

    try {
        SandboxExecutor exec(std::move(opts));
        ExecutionResult r = exec.execute(code, state);

        json_util::Doc out(json_object_new_object());
        json_object_object_add(out.root, "result", value_to_json(r.result));
        json_object_object_add(out.root, "log", json_util::new_string(r.log));
        json_object_object_add(out.root, "is_final_answer", json_object_new_boolean(r.is_final_answer));
        std::cout << json_util::to_pretty(out.root) << "\n";
        return 0;
    } catch (const AgentError& e) {
        json_util::Doc out(json_object_new_object());
        json_object_object_add(out.root, "error", e.to_json());
        if (const auto* ee = dynamic_cast<const ExecutionError*>(&e)) {
            json_object_object_add(out.root, "diagnostics", json_util::new_string(ee->diagnostics()));
        }
        std::cout << json_util::to_pretty(out.root) << "\n";
        return 1;
    } catch (const std::invalid_argument& e) {
        std::cerr << e.what() << "\n";
        return 2;
    }
}
