#include "cmd_run.h"
#include "runner_utils.h"

#include "agentbox/errors.h"
#include "agentbox/executor.h"
#include "agentbox/json_util.h"
#include "agentbox/memory.h"
#include "agentbox/step_runner.h"

#include <iostream>
#include <memory>

using namespace agentbox;

namespace {

std::vector<std::string> string_array(json_object* arr) {
    std::vector<std::string> out;
    if (!arr || !json_object_is_type(arr, json_type_array)) return out;
    for (size_t i = 0; i < json_object_array_length(arr); i++) {
        json_object* it = json_object_array_get_idx(arr, i);
        if (json_object_is_type(it, json_type_string)) out.emplace_back(json_object_get_string(it));
    }
    return out;
}

bool tool_from_json(json_object* o, ToolDefinition* t, std::string* err) {
    auto name = json_util::get_string(o, "name");
    auto body = json_util::get_string(o, "forward");
    if (!name || !body) {
        *err = "tool needs \"name\" and \"forward\"";
        return false;
    }
    t->name = *name;
    t->forward_body = *body;
    t->description = json_util::get_string(o, "description").value_or("");
    t->output_type = json_util::get_string(o, "output_type").value_or("any");
    t->imports = string_array(json_util::get_field(o, "imports"));

    json_object* inputs = json_util::get_field(o, "inputs");
    if (inputs && json_object_is_type(inputs, json_type_array)) {
        for (size_t i = 0; i < json_object_array_length(inputs); i++) {
            json_object* in = json_object_array_get_idx(inputs, i);
            ToolInput ti;
            ti.name = json_util::get_string(in, "name").value_or("");
            ti.type = json_util::get_string(in, "type").value_or("any");
            ti.description = json_util::get_string(in, "description").value_or("");
            ti.nullable = json_util::get_bool(in, "nullable").value_or(false);
            t->inputs.push_back(std::move(ti));
        }
    }
    return true;
}

} // namespace

// Replays recorded model outputs through the turn driver.
// Request: {"task", "system_prompt"?, "max_steps"?, "outputs":[...],
//           "packages"?:[...], "tools"?:[...], "state"?:{...}}
int cmd_run(int argc, char** argv) {
    if (argc < 3) {
        std::cerr << "usage: agentbox_cli run <run_request.json> [memory_out.json]\n";
        return 2;
    }

    json_util::Doc req;
    try {
        if (!json_util::parse_ok(slurp(argv[2]), &req) || !req.root ||
            !json_object_is_type(req.root, json_type_object)) {
            std::cerr << "run request must be a JSON object\n";
            return 2;
        }
    } catch (const std::exception& e) {
        std::cerr << e.what() << "\n";
        return 2;
    }

    const std::vector<std::string> outputs = string_array(json_util::get_field(req.root, "outputs"));
    Budget budget;
    budget.max_steps = (int)json_util::get_int(req.root, "max_steps").value_or(budget.max_steps);

    const std::string run_id = gen_run_id();
    CliLogging logging = make_cli_logging(run_id);
    AgentLogger& log = *logging.logger;

    ExecutorOptions opts;
    opts.config = cli_sandbox_config();
    opts.logger = &log;
    opts.packages = string_array(json_util::get_field(req.root, "packages"));

    json_object* tools = json_util::get_field(req.root, "tools");
    if (tools && json_object_is_type(tools, json_type_array)) {
        for (size_t i = 0; i < json_object_array_length(tools); i++) {
            ToolDefinition t;
            std::string err;
            if (!tool_from_json(json_object_array_get_idx(tools, i), &t, &err)) {
                std::cerr << "tool " << i << ": " << err << "\n";
                return 2;
            }
            opts.tools.push_back(std::move(t));
        }
    }
    json_object* state = json_util::get_field(req.root, "state");
    if (state) {
        std::string err;
        if (!state_from_json_text(json_util::to_plain(state), &opts.initial_state, &err)) {
            std::cerr << "bad state: " << err << "\n";
            return 2;
        }
    }

    MemoryStore memory;
    if (auto sp = json_util::get_string(req.root, "system_prompt")) {
        memory.append(std::make_unique<SystemPromptStep>(*sp), 0);
    }
    memory.append(std::make_unique<TaskStep>(json_util::get_string(req.root, "task").value_or("")));

    log.info("run " + run_id + ": " + std::to_string(outputs.size()) + " recorded output(s), max_steps=" +
             std::to_string(budget.max_steps));

    int rc = 0;
    try {
        SandboxExecutor exec(std::move(opts));
        StepRunner runner(exec, memory, budget, &log);
        for (const auto& out : outputs) {
            const ActionStep& step = runner.run_step(out);
            if (step.error) std::cout << "step " << step.step_number << ": " << step.error->type << "\n";
            if (runner.finished()) break;
        }
        if (runner.finished()) {
            std::cout << "FINAL ANSWER: " << value_to_display(runner.final_answer()) << "\n";
        } else {
            std::cout << "no final answer after " << runner.steps_taken() << " step(s)\n";
            rc = 1;
        }
    } catch (const StepLimitExceeded& e) {
        std::cout << e.what() << "\n";
        rc = 1;
    } catch (const AgentError& e) {
        log.error(std::string(e.kind_name()) + ": " + e.what());
        rc = 1;
    }

    if (argc > 3) {
        std::string err = memory.save(argv[3]);
        if (!err.empty()) {
            std::cerr << "cannot save memory: " << err << "\n";
            return 2;
        }
        log.info("memory saved to " + std::string(argv[3]));
    }
    return rc;
}
