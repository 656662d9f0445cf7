#include "agentbox/step_runner.h"
#include "agentbox/codec.h"
#include "agentbox/errors.h"

#include <chrono>
#include <memory>

namespace agentbox {

namespace {

double wall_seconds() {
    using namespace std::chrono;
    return duration_cast<duration<double>>(system_clock::now().time_since_epoch()).count();
}

bool is_blank(const std::string& s) {
    return s.find_first_not_of(" \t\r\n") == std::string::npos;
}

} // namespace

StepRunner::StepRunner(CodeExecutor& executor, MemoryStore& memory, Budget budget, AgentLogger* logger)
    : executor_(executor), memory_(memory), budget_(budget), log_(logger ? logger : &null_logger()) {}

std::string StepRunner::extract_code_action(const std::string& llm_output) {
    std::string code;
    size_t pos = 0;
    for (;;) {
        size_t open = llm_output.find("```", pos);
        if (open == std::string::npos) break;
        size_t eol = llm_output.find('\n', open + 3);
        if (eol == std::string::npos) break;

        std::string lang = llm_output.substr(open + 3, eol - open - 3);
        while (!lang.empty() && (lang.back() == ' ' || lang.back() == '\r')) lang.pop_back();

        // closing fence starts a line at or after the body
        const size_t body = eol + 1;
        size_t close;
        if (llm_output.compare(body, 3, "```") == 0) {
            close = body;
        } else {
            close = llm_output.find("\n```", body);
            if (close == std::string::npos) break;
            close += 1;
        }
        pos = close + 3;

        if (lang != "" && lang != "py" && lang != "python") continue;
        std::string text = close > body ? llm_output.substr(body, close - body - 1) : std::string();
        if (!is_blank(text)) {
            if (!code.empty()) code += "\n\n";
            code += text;
        }
    }

    if (code.empty()) {
        throw ParsingError(
            "Your code snippet is invalid, because no ```py code block was found in it.\n"
            "Here is your code snippet:\n" + llm_output + "\n"
            "Make sure to include code with the correct pattern, for instance:\n"
            "Thoughts: Your thoughts\n"
            "Code:\n```py\n# Your python code here\n```<end_code>");
    }
    return code;
}

const ActionStep& StepRunner::run_step(const std::string& llm_output, const StateMap& extra_state) {
    if (step_number_ >= budget_.max_steps) {
        log_->error("step budget of " + std::to_string(budget_.max_steps) + " exhausted");
        throw StepLimitExceeded(budget_.max_steps);
    }

    auto step = std::make_unique<ActionStep>();
    step->step_number = ++step_number_;
    step->start_time = wall_seconds();
    step->llm_output = llm_output;
    memory_.log_chat_message(Message::text(MessageRole::ASSISTANT, llm_output));

    try {
        std::string code = extract_code_action(llm_output);
        ToolCall tc;
        tc.name = "python_interpreter";
        tc.arguments = Value::string(code);
        tc.id = "call_" + std::to_string(step_number_);
        step->tool_calls = std::vector<ToolCall>{tc};

        log_->debug("step " + std::to_string(step_number_) + " executing:\n" + code);
        ExecutionResult r = executor_.execute(code, extra_state);

        std::string obs = "Execution logs:\n" + r.log;
        if (!r.log.empty() && r.log.back() != '\n') obs += "\n";
        obs += "Last output from code snippet:\n" + value_to_display(r.result);
        step->observations = obs;
        if (r.result.kind == Value::Kind::IMAGE) {
            step->observations_images.push_back(codec::base64_encode(r.result.str));
        }
        step->action_output = r.result;

        if (r.is_final_answer) {
            finished_ = true;
            final_answer_ = r.result;
            log_->info("final answer: " + value_to_display(r.result));
        }
    } catch (const AgentError& e) {
        if (e.is_terminal()) throw;
        step->error = StepError::from(e);
        if (const auto* ee = dynamic_cast<const ExecutionError*>(&e)) {
            if (!ee->diagnostics().empty()) step->observations = "Execution logs:\n" + ee->diagnostics();
        }
        log_->error(std::string(e.kind_name()) + " in step " + std::to_string(step_number_) + ": " + e.what());
    }

    step->end_time = wall_seconds();
    step->duration = *step->end_time - *step->start_time;

    json_object* ev = json_object_new_object();
    json_object_object_add(ev, "ok", json_object_new_boolean(!step->error));
    json_object_object_add(ev, "final", json_object_new_boolean(finished_));
    json_object_object_add(ev, "duration_s", json_object_new_double(*step->duration));
    log_->event(step_number_, "action_step", ev);

    const ActionStep& stored = *step;
    memory_.append(std::move(step));
    return stored;
}

} // namespace agentbox
