#pragma once

#include "executor.h"
#include "log.h"
#include "memory.h"

#include <string>

namespace agentbox {

struct Budget {
    int max_steps{20};
};

// Drives one agent turn at a time: model output in, ActionStep appended to
// the memory. Non-terminal errors are recorded on the step and the run
// continues; StepLimitExceeded propagates.
class StepRunner {
public:
    StepRunner(CodeExecutor& executor, MemoryStore& memory, Budget budget = {},
               AgentLogger* logger = nullptr);

    // Code of every ```py / ```python / ``` block, joined by blank lines.
    // Throws ParsingError when there is none.
    static std::string extract_code_action(const std::string& llm_output);

    // Throws StepLimitExceeded once the budget is spent; returns the step
    // as stored in the memory.
    const ActionStep& run_step(const std::string& llm_output, const StateMap& extra_state = {});

    int steps_taken() const { return step_number_; }
    bool finished() const { return finished_; }
    const Value& final_answer() const { return final_answer_; }

private:
    CodeExecutor& executor_;
    MemoryStore& memory_;
    Budget budget_;
    AgentLogger* log_;
    int step_number_{0};
    bool finished_{false};
    Value final_answer_;
};

} // namespace agentbox
