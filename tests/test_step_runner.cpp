#include "test_common.h"

#include "agentbox/errors.h"
#include "agentbox/state_channel.h"
#include "agentbox/step_runner.h"

#include <deque>
#include <functional>
#include <sstream>

using namespace agentbox;

// Scripted stand-in for the sandbox: each call pops the next behaviour.
class FakeExecutor : public CodeExecutor {
public:
    std::deque<std::function<ExecutionResult()>> script;
    std::vector<std::string> seen_code;
    std::vector<size_t> seen_state;

    ExecutionResult execute(const std::string& code, const StateMap& extra_state) override {
        state_channel::check_names(extra_state);
        seen_code.push_back(code);
        seen_state.push_back(extra_state.size());
        if (script.empty()) die("unexpected execute call");
        auto next = script.front();
        script.pop_front();
        return next();
    }
};

static bool parse_fails(const std::string& text) {
    try {
        (void)StepRunner::extract_code_action(text);
    } catch (const ParsingError& e) {
        return contains(e.what(), "Your code snippet is invalid");
    }
    return false;
}

int main() {
    // Test 1: code extraction
    expect_eq_str(StepRunner::extract_code_action("Thought: add\nCode:\n```py\nx = 1\n```<end_code>"),
                  "x = 1", "py block");
    expect_eq_str(StepRunner::extract_code_action("```python\na = 1\n```\ntext\n```\nb = 2\n```"),
                  "a = 1\n\nb = 2", "blocks joined");
    expect_eq_str(StepRunner::extract_code_action("```json\n{}\n```\n```py\nok()\n```"),
                  "ok()", "other languages skipped");
    expect_true(parse_fails("no code at all"), "no block");
    expect_true(parse_fails("```py\nunterminated"), "unterminated block");
    expect_true(parse_fails("```py\n   \n```"), "blank block");
    expect_true(parse_fails("```py\n```"), "empty block");
    expect_true(parse_fails("Thought: done\n```py\n```\n"), "empty block after text");
    expect_true(parse_fails("```py\n```<end_code>"), "empty block with end marker");
    expect_eq_str(StepRunner::extract_code_action("```py\n```\n```py\nz = 3\n```"),
                  "z = 3", "empty block followed by a real one");

    // Test 2: a normal step then a final answer
    {
        FakeExecutor fx;
        fx.script.push_back([] {
            ExecutionResult r;
            r.log = "working";
            return r;
        });
        fx.script.push_back([] {
            ExecutionResult r;
            r.result = Value::integer(5);
            r.is_final_answer = true;
            return r;
        });

        MemoryStore mem;
        std::ostringstream out;
        AgentLogger logger(out);
        StepRunner runner(fx, mem, Budget{5}, &logger);

        StateMap extra;
        extra["k"] = Value::boolean(true);
        const ActionStep& s1 = runner.run_step("```py\nprint('working')\n```", extra);
        expect_eq_ll(s1.step_number, 1, "first step number");
        expect_true(!s1.error.has_value(), "no error");
        expect_eq_str(*s1.observations, "Execution logs:\nworking\nLast output from code snippet:\nNone",
                      "observation text");
        expect_true(s1.tool_calls && (*s1.tool_calls)[0].name == "python_interpreter", "tool call recorded");
        expect_eq_str((*s1.tool_calls)[0].id, "call_1", "tool call id");
        expect_true(s1.duration.has_value() && *s1.duration >= 0.0, "timing recorded");
        expect_eq_ll((long long)fx.seen_state[0], 1, "extra state forwarded");
        expect_true(!runner.finished(), "not finished yet");

        const ActionStep& s2 = runner.run_step("```py\nfinal_answer(5)\n```");
        expect_true(runner.finished(), "finished");
        expect_true(runner.final_answer() == Value::integer(5), "final answer kept");
        expect_true(s2.action_output == Value::integer(5), "action output");
        expect_eq_ll((long long)mem.size(), 2, "two steps stored");
        expect_eq_ll((long long)mem.chat_messages().size(), 2, "model output logged");
        expect_eq_str(fx.seen_code[1], "final_answer(5)", "code passed through");
        expect_true(contains(out.str(), "final answer: 5"), "final answer logged");
    }

    // Test 3: errors are recorded, not thrown
    {
        FakeExecutor fx;
        fx.script.push_back([]() -> ExecutionResult {
            throw ExecutionError("boom", "partial\nValueError: boom");
        });
        fx.script.push_back([] {
            ExecutionResult r;
            r.result = Value::image("png", "\x89PNG\r\n\x1a\n");
            return r;
        });

        MemoryStore mem;
        StepRunner runner(fx, mem, Budget{3});

        const ActionStep& bad = runner.run_step("no code here");
        expect_true(bad.error && bad.error->type == "ParsingError", "parsing error recorded");
        expect_true(fx.seen_code.empty(), "nothing executed");

        const ActionStep& failed = runner.run_step("```py\nraise ValueError('boom')\n```");
        expect_true(failed.error && failed.error->type == "ExecutionError", "execution error recorded");
        expect_eq_str(*failed.observations, "Execution logs:\npartial\nValueError: boom", "diagnostics observed");

        const ActionStep& img = runner.run_step("```py\nshow()\n```");
        expect_eq_ll((long long)img.observations_images.size(), 1, "image observation");
        expect_eq_str(img.observations_images[0], "iVBORw0KGgo=", "image as base64");

        // Test 4: the budget is terminal
        bool threw = false;
        try {
            runner.run_step("```py\nx = 1\n```");
        } catch (const StepLimitExceeded& e) {
            threw = true;
            expect_eq_ll(e.max_steps(), 3, "limit reported");
            expect_true(e.is_terminal(), "terminal");
        }
        expect_true(threw, "step limit enforced");
        expect_eq_ll(runner.steps_taken(), 3, "no step consumed past the limit");
        expect_eq_ll((long long)mem.size(), 3, "no step stored past the limit");
    }

    // Test 5: a bad state name is recorded on the step and the run continues
    {
        FakeExecutor fx;
        fx.script.push_back([] {
            ExecutionResult r;
            r.log = "ok";
            return r;
        });

        MemoryStore mem;
        StepRunner runner(fx, mem, Budget{4});
        StateMap bad;
        bad["1x"] = Value::null();
        const ActionStep& s1 = runner.run_step("```py\nprint(1)\n```", bad);
        expect_true(s1.error && s1.error->type == "ExecutionError", "bad state recorded as execution error");
        expect_true(contains(s1.error->message, "1x"), "name in recorded error");
        expect_eq_ll((long long)mem.size(), 1, "failed step stored");

        const ActionStep& s2 = runner.run_step("```py\nprint(1)\n```");
        expect_true(!s2.error.has_value(), "next step runs");
        expect_eq_ll(s2.step_number, 2, "step numbering continues");
    }

    std::cerr << "test_step_runner: ALL PASSED" << std::endl;
    return 0;
}
