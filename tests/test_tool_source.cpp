#include "test_common.h"

#include "agentbox/tool_source.h"

#include <stdexcept>

using namespace agentbox;

static ToolDefinition adder() {
    ToolDefinition t;
    t.name = "add";
    t.description = "Adds two numbers";
    t.inputs = {
        {"b", "number", "second operand, optional", true},
        {"a", "number", "first operand", false},
    };
    t.output_type = "number";
    t.forward_body = "\n    if b is None:\n        return a\n    return a + b\n";
    t.imports = {"import math"};
    return t;
}

int main() {
    // Test 1: identifiers and literals
    expect_true(is_identifier("final_answer"), "plain identifier");
    expect_true(is_identifier("_x1"), "leading underscore");
    expect_true(!is_identifier("1x"), "leading digit");
    expect_true(!is_identifier("a-b"), "dash");
    expect_true(!is_identifier("class"), "keyword");
    expect_true(!is_identifier(""), "empty");
    expect_eq_str(py_string_literal("a\"b\n"), "\"a\\\"b\\n\"", "escaped literal");
    expect_eq_str(py_string_literal("/tmp/x"), "\"/tmp/x\"", "slashes are not escaped");

    // Test 2: generated class
    {
        std::string src = tool_to_source(adder());
        expect_true(contains(src, "class _AgentboxTool_add:\n"), "class header");
        expect_true(contains(src, "    name = \"add\"\n"), "name attribute");
        expect_true(contains(src, "    output_type = \"number\"\n"), "output type attribute");
        expect_true(contains(src, "__import__('json').loads("), "inputs schema literal");
        expect_true(contains(src, "    def forward(self, a, b=None):\n"), "required inputs first, optional defaulted");
        expect_true(contains(src, "        if b is None:\n            return a\n        return a + b\n"),
                    "body re-indented under forward");
        expect_true(contains(src, "\nadd = _AgentboxTool_add()\n"), "instance bound to the tool name");
    }

    // Test 3: bootstrap emits each import once, before the tools
    {
        ToolDefinition other = adder();
        other.name = "add2";
        std::string src = tools_bootstrap_source({adder(), other});
        size_t first = src.find("import math");
        expect_true(first == 0, "imports first");
        expect_true(src.find("import math", first + 1) == std::string::npos, "imports deduplicated");
        expect_true(src.find("class _AgentboxTool_add:") < src.find("class _AgentboxTool_add2:"), "tool order kept");
    }

    // Test 4: validation
    {
        expect_true(validate_tool(adder()).empty(), "valid tool");

        ToolDefinition bad = adder();
        bad.name = "not valid";
        expect_true(!validate_tool(bad).empty(), "bad name");

        for (const char* reserved : {"final_answer", "__agentbox_fetch__", "__agentbox_new", "__name__"}) {
            bad = adder();
            bad.name = reserved;
            expect_true(contains(validate_tool(bad), "reserved"), std::string("reserved tool name ") + reserved);
        }
        expect_true(!is_reserved_name("final_answer_v2"), "similar name allowed");
        expect_true(!is_reserved_name("_private"), "single underscore allowed");

        bad = adder();
        bad.inputs.push_back({"a", "number", "dup", false});
        expect_true(contains(validate_tool(bad), "duplicate"), "duplicate input");

        bad = adder();
        bad.inputs.push_back({"self", "any", "", false});
        expect_true(!validate_tool(bad).empty(), "self as input");

        bad = adder();
        bad.forward_body = "  \n\t\n";
        expect_true(contains(validate_tool(bad), "empty"), "empty body");

        bool threw = false;
        try {
            tools_bootstrap_source({adder(), bad});
        } catch (const std::invalid_argument&) {
            threw = true;
        }
        expect_true(threw, "bootstrap rejects an invalid tool");
    }

    std::cerr << "test_tool_source: ALL PASSED" << std::endl;
    return 0;
}
