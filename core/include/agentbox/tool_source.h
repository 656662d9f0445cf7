#pragma once

#include <string>
#include <vector>

namespace agentbox {

struct ToolInput {
    std::string name;
    std::string type;          // "string", "integer", "number", "boolean", "object", "array", "any", ...
    std::string description;
    bool nullable{false};      // optional argument, defaults to None
};

// A tool made callable inside the sandbox. The implementation is guest
// source: the body of `forward(self, <inputs...>)`, any indentation.
struct ToolDefinition {
    std::string name;          // bound in the guest namespace under this name
    std::string description;
    std::vector<ToolInput> inputs;
    std::string output_type{"any"};
    std::string forward_body;
    std::vector<std::string> imports;   // statements emitted before the class, e.g. "import math"
};

// Names the guest namespace binds itself: final_answer, the __agentbox_*
// hooks and dunder names.
bool is_reserved_name(const std::string& name);

// Empty when valid, else the reason (bad identifiers, reserved tool names,
// duplicate inputs, empty body).
std::string validate_tool(const ToolDefinition& t);

// Pure transformation: one class definition plus the instantiation
// statement `<name> = <Class>()`.
std::string tool_to_source(const ToolDefinition& t);

// Bootstrap program for a whole tool list (imports first, then tools in
// order, each validated; throws std::invalid_argument on an invalid tool).
std::string tools_bootstrap_source(const std::vector<ToolDefinition>& tools);

// Python identifier check (ASCII subset, keywords rejected).
bool is_identifier(const std::string& s);

// Python string literal for arbitrary text (JSON string syntax is a valid
// Python literal for every input once ' '-style escapes are plain).
std::string py_string_literal(const std::string& s);

} // namespace agentbox
