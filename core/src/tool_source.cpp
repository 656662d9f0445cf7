#include "agentbox/tool_source.h"
#include "agentbox/json_util.h"

#include <cctype>
#include <set>
#include <sstream>
#include <stdexcept>

namespace agentbox {

namespace {

const std::set<std::string>& python_keywords() {
    static const std::set<std::string> kw = {
        "False", "None", "True", "and", "as", "assert", "async", "await", "break",
        "class", "continue", "def", "del", "elif", "else", "except", "finally",
        "for", "from", "global", "if", "import", "in", "is", "lambda", "nonlocal",
        "not", "or", "pass", "raise", "return", "try", "while", "with", "yield",
    };
    return kw;
}

std::vector<std::string> split_lines(const std::string& s) {
    std::vector<std::string> out;
    std::string cur;
    for (char c : s) {
        if (c == '\n') { out.push_back(cur); cur.clear(); continue; }
        if (c != '\r') cur.push_back(c);
    }
    out.push_back(cur);
    return out;
}

bool blank(const std::string& line) {
    return line.find_first_not_of(" \t") == std::string::npos;
}

// Removes the common leading whitespace of non-blank lines and re-indents
// by `indent` spaces. Blank lines become empty.
std::string reindent(const std::string& body, int indent) {
    auto lines = split_lines(body);
    size_t common = std::string::npos;
    for (const auto& l : lines) {
        if (blank(l)) continue;
        size_t lead = l.find_first_not_of(" \t");
        if (lead < common) common = lead;
    }
    if (common == std::string::npos) common = 0;

    const std::string pad((size_t)indent, ' ');
    std::ostringstream out;
    for (const auto& l : lines) {
        if (blank(l)) { out << "\n"; continue; }
        out << pad << l.substr(common) << "\n";
    }
    return out.str();
}

std::string class_name_for(const std::string& tool_name) {
    return "_AgentboxTool_" + tool_name;
}

} // namespace

bool is_identifier(const std::string& s) {
    if (s.empty()) return false;
    const unsigned char c0 = (unsigned char)s[0];
    if (!(std::isalpha(c0) || c0 == '_')) return false;
    for (unsigned char c : s) {
        if (!(std::isalnum(c) || c == '_')) return false;
    }
    return python_keywords().count(s) == 0;
}

std::string py_string_literal(const std::string& s) {
    // json-c's escaping (without "\/") is valid double-quoted guest syntax.
    json_object* o = json_util::new_string(s);
    std::string out = json_util::to_plain(o);
    json_object_put(o);
    return out;
}

bool is_reserved_name(const std::string& name) {
    if (name == "final_answer") return true;
    if (name.compare(0, 10, "__agentbox") == 0) return true;
    return name.size() > 4 && name.compare(0, 2, "__") == 0 && name.compare(name.size() - 2, 2, "__") == 0;
}

std::string validate_tool(const ToolDefinition& t) {
    if (!is_identifier(t.name)) return "invalid tool name '" + t.name + "'";
    if (is_reserved_name(t.name)) return "tool name '" + t.name + "' is reserved by the sandbox";
    std::set<std::string> seen;
    for (const auto& in : t.inputs) {
        if (!is_identifier(in.name) || in.name == "self") return "tool " + t.name + ": invalid input name '" + in.name + "'";
        if (!seen.insert(in.name).second) return "tool " + t.name + ": duplicate input '" + in.name + "'";
    }
    if (t.forward_body.find_first_not_of(" \t\r\n") == std::string::npos) {
        return "tool " + t.name + ": empty forward body";
    }
    return "";
}

std::string tool_to_source(const ToolDefinition& t) {
    json_object* inputs = json_object_new_object();
    for (const auto& in : t.inputs) {
        json_object* d = json_object_new_object();
        json_object_object_add(d, "type", json_util::new_string(in.type));
        json_object_object_add(d, "description", json_util::new_string(in.description));
        if (in.nullable) json_object_object_add(d, "nullable", json_object_new_boolean(1));
        json_object_object_add(inputs, in.name.c_str(), d);
    }
    const std::string inputs_json = json_util::to_plain(inputs);
    json_object_put(inputs);

    // required inputs first so the generated signature stays valid
    std::ostringstream sig;
    sig << "self";
    for (const auto& in : t.inputs) if (!in.nullable) sig << ", " << in.name;
    for (const auto& in : t.inputs) if (in.nullable) sig << ", " << in.name << "=None";

    const std::string cls = class_name_for(t.name);
    std::ostringstream src;
    src << "class " << cls << ":\n";
    src << "    name = " << py_string_literal(t.name) << "\n";
    src << "    description = " << py_string_literal(t.description) << "\n";
    src << "    inputs = __import__('json').loads(" << py_string_literal(inputs_json) << ")\n";
    src << "    output_type = " << py_string_literal(t.output_type) << "\n";
    src << "\n";
    src << "    def forward(" << sig.str() << "):\n";
    src << reindent(t.forward_body, 8);
    src << "\n";
    src << "    def __call__(self, *args, **kwargs):\n";
    src << "        return self.forward(*args, **kwargs)\n";
    src << "\n";
    src << t.name << " = " << cls << "()\n";
    return src.str();
}

std::string tools_bootstrap_source(const std::vector<ToolDefinition>& tools) {
    std::ostringstream src;
    std::set<std::string> emitted;
    for (const auto& t : tools) {
        std::string err = validate_tool(t);
        if (!err.empty()) throw std::invalid_argument(err);
        for (const auto& imp : t.imports) {
            if (emitted.insert(imp).second) src << imp << "\n";
        }
    }
    for (const auto& t : tools) {
        src << "\n" << tool_to_source(t);
    }
    return src.str();
}

} // namespace agentbox
