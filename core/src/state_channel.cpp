#include "agentbox/state_channel.h"
#include "agentbox/codec.h"
#include "agentbox/errors.h"
#include "agentbox/json_util.h"
#include "agentbox/tool_source.h"


namespace agentbox::state_channel {

void check_names(const StateMap& vars) {
    for (const auto& kv : vars) {
        if (!is_identifier(kv.first)) {
            const std::string msg = "state variable name is not an identifier: '" + kv.first + "'";
            throw ExecutionError(msg, msg);
        }
    }
}

std::string encode(const StateMap& vars) {
    json_object* o = json_object_new_object();
    for (const auto& kv : vars) {
        json_object_object_add(o, kv.first.c_str(), value_to_json(kv.second));
    }
    std::string out = json_util::to_plain(o);
    json_object_put(o);
    return out;
}

std::string loader_snippet(const std::string& guest_path) {
    return std::string("globals().update(") + guest_hooks::kLoadState + "(" + py_string_literal(guest_path) + "))\n";
}

std::string fetch_snippet(const std::string& name) {
    return std::string(guest_hooks::kFetch) + "(" + py_string_literal(name) + ")\n";
}

Value decode_artifact(const std::string& text, uint64_t expected_size, const std::string& expected_fnv_hex) {
    if (text.size() != expected_size) {
        throw ResultDecodeError("artifact size mismatch: got " + std::to_string(text.size()) +
                                " bytes, expected " + std::to_string(expected_size));
    }
    const std::string fnv = codec::hex64(codec::fnv1a64(text));
    if (!expected_fnv_hex.empty() && fnv != expected_fnv_hex) {
        throw ResultDecodeError("artifact checksum mismatch: " + fnv + " != " + expected_fnv_hex);
    }

    json_util::Doc d;
    if (!json_util::parse_ok(text, &d)) {
        throw ResultDecodeError("artifact is not valid JSON", text.substr(0, 512));
    }
    Value v;
    std::string err;
    if (!value_from_json(d.root, &v, &err)) {
        throw ResultDecodeError("artifact is not a valid wire value: " + err, text.substr(0, 512));
    }
    return v;
}

} // namespace agentbox::state_channel
