#include "agentbox/json_util.h"

#include <algorithm>
#include <climits>
#include <sstream>
#include <vector>

namespace agentbox::json_util {

bool parse_ok(const std::string& json, Doc* out) {
    json_tokener* tok = json_tokener_new();
    if (!tok) return false;
    // +1 hands the terminating NUL to the tokener so a bare top-level number
    // is complete rather than "continue".
    const int len = static_cast<int>(std::min(json.size() + 1, static_cast<size_t>(INT_MAX)));
    json_object* obj = json_tokener_parse_ex(tok, json.c_str(), len);
    json_tokener_error jerr = json_tokener_get_error(tok);
    // trailing garbage after a complete value is an error too
    const bool trailing = jerr == json_tokener_success &&
                          static_cast<size_t>(json_tokener_get_parse_end(tok)) < json.size() &&
                          json.find_first_not_of(" \t\r\n", json_tokener_get_parse_end(tok)) != std::string::npos;
    json_tokener_free(tok);
    if (jerr != json_tokener_success || trailing) {
        if (obj) json_object_put(obj);
        return false;
    }
    if (out) *out = Doc{obj};
    else if (obj) json_object_put(obj);
    return true;
}

Doc parse(const std::string& json) {
    Doc d;
    if (!parse_ok(json, &d)) return Doc{};
    return d;
}

json_object* get_field(json_object* o, const char* key) {
    if (!o || !json_object_is_type(o, json_type_object)) return nullptr;
    json_object* v = nullptr;
    if (!json_object_object_get_ex(o, key, &v)) return nullptr;
    return v;
}

std::optional<std::string> get_string(json_object* o, const char* key) {
    json_object* v = get_field(o, key);
    if (!v || !json_object_is_type(v, json_type_string)) return std::nullopt;
    return std::string(json_object_get_string(v), (size_t)json_object_get_string_len(v));
}

std::optional<int64_t> get_int(json_object* o, const char* key) {
    json_object* v = get_field(o, key);
    if (!v || !json_object_is_type(v, json_type_int)) return std::nullopt;
    return static_cast<int64_t>(json_object_get_int64(v));
}

std::optional<double> get_double(json_object* o, const char* key) {
    json_object* v = get_field(o, key);
    if (!v) return std::nullopt;
    if (!(json_object_is_type(v, json_type_double) || json_object_is_type(v, json_type_int))) return std::nullopt;
    return json_object_get_double(v);
}

std::optional<bool> get_bool(json_object* o, const char* key) {
    json_object* v = get_field(o, key);
    if (!v || !json_object_is_type(v, json_type_boolean)) return std::nullopt;
    return json_object_get_boolean(v) != 0;
}

json_object* new_string(const std::string& s) {
    return json_object_new_string_len(s.c_str(), (int)s.size());
}

std::string to_plain(json_object* o) {
    if (!o) return "null";
    return json_object_to_json_string_ext(o, JSON_C_TO_STRING_PLAIN | JSON_C_TO_STRING_NOSLASHESCAPE);
}

std::string to_pretty(json_object* o) {
    if (!o) return "null";
    return json_object_to_json_string_ext(o, JSON_C_TO_STRING_PRETTY | JSON_C_TO_STRING_NOSLASHESCAPE);
}

static void canonical_serialize(json_object* obj, std::ostringstream& out) {
    if (!obj) { out << "null"; return; }

    switch (json_object_get_type(obj)) {
    case json_type_object: {
        std::vector<std::string> keys;
        json_object_object_foreach(obj, k, v) {
            (void)v;
            keys.emplace_back(k);
        }
        std::sort(keys.begin(), keys.end());

        out << "{";
        for (size_t i = 0; i < keys.size(); i++) {
            if (i > 0) out << ",";
            json_object* ks = new_string(keys[i]);
            out << to_plain(ks);
            json_object_put(ks);
            out << ":";
            json_object* val = nullptr;
            json_object_object_get_ex(obj, keys[i].c_str(), &val);
            canonical_serialize(val, out);
        }
        out << "}";
        break;
    }
    case json_type_array: {
        out << "[";
        const size_t len = json_object_array_length(obj);
        for (size_t i = 0; i < len; i++) {
            if (i > 0) out << ",";
            canonical_serialize(json_object_array_get_idx(obj, i), out);
        }
        out << "]";
        break;
    }
    default:
        out << to_plain(obj);
        break;
    }
}

std::string canonical(json_object* o) {
    std::ostringstream out;
    canonical_serialize(o, out);
    return out.str();
}

} // namespace agentbox::json_util
