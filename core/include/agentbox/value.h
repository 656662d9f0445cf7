#pragma once

#include <json-c/json.h>

#include <cstdint>
#include <string>
#include <utility>
#include <vector>

namespace agentbox {

// Value: the restricted set of values that may cross the sandbox boundary
// (state pushed in, final answers pulled out, tool-call arguments).
//
// Anything the guest produces outside this set arrives as OPAQUE: its type
// name and repr() text, never a live object.
struct Value {
    enum class Kind { NUL, BOOL, INT, FLOAT, STRING, BYTES, LIST, MAP, IMAGE, OPAQUE };

    Kind kind{Kind::NUL};
    bool b{false};
    int64_t i{0};
    double f{0.0};
    std::string str;     // STRING text, BYTES/IMAGE payload, OPAQUE repr
    std::string tag;     // IMAGE format ("png", "jpeg", ...), OPAQUE type name
    std::vector<Value> items;                          // LIST
    std::vector<std::pair<std::string, Value>> entries; // MAP, insertion order

    static Value null() { return Value{}; }
    static Value boolean(bool v);
    static Value integer(int64_t v);
    static Value number(double v);
    static Value string(std::string v);
    static Value bytes(std::string raw);
    static Value list(std::vector<Value> v);
    static Value map(std::vector<std::pair<std::string, Value>> v);
    static Value image(std::string format, std::string encoded);
    static Value opaque(std::string type_name, std::string repr);

    bool is_null() const { return kind == Kind::NUL; }

    // MAP lookup; nullptr when absent or not a map.
    const Value* find(const std::string& key) const;
    // MAP insert-or-assign, keeps the original position of an existing key.
    void set(const std::string& key, Value v);

    bool operator==(const Value& o) const;
    bool operator!=(const Value& o) const { return !(*this == o); }
};

const char* value_kind_name(Value::Kind k);

// Wire encoding (json-c). Caller owns the returned object.
json_object* value_to_json(const Value& v);

// Returns false and fills *err on a malformed wire value (unknown "$type",
// bad base64, wrong shape). *out is untouched on failure.
bool value_from_json(json_object* o, Value* out, std::string* err);

// Compact human-readable rendering used for observations and logs
// (strings unquoted at the top level, images summarized).
std::string value_to_display(const Value& v);

// "png", "jpeg", "gif", "webp", "bmp" from magic bytes, else "bin".
std::string sniff_image_format(const std::string& raw);

} // namespace agentbox
