#pragma once

// Thin helpers over json-c: an owning handle, strict parsing, typed field
// access and canonical (sorted-key) serialization.

#include <json-c/json.h>

#include <cstdint>
#include <optional>
#include <string>

namespace agentbox::json_util {

// Owns one json-c reference.
struct Doc {
    json_object* root{nullptr};

    Doc() = default;
    explicit Doc(json_object* r) : root(r) {}
    Doc(const Doc&) = delete;
    Doc& operator=(const Doc&) = delete;

    Doc(Doc&& other) noexcept : root(other.root) { other.root = nullptr; }
    Doc& operator=(Doc&& other) noexcept {
        if (this != &other) {
            if (root) json_object_put(root);
            root = other.root;
            other.root = nullptr;
        }
        return *this;
    }

    ~Doc() {
        if (root) json_object_put(root);
    }

    // Hands the reference to the caller.
    json_object* release() {
        json_object* r = root;
        root = nullptr;
        return r;
    }

    explicit operator bool() const { return root != nullptr; }
};

// Strict parse of a complete document. A literal `null` and any syntax error
// both come back as an empty Doc; use parse_ok() to tell them apart.
Doc parse(const std::string& json);
bool parse_ok(const std::string& json, Doc* out);

std::optional<std::string> get_string(json_object* o, const char* key);
std::optional<int64_t> get_int(json_object* o, const char* key);
std::optional<double> get_double(json_object* o, const char* key);
std::optional<bool> get_bool(json_object* o, const char* key);
json_object* get_field(json_object* o, const char* key);

json_object* new_string(const std::string& s);

std::string to_plain(json_object* o);
std::string to_pretty(json_object* o);

// Recursively serialize with sorted object keys. Deterministic for equal
// documents regardless of insertion order.
std::string canonical(json_object* o);

} // namespace agentbox::json_util
