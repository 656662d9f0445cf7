#include "agentbox/value.h"
#include "agentbox/codec.h"
#include "agentbox/json_util.h"

#include <cmath>
#include <sstream>

namespace agentbox {

Value Value::boolean(bool v) { Value x; x.kind = Kind::BOOL; x.b = v; return x; }
Value Value::integer(int64_t v) { Value x; x.kind = Kind::INT; x.i = v; return x; }
Value Value::number(double v) { Value x; x.kind = Kind::FLOAT; x.f = v; return x; }
Value Value::string(std::string v) { Value x; x.kind = Kind::STRING; x.str = std::move(v); return x; }
Value Value::bytes(std::string raw) { Value x; x.kind = Kind::BYTES; x.str = std::move(raw); return x; }
Value Value::list(std::vector<Value> v) { Value x; x.kind = Kind::LIST; x.items = std::move(v); return x; }

Value Value::map(std::vector<std::pair<std::string, Value>> v) {
    Value x;
    x.kind = Kind::MAP;
    for (auto& kv : v) x.set(kv.first, std::move(kv.second));
    return x;
}

Value Value::image(std::string format, std::string encoded) {
    Value x;
    x.kind = Kind::IMAGE;
    x.tag = std::move(format);
    x.str = std::move(encoded);
    return x;
}

Value Value::opaque(std::string type_name, std::string repr) {
    Value x;
    x.kind = Kind::OPAQUE;
    x.tag = std::move(type_name);
    x.str = std::move(repr);
    return x;
}

const Value* Value::find(const std::string& key) const {
    if (kind != Kind::MAP) return nullptr;
    for (const auto& kv : entries) {
        if (kv.first == key) return &kv.second;
    }
    return nullptr;
}

void Value::set(const std::string& key, Value v) {
    kind = Kind::MAP;
    for (auto& kv : entries) {
        if (kv.first == key) { kv.second = std::move(v); return; }
    }
    entries.emplace_back(key, std::move(v));
}

bool Value::operator==(const Value& o) const {
    if (kind != o.kind) return false;
    switch (kind) {
        case Kind::NUL:    return true;
        case Kind::BOOL:   return b == o.b;
        case Kind::INT:    return i == o.i;
        case Kind::FLOAT:  return f == o.f || (std::isnan(f) && std::isnan(o.f));
        case Kind::STRING:
        case Kind::BYTES:  return str == o.str;
        case Kind::LIST:   return items == o.items;
        case Kind::MAP:    return entries == o.entries;
        case Kind::IMAGE:
        case Kind::OPAQUE: return tag == o.tag && str == o.str;
    }
    return false;
}

const char* value_kind_name(Value::Kind k) {
    switch (k) {
        case Value::Kind::NUL:    return "null";
        case Value::Kind::BOOL:   return "bool";
        case Value::Kind::INT:    return "int";
        case Value::Kind::FLOAT:  return "float";
        case Value::Kind::STRING: return "string";
        case Value::Kind::BYTES:  return "bytes";
        case Value::Kind::LIST:   return "list";
        case Value::Kind::MAP:    return "map";
        case Value::Kind::IMAGE:  return "image";
        case Value::Kind::OPAQUE: return "repr";
    }
    return "unknown";
}

// --- wire encoding ---

static json_object* tagged(const char* type) {
    json_object* o = json_object_new_object();
    json_object_object_add(o, "$type", json_object_new_string(type));
    return o;
}

json_object* value_to_json(const Value& v) {
    switch (v.kind) {
    case Value::Kind::NUL:
        return nullptr;
    case Value::Kind::BOOL:
        return json_object_new_boolean(v.b ? 1 : 0);
    case Value::Kind::INT:
        return json_object_new_int64(v.i);
    case Value::Kind::FLOAT:
        return json_object_new_double(v.f);
    case Value::Kind::STRING:
        return json_util::new_string(v.str);
    case Value::Kind::BYTES: {
        json_object* o = tagged("bytes");
        json_object_object_add(o, "data", json_util::new_string(codec::base64_encode(v.str)));
        return o;
    }
    case Value::Kind::LIST: {
        json_object* a = json_object_new_array();
        for (const auto& it : v.items) json_object_array_add(a, value_to_json(it));
        return a;
    }
    case Value::Kind::MAP: {
        json_object* m = json_object_new_object();
        for (const auto& kv : v.entries) {
            json_object_object_add(m, kv.first.c_str(), value_to_json(kv.second));
        }
        if (v.find("$type") == nullptr) return m;
        // a user map carrying "$type" would read back as a tagged value
        json_object* o = tagged("map");
        json_object_object_add(o, "entries", m);
        return o;
    }
    case Value::Kind::IMAGE: {
        json_object* o = tagged("image");
        json_object_object_add(o, "format", json_util::new_string(v.tag));
        json_object_object_add(o, "data", json_util::new_string(codec::base64_encode(v.str)));
        return o;
    }
    case Value::Kind::OPAQUE: {
        json_object* o = tagged("repr");
        json_object_object_add(o, "type", json_util::new_string(v.tag));
        json_object_object_add(o, "text", json_util::new_string(v.str));
        return o;
    }
    }
    return nullptr;
}

static bool decode_b64_field(json_object* o, const char* key, std::string* out, std::string* err) {
    auto s = json_util::get_string(o, key);
    if (!s) { *err = std::string("missing string field '") + key + "'"; return false; }
    auto raw = codec::base64_decode(*s);
    if (!raw) { *err = std::string("field '") + key + "' is not valid base64"; return false; }
    *out = std::move(*raw);
    return true;
}

static bool decode_map_entries(json_object* o, Value* out, std::string* err) {
    Value m;
    m.kind = Value::Kind::MAP;
    json_object_object_foreach(o, k, child) {
        Value cv;
        if (!value_from_json(child, &cv, err)) {
            *err = std::string("at key '") + k + "': " + *err;
            return false;
        }
        m.entries.emplace_back(k, std::move(cv));
    }
    *out = std::move(m);
    return true;
}

bool value_from_json(json_object* o, Value* out, std::string* err) {
    std::string scratch;
    if (!err) err = &scratch;
    if (!out) { *err = "null output"; return false; }

    if (!o) { *out = Value::null(); return true; }

    switch (json_object_get_type(o)) {
    case json_type_null:
        *out = Value::null();
        return true;
    case json_type_boolean:
        *out = Value::boolean(json_object_get_boolean(o) != 0);
        return true;
    case json_type_int:
        *out = Value::integer(json_object_get_int64(o));
        return true;
    case json_type_double:
        *out = Value::number(json_object_get_double(o));
        return true;
    case json_type_string:
        *out = Value::string(std::string(json_object_get_string(o), (size_t)json_object_get_string_len(o)));
        return true;
    case json_type_array: {
        Value l;
        l.kind = Value::Kind::LIST;
        const size_t n = json_object_array_length(o);
        l.items.reserve(n);
        for (size_t idx = 0; idx < n; idx++) {
            Value item;
            if (!value_from_json(json_object_array_get_idx(o, idx), &item, err)) {
                *err = "at index " + std::to_string(idx) + ": " + *err;
                return false;
            }
            l.items.push_back(std::move(item));
        }
        *out = std::move(l);
        return true;
    }
    case json_type_object:
        break;
    }

    json_object* typev = json_util::get_field(o, "$type");
    if (!typev) return decode_map_entries(o, out, err);
    if (!json_object_is_type(typev, json_type_string)) {
        *err = "\"$type\" must be a string";
        return false;
    }
    const std::string type = json_object_get_string(typev);

    if (type == "bytes") {
        std::string raw;
        if (!decode_b64_field(o, "data", &raw, err)) return false;
        *out = Value::bytes(std::move(raw));
        return true;
    }
    if (type == "image") {
        auto fmt = json_util::get_string(o, "format");
        if (!fmt) { *err = "image without format"; return false; }
        std::string raw;
        if (!decode_b64_field(o, "data", &raw, err)) return false;
        *out = Value::image(*fmt, std::move(raw));
        return true;
    }
    if (type == "repr") {
        auto tn = json_util::get_string(o, "type");
        auto text = json_util::get_string(o, "text");
        if (!tn || !text) { *err = "repr without type/text"; return false; }
        *out = Value::opaque(*tn, *text);
        return true;
    }
    if (type == "map") {
        json_object* entries = json_util::get_field(o, "entries");
        if (!entries || !json_object_is_type(entries, json_type_object)) {
            *err = "escaped map without entries object";
            return false;
        }
        return decode_map_entries(entries, out, err);
    }
    *err = "unknown $type '" + type + "'";
    return false;
}

static void display_into(const Value& v, std::ostringstream& out, bool top) {
    switch (v.kind) {
    case Value::Kind::NUL:    out << "None"; break;
    case Value::Kind::BOOL:   out << (v.b ? "True" : "False"); break;
    case Value::Kind::INT:    out << v.i; break;
    case Value::Kind::FLOAT: {
        json_object* d = json_object_new_double(v.f);
        out << json_util::to_plain(d);
        json_object_put(d);
        break;
    }
    case Value::Kind::STRING:
        if (top) {
            out << v.str;
        } else {
            json_object* s = json_util::new_string(v.str);
            out << json_util::to_plain(s);
            json_object_put(s);
        }
        break;
    case Value::Kind::BYTES:  out << "<bytes len=" << v.str.size() << ">"; break;
    case Value::Kind::LIST:
        out << "[";
        for (size_t k = 0; k < v.items.size(); k++) {
            if (k) out << ", ";
            display_into(v.items[k], out, false);
        }
        out << "]";
        break;
    case Value::Kind::MAP:
        out << "{";
        for (size_t k = 0; k < v.entries.size(); k++) {
            if (k) out << ", ";
            json_object* s = json_util::new_string(v.entries[k].first);
            out << json_util::to_plain(s) << ": ";
            json_object_put(s);
            display_into(v.entries[k].second, out, false);
        }
        out << "}";
        break;
    case Value::Kind::IMAGE:  out << "<image " << v.tag << " len=" << v.str.size() << ">"; break;
    case Value::Kind::OPAQUE: out << v.str; break;
    }
}

std::string value_to_display(const Value& v) {
    std::ostringstream out;
    display_into(v, out, true);
    return out.str();
}

std::string sniff_image_format(const std::string& raw) {
    auto starts = [&](const char* magic, size_t n) {
        return raw.size() >= n && raw.compare(0, n, magic, n) == 0;
    };
    if (starts("\x89PNG\r\n\x1a\n", 8)) return "png";
    if (starts("\xff\xd8\xff", 3)) return "jpeg";
    if (starts("GIF87a", 6) || starts("GIF89a", 6)) return "gif";
    if (raw.size() >= 12 && starts("RIFF", 4) && raw.compare(8, 4, "WEBP") == 0) return "webp";
    if (starts("BM", 2)) return "bmp";
    return "bin";
}

} // namespace agentbox
