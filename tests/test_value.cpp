#include "test_common.h"

#include "agentbox/codec.h"
#include "agentbox/json_util.h"
#include "agentbox/value.h"

#include <cmath>

using namespace agentbox;

static Value from_text(const std::string& text) {
    json_util::Doc d;
    expect_true(json_util::parse_ok(text, &d), "fixture should parse: " + text);
    Value v;
    std::string err;
    expect_true(value_from_json(d.root, &v, &err), "fixture should decode: " + err);
    return v;
}

static bool rejects(const std::string& text) {
    json_util::Doc d;
    if (!json_util::parse_ok(text, &d)) return true;
    Value v;
    std::string err;
    return !value_from_json(d.root, &v, &err);
}

int main() {
    // Test 1: base64 and FNV-1a
    {
        expect_eq_str(codec::base64_encode(""), "", "empty base64");
        expect_eq_str(codec::base64_encode("foobar"), "Zm9vYmFy", "base64 foobar");
        expect_eq_str(codec::base64_encode("fo"), "Zm8=", "base64 padding");
        auto d = codec::base64_decode("Zm9v\nYmFy");
        expect_true(d && *d == "foobar", "decode ignores whitespace");
        expect_true(!codec::base64_decode("Zm9=v"), "padding in the middle rejected");
        expect_true(!codec::base64_decode("Zm9"), "bad length rejected");
        expect_true(!codec::base64_decode("Zm*v"), "bad alphabet rejected");

        expect_eq_str(codec::hex64(codec::fnv1a64("")), "cbf29ce484222325", "fnv1a64 of empty input");
        expect_eq_str(codec::hex64(codec::fnv1a64("a")), "af63dc4c8601ec8c", "fnv1a64 of 'a'");
    }

    // Test 2: wire encoding of plain values and tags
    {
        Value m = Value::map({
            {"n", Value::integer(3)},
            {"s", Value::string("hi")},
            {"l", Value::list({Value::boolean(true), Value::null()})},
        });
        json_util::Doc j(value_to_json(m));
        expect_eq_str(json_util::to_plain(j.root), "{\"n\":3,\"s\":\"hi\",\"l\":[true,null]}", "plain map encoding");

        json_util::Doc b(value_to_json(Value::bytes("foobar")));
        expect_eq_str(json_util::canonical(b.root), "{\"$type\":\"bytes\",\"data\":\"Zm9vYmFy\"}", "bytes tag");

        json_util::Doc o(value_to_json(Value::opaque("set", "{1, 2}")));
        expect_eq_str(json_util::canonical(o.root), "{\"$type\":\"repr\",\"text\":\"{1, 2}\",\"type\":\"set\"}",
                      "repr tag");

        // a user map that happens to carry "$type" is escaped
        Value tricky = Value::map({{"$type", Value::string("bytes")}});
        json_util::Doc t(value_to_json(tricky));
        expect_true(json_util::get_string(t.root, "$type").value_or("") == "map", "escaped map tag");
        Value back;
        std::string err;
        expect_true(value_from_json(t.root, &back, &err), "escaped map decodes");
        expect_true(back == tricky, "escaped map comes back unchanged");
    }

    // Test 3: decoding and rejection
    {
        Value v = from_text("{\"a\":[1,2.5,\"x\"],\"img\":{\"$type\":\"image\",\"format\":\"png\",\"data\":\"iVBORw==\"}}");
        expect_true(v.kind == Value::Kind::MAP, "map kind");
        const Value* a = v.find("a");
        expect_true(a && a->kind == Value::Kind::LIST && a->items.size() == 3, "list decoded");
        expect_true(a->items[1].kind == Value::Kind::FLOAT && a->items[1].f == 2.5, "float decoded");
        const Value* img = v.find("img");
        expect_true(img && img->kind == Value::Kind::IMAGE && img->tag == "png", "image decoded");
        expect_eq_ll((long long)img->str.size(), 4, "image payload bytes");

        expect_true(rejects("{\"$type\":\"pickle\",\"data\":\"\"}"), "unknown tag rejected");
        expect_true(rejects("{\"$type\":\"bytes\",\"data\":\"***\"}"), "bad base64 rejected");
        expect_true(rejects("{\"$type\":\"repr\",\"type\":\"x\"}"), "repr without text rejected");
        expect_true(rejects("{\"$type\":5}"), "non-string tag rejected");
    }

    // Test 4: equality, set and display
    {
        Value m = Value::map({{"a", Value::integer(1)}});
        m.set("b", Value::string("two"));
        m.set("a", Value::integer(9));
        expect_eq_ll((long long)m.entries.size(), 2, "set inserts or assigns");
        expect_eq_str(m.entries[0].first, "a", "assign keeps position");
        expect_true(m.find("a")->i == 9, "assigned value");
        expect_true(Value::number(std::nan("")) == Value::number(std::nan("")), "NaN compares equal");
        expect_true(Value::integer(1) != Value::number(1.0), "int and float differ");

        expect_eq_str(value_to_display(Value::string("plain")), "plain", "top-level string unquoted");
        expect_eq_str(value_to_display(Value::list({Value::string("a"), Value::null(), Value::boolean(false)})),
                      "[\"a\", None, False]", "nested display");
        expect_eq_str(value_to_display(m), "{\"a\": 9, \"b\": \"two\"}", "map display");
    }

    // Test 5: image sniffing
    {
        expect_eq_str(sniff_image_format(std::string("\x89PNG\r\n\x1a\n....", 12)), "png", "png magic");
        expect_eq_str(sniff_image_format("\xff\xd8\xff\xe0"), "jpeg", "jpeg magic");
        expect_eq_str(sniff_image_format("GIF89a.."), "gif", "gif magic");
        expect_eq_str(sniff_image_format(std::string("RIFF\x10\x00\x00\x00WEBPVP8 ", 16)), "webp", "webp magic");
        expect_eq_str(sniff_image_format("hello"), "bin", "unknown");
    }

    std::cerr << "test_value: ALL PASSED" << std::endl;
    return 0;
}
