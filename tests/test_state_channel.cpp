#include "test_common.h"

#include "agentbox/codec.h"
#include "agentbox/errors.h"
#include "agentbox/state_channel.h"

using namespace agentbox;

static bool decode_fails(const std::string& text, uint64_t size, const std::string& fnv) {
    try {
        (void)state_channel::decode_artifact(text, size, fnv);
    } catch (const ResultDecodeError&) {
        return true;
    }
    return false;
}

int main() {
    // Test 1: encode a state mapping and generate loader/fetch statements
    {
        StateMap vars;
        vars["a"] = Value::integer(7);
        vars["blob"] = Value::bytes("\x01\x02");
        std::string enc = state_channel::encode(vars);
        expect_eq_str(enc, "{\"a\":7,\"blob\":{\"$type\":\"bytes\",\"data\":\"AQI=\"}}", "encoded state");

        expect_eq_str(state_channel::loader_snippet("/w/state-1.json"),
                      "globals().update(__agentbox_load_state__(\"/w/state-1.json\"))\n", "loader statement");
        expect_eq_str(state_channel::fetch_snippet("a"), "__agentbox_fetch__(\"a\")\n", "fetch statement");
    }

    // Test 2: names must be identifiers
    {
        StateMap bad;
        bad["not ok"] = Value::null();
        bool threw = false;
        try {
            state_channel::check_names(bad);
        } catch (const ExecutionError& e) {
            threw = true;
            expect_true(e.kind() == ErrorKind::EXECUTION, "reported as an execution error");
            expect_true(contains(e.what(), "'not ok'"), "offending name in the message");
        }
        expect_true(threw, "non-identifier name rejected");
    }

    // Test 3: artifact decoding with integrity checks
    {
        const std::string text = "{\"answer\":[1,2,3]}";
        const std::string fnv = codec::hex64(codec::fnv1a64(text));
        Value v = state_channel::decode_artifact(text, text.size(), fnv);
        expect_true(v.kind == Value::Kind::MAP && v.find("answer") != nullptr, "decoded artifact");
        expect_eq_ll((long long)v.find("answer")->items.size(), 3, "artifact list length");

        expect_true(decode_fails(text, text.size() + 1, fnv), "size mismatch");
        expect_true(decode_fails(text, text.size(), "0000000000000000"), "checksum mismatch");
        const std::string truncated = text.substr(0, 8);
        expect_true(decode_fails(truncated, truncated.size(), codec::hex64(codec::fnv1a64(truncated))),
                    "truncated JSON");
        const std::string badtag = "{\"$type\":\"pickle\"}";
        expect_true(decode_fails(badtag, badtag.size(), codec::hex64(codec::fnv1a64(badtag))), "bad tag");

        Value n = state_channel::decode_artifact("null", 4, "");
        expect_true(n.is_null(), "null artifact is a null value");
    }

    std::cerr << "test_state_channel: ALL PASSED" << std::endl;
    return 0;
}
