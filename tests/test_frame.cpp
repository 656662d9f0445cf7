#include "test_common.h"

#include "agentbox/frame.h"

#include <vector>

using agentbox::FrameReader;
using agentbox::encode_frame;

int main() {
    // Test 1: encode
    expect_eq_str(encode_frame("{}"), "AGBX 2\n{}", "frame header");
    expect_eq_str(encode_frame(""), "AGBX 0\n", "empty payload");

    // Test 2: byte-at-a-time delivery of two frames
    {
        FrameReader r;
        const std::string wire = encode_frame("{\"op\":\"ready\"}") + encode_frame("line1\nline2");
        std::string p;
        std::vector<std::string> got;
        for (char c : wire) {
            r.feed(&c, 1);
            for (;;) {
                auto st = r.next(&p);
                if (st == FrameReader::Status::FRAME) { got.push_back(p); continue; }
                expect_true(st == FrameReader::Status::NEED_MORE, "no error while streaming");
                break;
            }
        }
        expect_eq_ll((long long)got.size(), 2, "two frames");
        expect_eq_str(got[0], "{\"op\":\"ready\"}", "first payload");
        expect_eq_str(got[1], "line1\nline2", "payload may contain newlines");
        expect_eq_ll((long long)r.buffered(), 0, "nothing left over");
    }

    // Test 3: malformed headers
    {
        FrameReader r;
        std::string junk = "hello world\n";
        r.feed(junk.data(), junk.size());
        std::string p;
        expect_true(r.next(&p) == FrameReader::Status::BAD_HEADER, "foreign text rejected");

        FrameReader early;
        early.feed("AGB", 3);
        expect_true(early.next(&p) == FrameReader::Status::NEED_MORE, "partial magic waits");
        early.feed("Q", 1);
        expect_true(early.next(&p) == FrameReader::Status::BAD_HEADER, "wrong magic detected before newline");

        FrameReader nolen;
        nolen.feed("AGBX \n", 6);
        expect_true(nolen.next(&p) == FrameReader::Status::BAD_HEADER, "missing length");

        FrameReader big(16);
        std::string h = "AGBX 17\n";
        big.feed(h.data(), h.size());
        expect_true(big.next(&p) == FrameReader::Status::TOO_LARGE, "payload limit enforced");
    }

    std::cerr << "test_frame: ALL PASSED" << std::endl;
    return 0;
}
