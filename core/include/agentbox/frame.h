#pragma once

#include <cstddef>
#include <string>

namespace agentbox {

// Framing of the host <-> sandbox control channel.
//
//   AGBX <decimal payload length>\n<payload bytes>
//
// Payloads are JSON documents. A frame is only acted on once it is
// complete, so a completion message can never be confused with guest
// output and nothing depends on scanning text for markers.
std::string encode_frame(const std::string& payload);

class FrameReader {
public:
    enum class Status { NEED_MORE, FRAME, BAD_HEADER, TOO_LARGE };

    explicit FrameReader(size_t max_payload = 64 * 1024 * 1024) : max_payload_(max_payload) {}

    void feed(const char* data, size_t n) { buf_.append(data, n); }

    // Extracts the next complete payload. After BAD_HEADER or TOO_LARGE the
    // stream is unusable.
    Status next(std::string* payload);

    size_t buffered() const { return buf_.size(); }

private:
    std::string buf_;
    size_t max_payload_;
};

} // namespace agentbox
