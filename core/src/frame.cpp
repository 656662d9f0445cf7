#include "agentbox/frame.h"

#include <algorithm>
#include <cctype>

namespace agentbox {

static const char kMagic[] = "AGBX ";
static constexpr size_t kMagicLen = sizeof(kMagic) - 1;
static constexpr size_t kMaxHeader = kMagicLen + 20 + 1;

std::string encode_frame(const std::string& payload) {
    std::string out = kMagic;
    out += std::to_string(payload.size());
    out += "\n";
    out += payload;
    return out;
}

FrameReader::Status FrameReader::next(std::string* payload) {
    size_t nl = buf_.find('\n');
    if (nl == std::string::npos) {
        if (buf_.size() > kMaxHeader) return Status::BAD_HEADER;
        // a partial header must still be a prefix of the magic
        size_t cmp = std::min(buf_.size(), kMagicLen);
        if (buf_.compare(0, cmp, kMagic, cmp) != 0) return Status::BAD_HEADER;
        return Status::NEED_MORE;
    }
    if (nl > kMaxHeader || buf_.compare(0, kMagicLen, kMagic) != 0) return Status::BAD_HEADER;

    size_t len = 0;
    if (nl == kMagicLen) return Status::BAD_HEADER;
    for (size_t i = kMagicLen; i < nl; i++) {
        unsigned char c = (unsigned char)buf_[i];
        if (!std::isdigit(c)) return Status::BAD_HEADER;
        len = len * 10 + (size_t)(c - '0');
        if (len > max_payload_) return Status::TOO_LARGE;
    }

    if (buf_.size() - (nl + 1) < len) return Status::NEED_MORE;
    if (payload) payload->assign(buf_, nl + 1, len);
    buf_.erase(0, nl + 1 + len);
    return Status::FRAME;
}

} // namespace agentbox
