#include "agentbox/codec.h"

#include <iomanip>
#include <sstream>

namespace agentbox::codec {

static const char kAlphabet[] =
    "ABCDEFGHIJKLMNOPQRSTUVWXYZabcdefghijklmnopqrstuvwxyz0123456789+/";

std::string hex64(uint64_t v) {
    std::ostringstream oss;
    oss << std::hex << std::setw(16) << std::setfill('0') << v;
    return oss.str();
}

std::string base64_encode(const std::string& raw) {
    std::string out;
    out.reserve(((raw.size() + 2) / 3) * 4);
    size_t i = 0;
    const auto* p = reinterpret_cast<const unsigned char*>(raw.data());
    for (; i + 2 < raw.size(); i += 3) {
        uint32_t n = (uint32_t(p[i]) << 16) | (uint32_t(p[i+1]) << 8) | uint32_t(p[i+2]);
        out.push_back(kAlphabet[(n >> 18) & 63]);
        out.push_back(kAlphabet[(n >> 12) & 63]);
        out.push_back(kAlphabet[(n >> 6) & 63]);
        out.push_back(kAlphabet[n & 63]);
    }
    size_t rest = raw.size() - i;
    if (rest == 1) {
        uint32_t n = uint32_t(p[i]) << 16;
        out.push_back(kAlphabet[(n >> 18) & 63]);
        out.push_back(kAlphabet[(n >> 12) & 63]);
        out += "==";
    } else if (rest == 2) {
        uint32_t n = (uint32_t(p[i]) << 16) | (uint32_t(p[i+1]) << 8);
        out.push_back(kAlphabet[(n >> 18) & 63]);
        out.push_back(kAlphabet[(n >> 12) & 63]);
        out.push_back(kAlphabet[(n >> 6) & 63]);
        out.push_back('=');
    }
    return out;
}

static int sextet(char c) {
    if (c >= 'A' && c <= 'Z') return c - 'A';
    if (c >= 'a' && c <= 'z') return c - 'a' + 26;
    if (c >= '0' && c <= '9') return c - '0' + 52;
    if (c == '+') return 62;
    if (c == '/') return 63;
    return -1;
}

std::optional<std::string> base64_decode(const std::string& text) {
    std::string clean;
    clean.reserve(text.size());
    for (char c : text) {
        if (c == ' ' || c == '\n' || c == '\r' || c == '\t') continue;
        clean.push_back(c);
    }
    if (clean.size() % 4 != 0) return std::nullopt;

    std::string out;
    out.reserve(clean.size() / 4 * 3);
    for (size_t i = 0; i < clean.size(); i += 4) {
        int v[4];
        int pad = 0;
        for (int k = 0; k < 4; k++) {
            char c = clean[i + k];
            if (c == '=') {
                // padding only allowed in the last quantum, last two positions
                if (i + 4 != clean.size() || k < 2) return std::nullopt;
                v[k] = 0;
                pad++;
                continue;
            }
            if (pad) return std::nullopt;
            v[k] = sextet(c);
            if (v[k] < 0) return std::nullopt;
        }
        uint32_t n = (uint32_t(v[0]) << 18) | (uint32_t(v[1]) << 12) | (uint32_t(v[2]) << 6) | uint32_t(v[3]);
        out.push_back((char)((n >> 16) & 0xFF));
        if (pad < 2) out.push_back((char)((n >> 8) & 0xFF));
        if (pad < 1) out.push_back((char)(n & 0xFF));
    }
    return out;
}

} // namespace agentbox::codec
