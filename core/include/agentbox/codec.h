#pragma once
#include <cstdint>
#include <optional>
#include <string>

namespace agentbox::codec {

// ---------- FNV-1a 64 (stable, non-crypto) ----------
// Used as an integrity check on artifacts that cross the sandbox boundary;
// the guest-side driver computes the same function.
inline uint64_t fnv1a64_bytes(const uint8_t* data, size_t n) {
    uint64_t h = 1469598103934665603ULL;
    for (size_t i=0;i<n;i++) { h ^= data[i]; h *= 1099511628211ULL; }
    return h;
}
inline uint64_t fnv1a64(const std::string& s) {
    return fnv1a64_bytes(reinterpret_cast<const uint8_t*>(s.data()), s.size());
}
std::string hex64(uint64_t v);

// ---------- Base64 (RFC 4648, standard alphabet, padded) ----------
std::string base64_encode(const std::string& raw);

// Whitespace is ignored; anything else outside the alphabet, or a bad
// padding/length, yields nullopt.
std::optional<std::string> base64_decode(const std::string& text);

} // namespace agentbox::codec
