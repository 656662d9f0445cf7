#pragma once

#include "value.h"

#include <map>
#include <string>

namespace agentbox {

using StateMap = std::map<std::string, Value>;

// Names of the guest-side hooks the sandbox driver installs in the
// execution namespace.
namespace guest_hooks {
inline constexpr const char* kFinal = "__agentbox_final__";
inline constexpr const char* kFetch = "__agentbox_fetch__";
inline constexpr const char* kLoadState = "__agentbox_load_state__";
inline constexpr const char* kPip = "__agentbox_pip__";
} // namespace guest_hooks

// Moves named values across the sandbox boundary.
//
// Host -> guest: the mapping is encoded as one JSON object (wire values),
// written to a file the guest can read, and merged into the guest globals
// by a generated loader statement (update, not replace).
//
// Guest -> host: the guest encodes a value into an artifact file; the host
// checks size and FNV-1a before decoding it.
namespace state_channel {

// Throws ExecutionError if a name is not a plain identifier.
void check_names(const StateMap& vars);

std::string encode(const StateMap& vars);

// Statement run in the guest before user code; `guest_path` is where the
// encoded mapping is visible inside the environment.
std::string loader_snippet(const std::string& guest_path);

// Statement that emits the named global through the artifact path (a
// NameError in the guest when undefined).
std::string fetch_snippet(const std::string& name);

// Decodes artifact text. Throws ResultDecodeError on size/checksum mismatch
// or a malformed wire value.
Value decode_artifact(const std::string& text, uint64_t expected_size, const std::string& expected_fnv_hex);

} // namespace state_channel
} // namespace agentbox
