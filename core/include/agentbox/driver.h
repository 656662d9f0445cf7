#pragma once

namespace agentbox {

// Source of the long-lived guest driver, run as `python3 -u -c <source>`.
//
// The driver keeps one execution namespace for the whole session and speaks
// the frame protocol (frame.h) on its inherited stdin/stdout, which it moves
// to private descriptors at startup:
//
//   -> {"op":"ready","pid":N,"python":"3.x.y"}                   once
//   <- {"op":"exec","id":N,"code":..,"artifact":..,"capture":..}
//   -> {"op":"done","id":N,"ok":..,"error":..,"error_type":..,
//       "final":..,"artifact_size":n|null,"artifact_fnv":".."}
//   <- {"op":"shutdown"}
//
// During a call fd 1 and fd 2 point at the capture file. A value emitted
// through the final/fetch hooks is written to the artifact path (.part,
// fsync, rename) before the done frame leaves.
const char* guest_driver_source();

} // namespace agentbox
