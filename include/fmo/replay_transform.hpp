#pragma once
/**
 * @file replay_transform.hpp
 * @brief Turn a buffered frame into its echo: new uid, prefixed callsign, same payload.
 *
 * rewrite() sets `uid = echo_uid` and `callsign = prefix + callsign`, cut to
 * 12 bytes on a UTF-8 character boundary. version, padding1, padding2 and the
 * payload bytes are carried over unchanged.
 *
 * @code
 *   fmo::ReplayTransform t;                 // uid 65535, prefix "RE>"
 *   fmo::Frame echo = t.rewrite(original);  // "BD8BOJ" -> "RE>BD8BOJ"
 * @endcode
 */

#include <cstdint>
#include <string>
#include "fmo/frame_header.hpp"

namespace fmo {

class ReplayTransform {
public:
  explicit ReplayTransform(uint16_t echo_uid = ECHO_UID, std::string prefix = "RE>");

  Frame rewrite(const Frame& frame) const;

  /// Header-only variant used by tools that do not carry a payload around.
  FrameHeader rewrite_header(const FrameHeader& header) const;

  uint16_t echo_uid() const { return echo_uid_; }
  const std::string& prefix() const { return prefix_; }

private:
  uint16_t    echo_uid_;
  std::string prefix_;
};

} // namespace fmo
