#pragma once
/**
 * @file loop_filter.hpp
 * @brief Tell original frames apart from frames this service replayed itself.
 *
 * The only signal is the uid field: a frame carrying the echo uid is our own
 * output coming back through the channel and must not be buffered again.
 */

#include <cstdint>
#include "fmo/frame_header.hpp"

namespace fmo {

class LoopFilter {
public:
  explicit LoopFilter(uint16_t echo_uid = ECHO_UID) : echo_uid_(echo_uid) {}

  /// false iff header.uid == echo uid. No other field is consulted.
  bool accept(const FrameHeader& header) const;

  uint16_t echo_uid() const { return echo_uid_; }

private:
  uint16_t echo_uid_;
};

} // namespace fmo
