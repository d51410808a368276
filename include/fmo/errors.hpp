#pragma once
/**
 * @file errors.hpp
 * @brief Error kinds reported by the echo core. Returned as values, never thrown.
 */

#include <cstdint>

namespace fmo {

enum class FrameError : uint8_t {
  None                 = 0,
  MalformedHeader      = 1,  // fewer than 22 bytes; frame dropped
  EncodingAnomaly      = 2,  // callsign not valid UTF-8; recovered with U+FFFD
  TransportUnavailable = 3,  // sink refused an outbound frame; not retried
  BufferFull           = 4   // configured buffer cap reached; frame refused
};

/// Short lowercase token for key=value logs (e.g. "malformed_header").
const char* to_string(FrameError e);

} // namespace fmo
