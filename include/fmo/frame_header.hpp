/**
 * @file frame_header.hpp
 * @brief FMO frame model: the fixed 22-byte header record and the opaque payload.
 *
 * @details
 * LAYOUT (little-endian, no checksum, no length prefix)
 * -----------------------------------------------------
 *   offset  size  field
 *   ------  ----  -----------------------------------------------
 *        0     4  version   protocol/format version (opaque here)
 *        4     2  padding1  reserved, carried through untouched
 *        6     2  uid       sender/session id; 65535 = ECHO_UID
 *        8     2  padding2  reserved, carried through untouched
 *       10    12  callsign  UTF-8 text, NUL-padded on the right
 *
 * The payload follows the header immediately and is never interpreted.
 *
 * CALLSIGN STORAGE
 * ----------------
 * The callsign is held as a fixed-capacity ETL string. On the wire it is at
 * most 12 bytes, but a decoded callsign can grow when invalid bytes are
 * replaced by U+FFFD (3 bytes each), so the in-memory capacity is 3x the
 * wire size. No heap allocation for the header itself.
 *
 * @see header_codec.hpp for encode/decode.
 */
#ifndef FMO_FRAME_HEADER_HPP
#define FMO_FRAME_HEADER_HPP

#include <cstddef>
#include <cstdint>
#include <string>
#include <vector>
#include "etl/string.h"

namespace fmo {

  static constexpr std::size_t HEADER_SIZE   = 22;     ///< encoded header length
  static constexpr std::size_t CALLSIGN_SIZE = 12;     ///< callsign bytes on the wire
  static constexpr uint16_t    ECHO_UID      = 65535;  ///< uid stamped on replayed frames

  /// Room for 12 wire bytes that each decoded into a 3-byte replacement character.
  static constexpr std::size_t CALLSIGN_TEXT_CAP = CALLSIGN_SIZE * 3;

  using CallsignText = etl::string<CALLSIGN_TEXT_CAP>;

  /**
   * @brief Decoded 22-byte header.
   *
   * Field order matches the wire order. All integer fields are host order
   * once decoded.
   */
  struct FrameHeader {
    uint32_t     version{0};
    uint16_t     padding1{0};
    uint16_t     uid{0};
    uint16_t     padding2{0};
    CallsignText callsign;
  };

  inline bool operator==(const FrameHeader& a, const FrameHeader& b) {
    return a.version  == b.version
        && a.padding1 == b.padding1
        && a.uid      == b.uid
        && a.padding2 == b.padding2
        && a.callsign == b.callsign;
  }
  inline bool operator!=(const FrameHeader& a, const FrameHeader& b) { return !(a == b); }

  /// One FMO frame: header plus opaque payload (may be empty).
  struct Frame {
    FrameHeader          header;
    std::vector<uint8_t> payload;
  };

  /**
   * @brief Build a CallsignText from arbitrary text.
   *
   * Text longer than CALLSIGN_TEXT_CAP is cut on a UTF-8 character boundary
   * so the stored value never ends in a partial character.
   */
  CallsignText make_callsign(const std::string& text);

  /// Copy a CallsignText into a std::string (for logs, JSON, CLI output).
  inline std::string to_std_string(const CallsignText& cs) {
    return std::string(cs.data(), cs.size());
  }

} // namespace fmo

#endif // FMO_FRAME_HEADER_HPP
