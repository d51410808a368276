/**
 * @file header_codec.hpp
 * @brief Encode/decode the fixed 22-byte FMO header, and whole frames.
 *
 * @details
 * PURPOSE
 * -------
 * The codec is the only place that knows the wire layout. Everything above it
 * works on fmo::FrameHeader / fmo::Frame.
 *
 * DECODE POLICY
 * -------------
 * - Fewer than HEADER_SIZE bytes: FrameError::MalformedHeader, @p out untouched.
 * - Callsign: trailing NUL bytes are stripped, the rest is decoded as UTF-8
 *   best-effort. Invalid bytes turn into U+FFFD and the call returns
 *   FrameError::EncodingAnomaly. The header IS filled in that case; callers
 *   treat it as a warning, not a drop.
 * - Bytes beyond HEADER_SIZE are ignored by decode_header() and become the
 *   payload in decode_frame().
 *
 * ENCODE POLICY
 * -------------
 * - Always exactly HEADER_SIZE bytes.
 * - Callsign cut to CALLSIGN_SIZE bytes on a character boundary (a trailing
 *   partial character is dropped), then NUL-padded.
 *
 * ROUND-TRIP
 * ----------
 * decode_header(encode_header(h)) == h for any header whose callsign is
 * ASCII, at most 12 bytes and free of trailing NULs.
 *
 * @code
 *   fmo::Frame f;
 *   if (fmo::decode_frame(buf.data(), buf.size(), f) == fmo::FrameError::MalformedHeader) return;
 *   f.header.uid = fmo::ECHO_UID;
 *   std::vector<uint8_t> wire = fmo::encode_frame(f);
 * @endcode
 */
#ifndef FMO_HEADER_CODEC_HPP
#define FMO_HEADER_CODEC_HPP

#include <cstddef>
#include <cstdint>
#include <string>
#include <vector>
#include "fmo/errors.hpp"
#include "fmo/frame_header.hpp"

namespace fmo {

  /**
   * @brief Decode the first HEADER_SIZE bytes of @p data.
   * @return None, EncodingAnomaly (header filled) or MalformedHeader (not filled).
   */
  FrameError decode_header(const uint8_t* data, std::size_t len, FrameHeader& out);

  /// decode_header() plus payload = everything after the header.
  FrameError decode_frame(const uint8_t* data, std::size_t len, Frame& out);

  /// Write exactly HEADER_SIZE bytes to @p out.
  void encode_header(const FrameHeader& h, uint8_t* out);

  /// Header bytes followed by the payload, byte for byte.
  std::vector<uint8_t> encode_frame(const Frame& f);

  /**
   * @brief One-line rendering for logs and tools.
   *
   * Example: `version=1 padding1=0x0000 uid=441 padding2=0x0000 callsign='BD8BOJ'`
   */
  std::string describe_header(const FrameHeader& h);

} // namespace fmo

#endif // FMO_HEADER_CODEC_HPP
