#pragma once

/**
 * @file slip.hpp
 * @brief SLIP (RFC 1055) framing: one FMO frame per SLIP frame on a byte stream.
 *
 * @details
 * WIRE
 * ----
 *   END     0xC0  frame boundary
 *   ESC     0xDB  escape introducer
 *   ESC_END 0xDC  ESC ESC_END  -> literal 0xC0
 *   ESC_ESC 0xDD  ESC ESC_ESC  -> literal 0xDB
 *
 * Frames are written as END <escaped bytes> END. A leading END flushes any
 * line noise the receiver may have accumulated.
 *
 * DECODER RULES
 * -------------
 * - Bytes before the first END are ignored.
 * - END closes a non-empty frame; END END (empty frame) is a separator.
 * - ESC followed by anything other than ESC_END / ESC_ESC is a protocol
 *   error: the partial frame is dropped and the decoder waits for the next END.
 * - A frame growing past max_frame bytes is dropped the same way, so a peer
 *   that never sends END cannot grow memory without bound.
 *
 * FMO frames carry a 22-byte header with arbitrary integers and a binary
 * payload, so both 0xC0 and 0xDB appear in real traffic. Escaping is not
 * optional here.
 *
 * @code
 *   std::vector<uint8_t> wire;
 *   fmo::slip::encode(frame.data(), frame.size(), wire);
 *
 *   fmo::slip::Decoder dec;
 *   std::vector<uint8_t> got;
 *   for (uint8_t b : wire) if (dec.feed(b, got)) handle(got);
 * @endcode
 */

#include <cstddef>
#include <cstdint>
#include <vector>

namespace fmo {
namespace slip {

static constexpr uint8_t END     = 0xC0;
static constexpr uint8_t ESC     = 0xDB;
static constexpr uint8_t ESC_END = 0xDC;
static constexpr uint8_t ESC_ESC = 0xDD;

/// Default ceiling for one decoded frame (header + generous audio payload).
static constexpr std::size_t DEFAULT_MAX_FRAME = 64 * 1024;

/**
 * @brief Encode @p n bytes as one SLIP frame into @p out (cleared first).
 *
 * Reserves the worst case (2n + 2) up front.
 */
inline void encode(const uint8_t* in, std::size_t n, std::vector<uint8_t>& out) {
  out.clear();
  out.reserve(n * 2 + 2);
  out.push_back(END);
  for (std::size_t i = 0; i < n; ++i) {
    const uint8_t b = in[i];
    if      (b == END) { out.push_back(ESC); out.push_back(ESC_END); }
    else if (b == ESC) { out.push_back(ESC); out.push_back(ESC_ESC); }
    else               { out.push_back(b); }
  }
  out.push_back(END);
}

/**
 * @brief Byte-at-a-time SLIP decoder.
 *
 * State survives between feed() calls so it can sit behind a non-blocking
 * read loop. dropped() counts frames discarded for bad escapes or size.
 */
class Decoder {
public:
  explicit Decoder(std::size_t max_frame = DEFAULT_MAX_FRAME) : max_frame_(max_frame) {}

  /**
   * @brief Feed one byte.
   * @return true when @p frame now holds one complete decoded frame.
   */
  bool feed(uint8_t b, std::vector<uint8_t>& frame) {
    if (b == END) {
      if (in_frame_ && !buf_.empty()) {
        frame.swap(buf_);
        buf_.clear();
        esc_ = false;
        in_frame_ = false;
        return true;
      }
      buf_.clear();              // separator or resync point
      in_frame_ = true;
      esc_ = false;
      return false;
    }

    if (!in_frame_) return false;  // noise before first END

    if (esc_) {
      esc_ = false;
      if      (b == ESC_END) b = END;
      else if (b == ESC_ESC) b = ESC;
      else { drop(); return false; }
    } else if (b == ESC) {
      esc_ = true;
      return false;
    }

    if (buf_.size() >= max_frame_) { drop(); return false; }
    buf_.push_back(b);
    return false;
  }

  std::size_t dropped() const { return dropped_; }

private:
  void drop() {
    buf_.clear();
    esc_ = false;
    in_frame_ = false;
    ++dropped_;
  }

  std::vector<uint8_t> buf_;
  std::size_t max_frame_;
  std::size_t dropped_{0};
  bool esc_{false};
  bool in_frame_{false};
};

} // namespace slip
} // namespace fmo
