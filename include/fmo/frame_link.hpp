/**
 * @file frame_link.hpp
 * @brief Frame-level view of a byte-stream transport: SLIP in, SLIP out.
 *
 * @details
 * PURPOSE
 * -------
 * FrameLink is the glue between an ITransport (serial tty, stdio pipe) and
 * the echo engine. It is the engine's frame-in feed and frame-out sink:
 *
 *   transport bytes -> pump() -> complete frames -> EchoEngine::ingest()
 *   EchoEngine emit -> send_frame() -> SLIP bytes -> transport
 *
 * THREADING
 * ---------
 * pump() runs on the service main loop; send_frame() is called from the
 * engine's checker thread. Sends are serialized by an internal mutex so two
 * SLIP frames never interleave on the wire. pump() is not reentrant: call it
 * from one thread only.
 *
 * SEND POLICY
 * -----------
 * The encoded frame goes out in chunks of at most transport.mtu() bytes.
 * A chunk that comes back Busy is retried (same chunk) up to
 * SEND_BUSY_RETRIES times with SEND_BUSY_BACKOFF_MS between attempts. If it
 * is still Busy, or the transport reports Error, the result is returned as is.
 */
#ifndef FMO_FRAME_LINK_HPP
#define FMO_FRAME_LINK_HPP

#include <cstddef>
#include <cstdint>
#include <mutex>
#include <vector>
#include "fmo/slip.hpp"
#include "fmo/transport/transport_base.hpp"

namespace fmo {

class FrameLink {
public:
  static constexpr int SEND_BUSY_RETRIES    = 20;
  static constexpr int SEND_BUSY_BACKOFF_MS = 5;
  static constexpr std::size_t READ_CHUNK   = 4096;

  explicit FrameLink(transport::ITransport& t, std::size_t max_frame = slip::DEFAULT_MAX_FRAME);

  FrameLink(const FrameLink&) = delete;
  FrameLink& operator=(const FrameLink&) = delete;

  /**
   * @brief Read whatever is pending and append complete frames to @p frames.
   * @return Ok if at least one frame was appended, None if not,
   *         Error if the transport reported an error or end of stream.
   *         Frames decoded before an Error are still appended.
   */
  transport::RxResult pump(std::vector<std::vector<uint8_t>>& frames);

  /// SLIP-encode @p data and write the whole frame. Thread-safe.
  transport::TxResult send_frame(const uint8_t* data, std::size_t len);

  std::size_t frames_in() const { return frames_in_; }
  std::size_t frames_out() const;
  std::size_t slip_dropped() const { return dec_.dropped(); }

private:
  transport::ITransport& t_;
  slip::Decoder          dec_;
  std::vector<uint8_t>   scratch_;
  std::size_t            frames_in_{0};

  mutable std::mutex     tx_mu_;
  std::vector<uint8_t>   tx_buf_;
  std::size_t            frames_out_{0};
};

} // namespace fmo

#endif // FMO_FRAME_LINK_HPP
