// -----------------------------------------------------------------------------
// frame_link.cpp - SLIP framing over an ITransport
//
// API and threading contract: include/fmo/frame_link.hpp
// -----------------------------------------------------------------------------
#include "fmo/frame_link.hpp"

#include <algorithm>
#include <chrono>
#include <thread>
#include <utility>

namespace fmo {

using transport::RxResult;
using transport::TxResult;

FrameLink::FrameLink(transport::ITransport& t, std::size_t max_frame)
: t_(t), dec_(max_frame), scratch_(READ_CHUNK) {}

// ---------------------------------------------------------------------------
// pump()
// ------
// Drain the transport until it reports None, feeding every byte through the
// SLIP decoder. Never blocks: the caller decides how long to wait (poll on
// native_handle()) between pumps.
// ---------------------------------------------------------------------------
RxResult FrameLink::pump(std::vector<std::vector<uint8_t>>& frames) {
  t_.poll();
  bool got = false;
  std::vector<uint8_t> frame;

  for (;;) {
    std::size_t n = 0;
    RxResult r = t_.recv(scratch_.data(), scratch_.size(), n);
    if (r == RxResult::None) break;
    if (r == RxResult::Error) return RxResult::Error;   // frames already appended stay

    for (std::size_t i = 0; i < n; ++i) {
      if (dec_.feed(scratch_[i], frame)) {
        frames.push_back(std::move(frame));
        frame.clear();
        ++frames_in_;
        got = true;
      }
    }
  }
  return got ? RxResult::Ok : RxResult::None;
}

// ---------------------------------------------------------------------------
// send_frame()
// ------------
// One SLIP frame, chunked by mtu. Busy on a chunk means nothing of that chunk
// was written, so retrying it keeps the byte stream intact.
// ---------------------------------------------------------------------------
TxResult FrameLink::send_frame(const uint8_t* data, std::size_t len) {
  if (!data && len) return TxResult::Error;

  std::lock_guard<std::mutex> lk(tx_mu_);
  slip::encode(data, len, tx_buf_);

  const std::size_t mtu = std::max<std::size_t>(t_.mtu(), 1);
  std::size_t off = 0;
  while (off < tx_buf_.size()) {
    const std::size_t n = std::min(mtu, tx_buf_.size() - off);
    TxResult r = t_.send(tx_buf_.data() + off, n);
    for (int attempt = 0; r == TxResult::Busy && attempt < SEND_BUSY_RETRIES; ++attempt) {
      std::this_thread::sleep_for(std::chrono::milliseconds(SEND_BUSY_BACKOFF_MS));
      r = t_.send(tx_buf_.data() + off, n);
    }
    if (r != TxResult::Ok) return r;
    off += n;
  }
  ++frames_out_;
  return TxResult::Ok;
}

std::size_t FrameLink::frames_out() const {
  std::lock_guard<std::mutex> lk(tx_mu_);
  return frames_out_;
}

} // namespace fmo
