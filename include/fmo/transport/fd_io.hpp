#pragma once
/**
 * @file fd_io.hpp
 * @brief Shared non-blocking read/write helpers for fd-backed transports.
 *
 * Linux-only. Used by LinuxSerial and StdioPipe so both honor the
 * "all or nothing" send contract from transport_base.hpp.
 */

#if !defined(__linux__)
#  error "fd_io.hpp is Linux-only."
#endif

#include "fmo/transport/transport_base.hpp"
#include <cerrno>
#include <poll.h>
#include <unistd.h>

namespace fmo::transport {

// How long a half-written chunk may wait for the fd to drain.
static constexpr int FD_WRITE_STALL_MS = 1000;

inline RxResult fd_recv(int fd, uint8_t* out, std::size_t cap, std::size_t& out_len, bool eof_is_error) {
  out_len = 0;
  if (fd < 0 || !out || cap == 0) return RxResult::Error;
  for (;;) {
    ssize_t r = ::read(fd, out, cap);
    if (r > 0) { out_len = static_cast<std::size_t>(r); return RxResult::Ok; }
    if (r == 0) return eof_is_error ? RxResult::Error : RxResult::None;
    if (errno == EINTR) continue;
    if (errno == EAGAIN || errno == EWOULDBLOCK) return RxResult::None;
    return RxResult::Error;
  }
}

inline TxResult fd_send_all(int fd, const uint8_t* data, std::size_t len) {
  if (fd < 0 || !data || !len) return TxResult::Error;
  std::size_t done = 0;
  while (done < len) {
    ssize_t w = ::write(fd, data + done, len - done);
    if (w > 0) { done += static_cast<std::size_t>(w); continue; }
    if (w < 0 && errno == EINTR) continue;
    if (w < 0 && (errno == EAGAIN || errno == EWOULDBLOCK)) {
      if (done == 0) return TxResult::Busy;        // nothing written: caller may retry
      pollfd p{fd, POLLOUT, 0};                    // mid-chunk: wait for room
      int pr = ::poll(&p, 1, FD_WRITE_STALL_MS);
      if (pr > 0) continue;
      if (pr < 0 && errno == EINTR) continue;
      return TxResult::Error;                      // stalled with a partial chunk out
    }
    return TxResult::Error;
  }
  return TxResult::Ok;
}

} // namespace fmo::transport
