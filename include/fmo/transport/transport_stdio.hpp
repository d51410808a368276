#pragma once
/**
 * @file transport_stdio.hpp
 * @brief stdin/stdout transport (header-only) for running behind a pub/sub bridge.
 *
 * A bridge process subscribes to the channel, writes SLIP-framed frames to our
 * stdin and publishes whatever we write to stdout:
 *
 *   bridge-sub | fmo-echo --device - | bridge-pub
 *
 * stdin is switched to non-blocking; EOF on stdin is reported as RxResult::Error
 * so the service can shut down when the bridge goes away.
 */

#if !defined(__linux__)
#  error "transport_stdio.hpp is Linux-only."
#endif

#include "fmo/transport/fd_io.hpp"
#include "fmo/transport/transport_base.hpp"
#include <fcntl.h>
#include <sys/ioctl.h>
#include <unistd.h>

namespace fmo::transport {

class StdioPipe : public ITransport {
public:
  explicit StdioPipe(int in_fd = STDIN_FILENO, int out_fd = STDOUT_FILENO)
  : in_fd_(in_fd), out_fd_(out_fd) {}

  ~StdioPipe() override { end(); }

  bool begin(const Config& cfg) override {
    mtu_ = cfg.mtu;
    int fl = ::fcntl(in_fd_, F_GETFL, 0);
    if (fl < 0) return false;
    if (!(fl & O_NONBLOCK)) {
      if (::fcntl(in_fd_, F_SETFL, fl | O_NONBLOCK) != 0) return false;
      restore_flags_ = fl;
    }
    open_ = true;
    return true;
  }

  void end() override {
    if (!open_) return;
    if (restore_flags_ >= 0) { (void)::fcntl(in_fd_, F_SETFL, restore_flags_); restore_flags_ = -1; }
    open_ = false;
  }

  void poll() override {}

  std::size_t available() const override {
    int n = 0;
    if (!open_ || ::ioctl(in_fd_, FIONREAD, &n) != 0) return 0;
    return n > 0 ? static_cast<std::size_t>(n) : 0;
  }

  RxResult recv(uint8_t* out, std::size_t cap, std::size_t& out_len) override {
    if (!open_) { out_len = 0; return RxResult::Error; }
    return fd_recv(in_fd_, out, cap, out_len, /*eof_is_error=*/true);
  }

  TxResult send(const uint8_t* data, std::size_t len) override {
    if (!open_) return TxResult::Error;
    return fd_send_all(out_fd_, data, len);
  }

  const char* name() const override { return "stdio"; }
  std::size_t mtu() const override { return mtu_; }
  int native_handle() const override { return in_fd_; }

private:
  int in_fd_;
  int out_fd_;
  int restore_flags_{-1};
  bool open_{false};
  std::size_t mtu_{4096};
};

} // namespace fmo::transport
