#pragma once
/**
 * @file transport_base.hpp
 * @brief Byte-stream transport interface the echo service reads frames from and writes echoes to.
 *
 * Header-only. The echo core never sees this interface directly; it only sees
 * an emit callback returning TxResult. FrameLink adapts a transport to that.
 */

#include <cstddef>
#include <cstdint>

namespace fmo::transport {

enum class TxResult : uint8_t { Ok=0, Busy=1, Error=2 };
enum class RxResult : uint8_t { None=0, Ok=1, Error=2 };

inline const char* to_string(TxResult r) {
  switch (r) {
    case TxResult::Ok:    return "ok";
    case TxResult::Busy:  return "busy";
    case TxResult::Error: return "error";
  }
  return "unknown";
}

struct Config {
  uint16_t mtu{4096};   // largest chunk handed to send() in one call
  uint8_t  reserved{0};
};

/**
 * @brief Transport trait every link implementation provides.
 *
 * Contract:
 *  - begin(cfg) opens/initializes the underlying device.
 *  - poll() does non-blocking service work.
 *  - available() returns bytes ready for recv() (0 if unknown).
 *  - recv(buf,cap) pulls up to cap bytes; RxResult::Ok & count>0 on success,
 *    None when nothing is pending, Error when the link is gone (incl. EOF).
 *  - send(buf,len) writes all of buf or nothing: Busy means zero bytes went
 *    out and the caller may retry the same chunk.
 *  - native_handle() is a pollable fd, or -1 when the transport has none.
 */
class ITransport {
public:
  virtual ~ITransport() = default;
  virtual bool      begin(const Config& cfg) = 0;
  virtual void      end() = 0;
  virtual void      poll() = 0;
  virtual std::size_t available() const = 0;
  virtual RxResult  recv(uint8_t* out, std::size_t cap, std::size_t& out_len) = 0;
  virtual TxResult  send(const uint8_t* data, std::size_t len) = 0;
  virtual const char* name() const = 0;
  virtual std::size_t mtu() const = 0;
  virtual int       native_handle() const { return -1; }
};

} // namespace fmo::transport
