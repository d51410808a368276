// -----------------------------------------------------------------------------
// header_codec.cpp - FMO header wire codec
//
// API & wire layout:
//   see include/fmo/header_codec.hpp and include/fmo/frame_header.hpp
//
// Fields are assembled byte by byte so host endianness never matters.
// -----------------------------------------------------------------------------
#include "fmo/header_codec.hpp"
#include "fmo/utf8.hpp"

#include <cstdio>
#include <cstring>

namespace fmo {

// ---------- private helpers ----------

static uint16_t get_u16le(const uint8_t* p) {
  return static_cast<uint16_t>(p[0] | (p[1] << 8));
}

static uint32_t get_u32le(const uint8_t* p) {
  return  static_cast<uint32_t>(p[0])
       | (static_cast<uint32_t>(p[1]) << 8)
       | (static_cast<uint32_t>(p[2]) << 16)
       | (static_cast<uint32_t>(p[3]) << 24);
}

static void put_u16le(uint8_t* p, uint16_t v) {
  p[0] = static_cast<uint8_t>(v & 0xFF);
  p[1] = static_cast<uint8_t>(v >> 8);
}

static void put_u32le(uint8_t* p, uint32_t v) {
  p[0] = static_cast<uint8_t>(v & 0xFF);
  p[1] = static_cast<uint8_t>((v >> 8) & 0xFF);
  p[2] = static_cast<uint8_t>((v >> 16) & 0xFF);
  p[3] = static_cast<uint8_t>((v >> 24) & 0xFF);
}

// Field offsets inside the 22-byte header.
static constexpr std::size_t OFF_VERSION  = 0;
static constexpr std::size_t OFF_PADDING1 = 4;
static constexpr std::size_t OFF_UID      = 6;
static constexpr std::size_t OFF_PADDING2 = 8;
static constexpr std::size_t OFF_CALLSIGN = 10;

static_assert(OFF_CALLSIGN + CALLSIGN_SIZE == HEADER_SIZE, "header layout mismatch");

// ---------- frame_header.hpp ----------

CallsignText make_callsign(const std::string& text) {
  const std::size_t n = utf8::safe_prefix_length(text.data(), text.size(), CALLSIGN_TEXT_CAP);
  return CallsignText(text.data(), n);
}

// ---------- public ----------

FrameError decode_header(const uint8_t* data, std::size_t len, FrameHeader& out) {
  if (!data || len < HEADER_SIZE) return FrameError::MalformedHeader;  // nothing to salvage

  FrameHeader h;
  h.version  = get_u32le(data + OFF_VERSION);
  h.padding1 = get_u16le(data + OFF_PADDING1);
  h.uid      = get_u16le(data + OFF_UID);
  h.padding2 = get_u16le(data + OFF_PADDING2);

  // strip NUL padding from the right only; interior NULs are kept as text
  const char* cs = reinterpret_cast<const char*>(data + OFF_CALLSIGN);
  std::size_t n = CALLSIGN_SIZE;
  while (n > 0 && cs[n - 1] == '\0') --n;

  std::string text;
  const bool clean = utf8::sanitize(cs, n, text);
  h.callsign = CallsignText(text.data(), text.size());  // <= 36 bytes, always fits

  out = h;
  return clean ? FrameError::None : FrameError::EncodingAnomaly;
}

FrameError decode_frame(const uint8_t* data, std::size_t len, Frame& out) {
  FrameHeader h;
  const FrameError err = decode_header(data, len, h);
  if (err == FrameError::MalformedHeader) return err;

  out.header = h;
  out.payload.assign(data + HEADER_SIZE, data + len);  // opaque, copied verbatim
  return err;
}

void encode_header(const FrameHeader& h, uint8_t* out) {
  put_u32le(out + OFF_VERSION,  h.version);
  put_u16le(out + OFF_PADDING1, h.padding1);
  put_u16le(out + OFF_UID,      h.uid);
  put_u16le(out + OFF_PADDING2, h.padding2);

  const std::size_t n = utf8::safe_prefix_length(h.callsign.data(), h.callsign.size(), CALLSIGN_SIZE);
  std::memset(out + OFF_CALLSIGN, 0, CALLSIGN_SIZE);   // NUL padding
  std::memcpy(out + OFF_CALLSIGN, h.callsign.data(), n);
}

std::vector<uint8_t> encode_frame(const Frame& f) {
  std::vector<uint8_t> out(HEADER_SIZE + f.payload.size());
  encode_header(f.header, out.data());
  if (!f.payload.empty()) {
    std::memcpy(out.data() + HEADER_SIZE, f.payload.data(), f.payload.size());
  }
  return out;
}

std::string describe_header(const FrameHeader& h) {
  char nums[96];
  std::snprintf(nums, sizeof(nums), "version=%u padding1=0x%04X uid=%u padding2=0x%04X",
                static_cast<unsigned>(h.version), static_cast<unsigned>(h.padding1),
                static_cast<unsigned>(h.uid), static_cast<unsigned>(h.padding2));
  return std::string(nums) + " callsign='" + to_std_string(h.callsign) + "'";
}

} // namespace fmo
