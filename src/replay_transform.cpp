#include "fmo/replay_transform.hpp"
#include "fmo/utf8.hpp"

#include <utility>

namespace fmo {

ReplayTransform::ReplayTransform(uint16_t echo_uid, std::string prefix)
: echo_uid_(echo_uid), prefix_(std::move(prefix)) {}

FrameHeader ReplayTransform::rewrite_header(const FrameHeader& header) const {
  FrameHeader out = header;                       // version/padding pass through
  out.uid = echo_uid_;

  const std::string joined = prefix_ + to_std_string(header.callsign);
  const std::string cut    = utf8::truncate(joined, CALLSIGN_SIZE);  // what the wire can hold
  out.callsign = CallsignText(cut.data(), cut.size());
  return out;
}

Frame ReplayTransform::rewrite(const Frame& frame) const {
  Frame out;
  out.header  = rewrite_header(frame.header);
  out.payload = frame.payload;                    // opaque, byte-for-byte
  return out;
}

} // namespace fmo
