#include "fmo/errors.hpp"

namespace fmo {

const char* to_string(FrameError e) {
  switch (e) {
    case FrameError::None:                 return "none";
    case FrameError::MalformedHeader:      return "malformed_header";
    case FrameError::EncodingAnomaly:      return "encoding_anomaly";
    case FrameError::TransportUnavailable: return "transport_unavailable";
    case FrameError::BufferFull:           return "buffer_full";
  }
  return "unknown";
}

} // namespace fmo
