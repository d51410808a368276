#include "fmo/loop_filter.hpp"

namespace fmo {

bool LoopFilter::accept(const FrameHeader& header) const {
  return header.uid != echo_uid_;
}

} // namespace fmo
