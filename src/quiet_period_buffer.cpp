// -----------------------------------------------------------------------------
// quiet_period_buffer.cpp - debounce buffer behind the echo engine
//
// Contract and concurrency notes live in include/fmo/quiet_period_buffer.hpp.
// -----------------------------------------------------------------------------
#include "fmo/quiet_period_buffer.hpp"

#include <utility>

namespace fmo {

// ---------- public ----------

QuietPeriodBuffer::QuietPeriodBuffer(Clock::duration timeout, std::size_t max_frames)
: timeout_(timeout), max_frames_(max_frames) {}

bool QuietPeriodBuffer::append(Frame frame, Clock::time_point now) {
  std::lock_guard<std::mutex> lk(mu_);
  if (max_frames_ > 0 && frames_.size() >= max_frames_) return false;  // POLICY: refuse, keep deadline
  frames_.push_back(std::move(frame));   // arrival order
  deadline_ = now + timeout_;            // every accepted frame restarts the quiet period
  return true;
}

bool QuietPeriodBuffer::check_and_drain(Clock::time_point now, std::vector<Frame>& out) {
  out.clear();
  std::lock_guard<std::mutex> lk(mu_);
  if (frames_.empty()) return false;     // IDLE: nothing scheduled
  if (now < deadline_) return false;     // still inside the quiet period
  out.swap(frames_);                     // hand over the batch in one step
  return true;
}

std::size_t QuietPeriodBuffer::discard() {
  std::lock_guard<std::mutex> lk(mu_);
  const std::size_t n = frames_.size();
  frames_.clear();
  return n;
}

std::size_t QuietPeriodBuffer::size() const {
  std::lock_guard<std::mutex> lk(mu_);
  return frames_.size();
}

bool QuietPeriodBuffer::empty() const {
  std::lock_guard<std::mutex> lk(mu_);
  return frames_.empty();
}

QuietPeriodBuffer::Clock::time_point QuietPeriodBuffer::deadline() const {
  std::lock_guard<std::mutex> lk(mu_);
  return deadline_;
}

} // namespace fmo
