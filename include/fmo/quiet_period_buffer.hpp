/**
 * @file quiet_period_buffer.hpp
 * @brief Thread-safe frame buffer with a resettable "flush after quiet" deadline.
 *
 * @details
 * ## Model
 * - Every accepted append() pushes to the tail and moves the deadline to
 *   `now + timeout`. A steady stream of frames therefore keeps pushing the
 *   deadline out; the buffer only becomes drainable after a gap of at least
 *   `timeout` with no appends.
 * - check_and_drain() hands over the WHOLE buffer, in arrival order, once
 *   `now >= deadline`. The buffer is empty afterwards.
 *
 * ## Concurrency
 * One mutex guards frames + deadline. append() and check_and_drain() are each
 * a single critical section, so a frame that races a drain lands in exactly
 * one batch: the one being drained, or the next one.
 *
 * ## Capacity
 * Unbounded unless @p max_frames > 0. When the cap is reached append() refuses
 * the frame and leaves the deadline alone.
 *
 * ## Time
 * Callers pass `now` explicitly (steady clock). Tests drive time by hand; the
 * engine passes Clock::now().
 */
#ifndef FMO_QUIET_PERIOD_BUFFER_HPP
#define FMO_QUIET_PERIOD_BUFFER_HPP

#include <chrono>
#include <cstddef>
#include <mutex>
#include <vector>
#include "fmo/frame_header.hpp"

namespace fmo {

class QuietPeriodBuffer {
public:
  using Clock = std::chrono::steady_clock;

  explicit QuietPeriodBuffer(Clock::duration timeout, std::size_t max_frames = 0);

  QuietPeriodBuffer(const QuietPeriodBuffer&) = delete;
  QuietPeriodBuffer& operator=(const QuietPeriodBuffer&) = delete;

  /**
   * @brief Append at the tail and reset the deadline to now + timeout.
   * @return false only when a cap is configured and already reached.
   */
  bool append(Frame frame, Clock::time_point now);

  /**
   * @brief Drain everything if non-empty and now >= deadline.
   * @param out cleared first; receives the batch in arrival order.
   * @return true if a batch was drained.
   */
  bool check_and_drain(Clock::time_point now, std::vector<Frame>& out);

  /// Drop everything without replay (shutdown). Returns how many were dropped.
  std::size_t discard();

  std::size_t size() const;
  bool empty() const;
  Clock::time_point deadline() const;   // meaningless while empty
  Clock::duration timeout() const { return timeout_; }
  std::size_t max_frames() const { return max_frames_; }

private:
  mutable std::mutex  mu_;
  std::vector<Frame>  frames_;
  Clock::time_point   deadline_{};
  const Clock::duration timeout_;
  const std::size_t   max_frames_;
};

} // namespace fmo

#endif // FMO_QUIET_PERIOD_BUFFER_HPP
