/**
 * @file echo_engine.hpp
 * @brief FMO Echo engine: buffer original frames, wait for the channel to go quiet, replay them.
 *
 * @details
 * ## Field Brief
 * An operator keys up, talks, lets go. Every frame of that transmission
 * arrives here. The engine holds them until nothing new has arrived for
 * `timeout` seconds, then plays the whole transmission back on the same
 * channel with the uid set to the echo uid and the callsign prefixed
 * ("RE>BD8BOJ"). The operator hears themselves and knows the link works.
 *
 * ## Operational Model
 * ```
 *  [transport]                 [EchoEngine]
 *      │                            │
 *   raw bytes ── ingest() ──► decode ─► LoopFilter ─► QuietPeriodBuffer.append
 *      │                            │                      (deadline = now + T)
 *      │               checker thread / flush_if_quiet(now)
 *      │                            │
 *      │                   QuietPeriodBuffer.check_and_drain
 *      │                            │
 *      ◄──────── emit(bytes) ◄─ encode ◄─ ReplayTransform.rewrite   (per frame, in order)
 * ```
 *
 * ## States
 * - Idle: buffer empty. Nothing scheduled.
 * - Buffering: at least one frame held; a drain is due at the deadline.
 * Accepted ingest moves Idle -> Buffering (or restarts the quiet period);
 * a drain moves Buffering -> Idle. Rejected or malformed input changes nothing.
 *
 * ## Concurrency
 * - ingest() may be called from any number of threads.
 * - The buffer lock is held only inside append / check_and_drain. emit() is
 *   called with no buffer lock held, so ingest keeps flowing during a replay.
 * - A separate replay lock makes drain+emit one unit: batches go out in the
 *   order they were drained and never interleave.
 *
 * ## Failure Model
 * - Short input: dropped, IngestResult.error = MalformedHeader.
 * - Bad UTF-8 callsign: buffered anyway, error = EncodingAnomaly.
 * - Cap reached (max_buffered > 0): dropped, error = BufferFull.
 * - Sink returns Busy/Error: that frame is listed in ReplayReport.failures
 *   with TransportUnavailable and the sink status. No retry; the rest of the
 *   batch is still attempted.
 * - stop(): checker joined, anything still buffered is discarded and counted.
 *
 * ## Usage
 * @code
 * fmo::EngineConfig cfg;                       // 5 s quiet period, uid 65535, "RE>"
 * fmo::EchoEngine engine(cfg, [&](const uint8_t* p, std::size_t n) {
 *   return link.send_frame(p, n);
 * });
 * engine.start();
 * for (auto& f : frames) engine.ingest(f.data(), f.size());
 * ...
 * std::size_t lost = engine.stop();
 * @endcode
 *
 * Instances share no state; run as many as there are channels.
 */
#ifndef FMO_ECHO_ENGINE_HPP
#define FMO_ECHO_ENGINE_HPP

#include <atomic>
#include <chrono>
#include <condition_variable>
#include <cstddef>
#include <cstdint>
#include <functional>
#include <mutex>
#include <string>
#include <thread>
#include <vector>

#include "fmo/errors.hpp"
#include "fmo/frame_header.hpp"
#include "fmo/loop_filter.hpp"
#include "fmo/quiet_period_buffer.hpp"
#include "fmo/replay_transform.hpp"
#include "fmo/transport/transport_base.hpp"

namespace fmo {

  /// Longest accepted timeout / check_interval, in seconds (one day).
  constexpr double MAX_PERIOD_SECONDS = 86400.0;

  /// Engine knobs. Times are in seconds, as they appear in the config file.
  /// Out-of-range times are clamped to [0, MAX_PERIOD_SECONDS].
  struct EngineConfig {
    double      timeout{5.0};            ///< quiet period before replay
    uint16_t    echo_uid{ECHO_UID};      ///< uid stamped on replays, and filtered on input
    std::string callsign_prefix{"RE>"};  ///< prepended to the original callsign
    double      check_interval{0.1};     ///< checker thread period
    std::size_t max_buffered{0};         ///< 0 = unbounded
  };

  enum class EngineState : uint8_t { Idle=0, Buffering=1 };

  enum class IngestStatus : uint8_t {
    Buffered     = 0,  ///< held for replay (error may still be EncodingAnomaly)
    EchoRejected = 1,  ///< our own replay coming back; ignored
    Dropped      = 2   ///< MalformedHeader or BufferFull
  };

  struct IngestResult {
    IngestStatus status{IngestStatus::Dropped};
    FrameError   error{FrameError::None};
    FrameHeader  header;             ///< valid unless error == MalformedHeader
    std::size_t  size{0};            ///< raw input length
  };

  /// One frame of a batch the sink refused.
  struct ReplayFailure {
    std::size_t         index{0};    ///< position in the batch, 0-based
    FrameHeader         header;      ///< rewritten header that failed to go out
    FrameError          error{FrameError::TransportUnavailable};
    transport::TxResult tx{transport::TxResult::Error};
  };

  /// Outcome of one drain. drained == 0 means nothing was due.
  struct ReplayReport {
    std::size_t                drained{0};
    std::size_t                emitted{0};
    std::vector<ReplayFailure> failures;

    bool empty() const { return drained == 0; }
  };

  /// Counter snapshot. Monotonic over the engine lifetime.
  struct EngineStats {
    uint64_t received{0};
    uint64_t buffered{0};
    uint64_t echo_rejected{0};
    uint64_t malformed{0};
    uint64_t encoding_anomalies{0};
    uint64_t refused_full{0};
    uint64_t batches{0};
    uint64_t emitted{0};
    uint64_t emit_failures{0};
    uint64_t discarded{0};
  };

  class EchoEngine {
  public:
    using Clock          = std::chrono::steady_clock;
    using EmitFn         = std::function<transport::TxResult(const uint8_t*, std::size_t)>;
    using ReplayObserver = std::function<void(const ReplayReport&)>;

    EchoEngine(const EngineConfig& cfg, EmitFn emit);
    ~EchoEngine();

    EchoEngine(const EchoEngine&) = delete;
    EchoEngine& operator=(const EchoEngine&) = delete;

    /// Ingest one raw frame stamped with Clock::now().
    IngestResult ingest(const uint8_t* data, std::size_t len);

    /// Ingest with an explicit timestamp (tests, replayed captures).
    IngestResult ingest(const uint8_t* data, std::size_t len, Clock::time_point now);

    /**
     * @brief Replay the buffer if the quiet period has elapsed at @p now.
     *
     * What the checker thread calls every check_interval. Safe to call by hand
     * (with or without the checker running).
     */
    ReplayReport flush_if_quiet(Clock::time_point now);
    ReplayReport flush_if_quiet() { return flush_if_quiet(Clock::now()); }

    /// Launch the checker thread. false if already running.
    bool start();

    /**
     * @brief Join the checker and discard whatever is still buffered.
     * @return number of frames discarded. Idempotent, and safe to call from
     *         several threads at once (each frame is counted by one caller).
     */
    std::size_t stop();

    bool running() const { return running_.load(); }

    EngineState state() const;
    std::size_t buffered() const { return buffer_.size(); }
    Clock::time_point deadline() const { return buffer_.deadline(); }
    EngineStats stats() const;
    const EngineConfig& config() const { return cfg_; }

    /**
     * @brief Called once per non-empty drain, on the thread that drained.
     *
     * The observer runs under the replay lock. It must not call back into
     * set_replay_observer(), flush_if_quiet() or stop() on the same engine.
     */
    void set_replay_observer(ReplayObserver obs);

  private:
    void checker_loop();
    static Clock::duration to_duration(double seconds);

    struct Counters {
      std::atomic<uint64_t> received{0};
      std::atomic<uint64_t> buffered{0};
      std::atomic<uint64_t> echo_rejected{0};
      std::atomic<uint64_t> malformed{0};
      std::atomic<uint64_t> encoding_anomalies{0};
      std::atomic<uint64_t> refused_full{0};
      std::atomic<uint64_t> batches{0};
      std::atomic<uint64_t> emitted{0};
      std::atomic<uint64_t> emit_failures{0};
      std::atomic<uint64_t> discarded{0};
    };

    const EngineConfig cfg_;
    LoopFilter         filter_;
    QuietPeriodBuffer  buffer_;
    ReplayTransform    transform_;
    EmitFn             emit_;

    std::mutex         replay_mu_;      // serializes drain + emit
    ReplayObserver     observer_;       // guarded by replay_mu_

    std::mutex              life_mu_;        // serializes start() / stop()
    std::mutex              run_mu_;
    std::condition_variable run_cv_;
    bool                    stop_requested_{false};  // guarded by run_mu_
    std::atomic<bool>       running_{false};
    std::thread             checker_;

    Counters counters_;
  };

} // namespace fmo

#endif // FMO_ECHO_ENGINE_HPP
