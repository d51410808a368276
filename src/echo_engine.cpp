// -----------------------------------------------------------------------------
// echo_engine.cpp - Implementation of the FMO Echo engine
//
// API, state machine and failure model:
//   see include/fmo/echo_engine.hpp
//
// Runnable scenarios:
//   see tests/test_echo_engine.cpp
// -----------------------------------------------------------------------------
#include "fmo/echo_engine.hpp"
#include "fmo/header_codec.hpp"

#include <algorithm>
#include <utility>

namespace fmo {

// ---------- private helpers ----------

EchoEngine::Clock::duration EchoEngine::to_duration(double seconds) {
  // keep the double -> integer tick cast inside the representable range
  if (!(seconds > 0.0)) seconds = 0.0;
  else if (seconds > MAX_PERIOD_SECONDS) seconds = MAX_PERIOD_SECONDS;
  return std::chrono::duration_cast<Clock::duration>(std::chrono::duration<double>(seconds));
}

// ---------- public ----------

EchoEngine::EchoEngine(const EngineConfig& cfg, EmitFn emit)
: cfg_(cfg),
  filter_(cfg.echo_uid),                                   // same uid we stamp on replays
  buffer_(to_duration(cfg.timeout), cfg.max_buffered),
  transform_(cfg.echo_uid, cfg.callsign_prefix),
  emit_(std::move(emit)) {}

EchoEngine::~EchoEngine() {
  stop();                                                  // join before members go away
}

IngestResult EchoEngine::ingest(const uint8_t* data, std::size_t len) {
  return ingest(data, len, Clock::now());
}

// ingest() - decode, filter, buffer. Never blocks on the sink.
IngestResult EchoEngine::ingest(const uint8_t* data, std::size_t len, Clock::time_point now) {
  IngestResult res;
  res.size = len;
  counters_.received.fetch_add(1, std::memory_order_relaxed);

  Frame frame;
  res.error = decode_frame(data, len, frame);
  if (res.error == FrameError::MalformedHeader) {          // DROP: never buffered, deadline untouched
    counters_.malformed.fetch_add(1, std::memory_order_relaxed);
    res.status = IngestStatus::Dropped;
    return res;
  }
  res.header = frame.header;

  // POLICY: our own replay coming back through the channel
  if (!filter_.accept(frame.header)) {
    res.status = IngestStatus::EchoRejected;
    counters_.echo_rejected.fetch_add(1, std::memory_order_relaxed);
    return res;
  }

  if (res.error == FrameError::EncodingAnomaly) {          // recovered; keep going
    counters_.encoding_anomalies.fetch_add(1, std::memory_order_relaxed);
  }

  if (!buffer_.append(std::move(frame), now)) {
    res.status = IngestStatus::Dropped;
    res.error  = FrameError::BufferFull;
    counters_.refused_full.fetch_add(1, std::memory_order_relaxed);
    return res;
  }

  res.status = IngestStatus::Buffered;
  counters_.buffered.fetch_add(1, std::memory_order_relaxed);
  return res;
}

// flush_if_quiet() - one drain + replay cycle, serialized by replay_mu_.
ReplayReport EchoEngine::flush_if_quiet(Clock::time_point now) {
  ReplayReport report;
  std::lock_guard<std::mutex> lk(replay_mu_);

  std::vector<Frame> batch;
  if (!buffer_.check_and_drain(now, batch)) return report;  // IDLE or still quiet-waiting

  report.drained = batch.size();
  counters_.batches.fetch_add(1, std::memory_order_relaxed);

  // emit runs with the buffer lock released; new ingests start the next batch
  for (std::size_t i = 0; i < batch.size(); ++i) {
    const Frame echo = transform_.rewrite(batch[i]);
    const std::vector<uint8_t> wire = encode_frame(echo);

    transport::TxResult tx = transport::TxResult::Error;   // no sink == unavailable
    if (emit_) tx = emit_(wire.data(), wire.size());

    if (tx == transport::TxResult::Ok) {
      ++report.emitted;
      continue;
    }
    ReplayFailure f;
    f.index  = i;
    f.header = echo.header;
    f.error  = FrameError::TransportUnavailable;
    f.tx     = tx;
    report.failures.push_back(f);
  }

  counters_.emitted.fetch_add(report.emitted, std::memory_order_relaxed);
  counters_.emit_failures.fetch_add(report.failures.size(), std::memory_order_relaxed);

  if (observer_) observer_(report);                        // still under replay_mu_: reports stay ordered
  return report;
}

bool EchoEngine::start() {
  std::lock_guard<std::mutex> life(life_mu_);
  std::lock_guard<std::mutex> lk(run_mu_);
  if (running_.load()) return false;
  stop_requested_ = false;
  running_.store(true);
  checker_ = std::thread(&EchoEngine::checker_loop, this);
  return true;
}

std::size_t EchoEngine::stop() {
  // one stopper at a time: a second caller waits, then finds nothing to join
  std::lock_guard<std::mutex> life(life_mu_);
  {
    std::lock_guard<std::mutex> lk(run_mu_);
    stop_requested_ = true;
  }
  run_cv_.notify_all();
  if (checker_.joinable()) checker_.join();
  running_.store(false);

  // Nothing is persisted: frames not yet replayed are lost here.
  const std::size_t n = buffer_.discard();
  counters_.discarded.fetch_add(n, std::memory_order_relaxed);
  return n;
}

EngineState EchoEngine::state() const {
  return buffer_.empty() ? EngineState::Idle : EngineState::Buffering;
}

EngineStats EchoEngine::stats() const {
  EngineStats s;
  s.received           = counters_.received.load();
  s.buffered           = counters_.buffered.load();
  s.echo_rejected      = counters_.echo_rejected.load();
  s.malformed          = counters_.malformed.load();
  s.encoding_anomalies = counters_.encoding_anomalies.load();
  s.refused_full       = counters_.refused_full.load();
  s.batches            = counters_.batches.load();
  s.emitted            = counters_.emitted.load();
  s.emit_failures      = counters_.emit_failures.load();
  s.discarded          = counters_.discarded.load();
  return s;
}

void EchoEngine::set_replay_observer(ReplayObserver obs) {
  std::lock_guard<std::mutex> lk(replay_mu_);
  observer_ = std::move(obs);
}

// ---------- private ----------

// checker_loop() - wake every check_interval (or on stop) and try a drain.
void EchoEngine::checker_loop() {
  const Clock::duration period =
      std::max<Clock::duration>(to_duration(cfg_.check_interval), std::chrono::milliseconds(1));

  std::unique_lock<std::mutex> lk(run_mu_);
  while (!stop_requested_) {
    run_cv_.wait_for(lk, period, [this] { return stop_requested_; });
    if (stop_requested_) break;

    lk.unlock();                        // never hold run_mu_ across emit
    flush_if_quiet(Clock::now());
    lk.lock();
  }
}

} // namespace fmo
