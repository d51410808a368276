#include <doctest/doctest.h>
#include <algorithm>
#include <atomic>
#include <chrono>
#include <cstring>
#include <mutex>
#include <thread>
#include <vector>
#include "fmo/echo_engine.hpp"
#include "fmo/header_codec.hpp"
#include "test_frames.hpp"
using namespace fmo;
using namespace std::chrono_literals;
using transport::TxResult;
using Clock = EchoEngine::Clock;

// Records everything the engine emits. Optionally refuses chosen calls.
struct Sink {
    std::mutex mu;
    std::vector<std::vector<uint8_t>> frames;
    std::vector<TxResult> script;          // per-call result; Ok once exhausted
    std::size_t calls = 0;

    EchoEngine::EmitFn fn() {
        return [this](const uint8_t* p, std::size_t n) {
            std::lock_guard<std::mutex> lk(mu);
            const TxResult r = calls < script.size() ? script[calls] : TxResult::Ok;
            ++calls;
            if (r == TxResult::Ok) frames.emplace_back(p, p + n);
            return r;
        };
    }
    std::size_t count() {
        std::lock_guard<std::mutex> lk(mu);
        return frames.size();
    }
};

static EngineConfig cfg_with_timeout(double t) {
    EngineConfig c;
    c.timeout = t;
    return c;
}

TEST_CASE("BD8BOJ transmission is replayed once as RE>BD8BOJ with uid 65535") {
    Sink sink;
    EchoEngine eng(EngineConfig{}, sink.fn());           // 5 s default quiet period
    const Clock::time_point t0 = Clock::now();

    const std::vector<uint8_t> raw = fmo_test::bd8boj_frame(578);
    const IngestResult r = eng.ingest(raw.data(), raw.size(), t0);
    CHECK(r.status == IngestStatus::Buffered);
    CHECK(r.error == FrameError::None);
    CHECK(r.header.uid == 441);
    CHECK(eng.state() == EngineState::Buffering);

    CHECK(eng.flush_if_quiet(t0 + 4900ms).empty());
    CHECK(sink.count() == 0);

    const ReplayReport rep = eng.flush_if_quiet(t0 + 5s);
    CHECK(rep.drained == 1);
    CHECK(rep.emitted == 1);
    CHECK(rep.failures.empty());
    REQUIRE(sink.count() == 1);

    Frame out;
    REQUIRE(decode_frame(sink.frames[0].data(), sink.frames[0].size(), out) == FrameError::None);
    CHECK(out.header.uid == 65535);
    CHECK(to_std_string(out.header.callsign) == "RE>BD8BOJ");
    CHECK(out.header.version == 1);
    CHECK(out.payload.size() == 578);
    CHECK(std::equal(out.payload.begin(), out.payload.end(), raw.begin() + HEADER_SIZE));
    CHECK(eng.state() == EngineState::Idle);
}

TEST_CASE("a self-echo alone never schedules a drain") {
    Sink sink;
    EchoEngine eng(cfg_with_timeout(1.0), sink.fn());
    const Clock::time_point t0 = Clock::now();

    const std::vector<uint8_t> echo = fmo_test::raw_frame(ECHO_UID, "RE>BD8BOJ", 100);
    const IngestResult r = eng.ingest(echo.data(), echo.size(), t0);
    CHECK(r.status == IngestStatus::EchoRejected);
    CHECK(eng.state() == EngineState::Idle);
    CHECK(eng.buffered() == 0);
    CHECK(eng.flush_if_quiet(t0 + 1h).empty());
    CHECK(sink.count() == 0);
    CHECK(eng.stats().echo_rejected == 1);
}

TEST_CASE("two frames 0.5 s apart with a 2 s timeout drain together once") {
    Sink sink;
    EchoEngine eng(cfg_with_timeout(2.0), sink.fn());
    const Clock::time_point t0 = Clock::now();

    const std::vector<uint8_t> a = fmo_test::raw_frame(441, "BD8BOJ", 64, 1);
    const std::vector<uint8_t> b = fmo_test::raw_frame(441, "BD8BOJ", 64, 2);
    eng.ingest(a.data(), a.size(), t0);
    eng.ingest(b.data(), b.size(), t0 + 500ms);

    CHECK(eng.flush_if_quiet(t0 + 2s).empty());          // only 1.5 s since the last frame
    const ReplayReport rep = eng.flush_if_quiet(t0 + 2500ms);
    CHECK(rep.drained == 2);
    REQUIRE(sink.count() == 2);

    Frame f0, f1;
    REQUIRE(decode_frame(sink.frames[0].data(), sink.frames[0].size(), f0) != FrameError::MalformedHeader);
    REQUIRE(decode_frame(sink.frames[1].data(), sink.frames[1].size(), f1) != FrameError::MalformedHeader);
    CHECK(std::equal(f0.payload.begin(), f0.payload.end(), a.begin() + HEADER_SIZE));   // arrival order
    CHECK(std::equal(f1.payload.begin(), f1.payload.end(), b.begin() + HEADER_SIZE));

    CHECK(eng.flush_if_quiet(t0 + 1h).empty());
    CHECK(eng.stats().batches == 1);
}

TEST_CASE("malformed input is dropped and does not move the deadline") {
    Sink sink;
    EchoEngine eng(cfg_with_timeout(1.0), sink.fn());
    const Clock::time_point t0 = Clock::now();

    const std::vector<uint8_t> good = fmo_test::raw_frame(441, "BD8BOJ", 10);
    eng.ingest(good.data(), good.size(), t0);

    const uint8_t shorty[10] = {1, 2, 3};
    const IngestResult r = eng.ingest(shorty, sizeof(shorty), t0 + 900ms);
    CHECK(r.status == IngestStatus::Dropped);
    CHECK(r.error == FrameError::MalformedHeader);
    CHECK(eng.buffered() == 1);

    CHECK(eng.flush_if_quiet(t0 + 1s).drained == 1);      // deadline still t0 + 1 s
    CHECK(eng.stats().malformed == 1);
}

TEST_CASE("malformed input alone leaves the engine idle") {
    Sink sink;
    EchoEngine eng(cfg_with_timeout(1.0), sink.fn());
    const uint8_t shorty[21] = {0};
    CHECK(eng.ingest(shorty, sizeof(shorty)).error == FrameError::MalformedHeader);
    CHECK(eng.ingest(nullptr, 0).error == FrameError::MalformedHeader);
    CHECK(eng.state() == EngineState::Idle);
}

TEST_CASE("bad UTF-8 callsign is buffered and replayed with replacement chars") {
    Sink sink;
    EchoEngine eng(cfg_with_timeout(1.0), sink.fn());
    const Clock::time_point t0 = Clock::now();

    std::vector<uint8_t> raw = fmo_test::bd8boj_frame(8);
    raw[10 + 5] = 0xFE;                                    // "BD8BO\xFE"
    const IngestResult r = eng.ingest(raw.data(), raw.size(), t0);
    CHECK(r.status == IngestStatus::Buffered);
    CHECK(r.error == FrameError::EncodingAnomaly);

    REQUIRE(eng.flush_if_quiet(t0 + 1s).emitted == 1);
    Frame out;
    REQUIRE(decode_frame(sink.frames[0].data(), sink.frames[0].size(), out) == FrameError::None);
    CHECK(to_std_string(out.header.callsign) == "RE>BD8BO\xEF\xBF\xBD");
    CHECK(eng.stats().encoding_anomalies == 1);
}

TEST_CASE("sink refusals are reported per frame and the rest of the batch still goes out") {
    Sink sink;
    sink.script = {TxResult::Ok, TxResult::Busy, TxResult::Ok, TxResult::Error};
    EchoEngine eng(cfg_with_timeout(1.0), sink.fn());
    const Clock::time_point t0 = Clock::now();

    for (uint8_t i = 0; i < 4; ++i) {
        const std::vector<uint8_t> raw = fmo_test::raw_frame(441, "BD8BOJ", 16, i);
        eng.ingest(raw.data(), raw.size(), t0);
    }
    const ReplayReport rep = eng.flush_if_quiet(t0 + 1s);
    CHECK(rep.drained == 4);
    CHECK(rep.emitted == 2);
    REQUIRE(rep.failures.size() == 2);
    CHECK(rep.failures[0].index == 1);
    CHECK(rep.failures[0].tx == TxResult::Busy);
    CHECK(rep.failures[0].error == FrameError::TransportUnavailable);
    CHECK(to_std_string(rep.failures[0].header.callsign) == "RE>BD8BOJ");
    CHECK(rep.failures[1].index == 3);
    CHECK(rep.failures[1].tx == TxResult::Error);

    CHECK(sink.calls == 4);                                // no retries
    CHECK(eng.stats().emit_failures == 2);
    CHECK(eng.state() == EngineState::Idle);               // failed frames are not re-buffered
}

TEST_CASE("missing sink reports every frame as unavailable") {
    EchoEngine eng(cfg_with_timeout(1.0), nullptr);
    const Clock::time_point t0 = Clock::now();
    const std::vector<uint8_t> raw = fmo_test::raw_frame(441, "BD8BOJ", 4);
    eng.ingest(raw.data(), raw.size(), t0);
    const ReplayReport rep = eng.flush_if_quiet(t0 + 1s);
    CHECK(rep.drained == 1);
    CHECK(rep.emitted == 0);
    CHECK(rep.failures.size() == 1);
}

TEST_CASE("buffer cap turns excess frames into BufferFull drops") {
    Sink sink;
    EngineConfig c = cfg_with_timeout(1.0);
    c.max_buffered = 2;
    EchoEngine eng(c, sink.fn());
    const std::vector<uint8_t> raw = fmo_test::raw_frame(441, "BD8BOJ", 4);
    CHECK(eng.ingest(raw.data(), raw.size()).status == IngestStatus::Buffered);
    CHECK(eng.ingest(raw.data(), raw.size()).status == IngestStatus::Buffered);
    const IngestResult r = eng.ingest(raw.data(), raw.size());
    CHECK(r.status == IngestStatus::Dropped);
    CHECK(r.error == FrameError::BufferFull);
    CHECK(eng.stats().refused_full == 1);
}

TEST_CASE("N concurrent ingests produce one batch of exactly N") {
    Sink sink;
    EchoEngine eng(cfg_with_timeout(1.0), sink.fn());
    const Clock::time_point t0 = Clock::now();
    constexpr int THREADS = 8;
    constexpr int PER_THREAD = 25;

    std::vector<std::thread> th;
    for (int t = 0; t < THREADS; ++t) {
        th.emplace_back([&eng, t, t0] {
            for (int i = 0; i < PER_THREAD; ++i) {
                const std::vector<uint8_t> raw =
                    fmo_test::raw_frame(static_cast<uint16_t>(t * PER_THREAD + i), "BD8BOJ", 32);
                eng.ingest(raw.data(), raw.size(), t0);
            }
        });
    }
    for (auto& x : th) x.join();

    const ReplayReport rep = eng.flush_if_quiet(t0 + 1s);
    CHECK(rep.drained == static_cast<std::size_t>(THREADS * PER_THREAD));
    CHECK(sink.count() == static_cast<std::size_t>(THREADS * PER_THREAD));
    CHECK(eng.flush_if_quiet(t0 + 1h).empty());
}

TEST_CASE("checker thread replays after the quiet period and notifies the observer") {
    Sink sink;
    EngineConfig c;
    c.timeout = 0.05;
    c.check_interval = 0.01;
    EchoEngine eng(c, sink.fn());

    std::atomic<int> reports{0};
    std::atomic<std::size_t> drained{0};
    eng.set_replay_observer([&](const ReplayReport& r) {
        drained += r.drained;
        ++reports;
    });

    REQUIRE(eng.start());
    CHECK(eng.running());
    CHECK_FALSE(eng.start());

    const std::vector<uint8_t> raw = fmo_test::bd8boj_frame(50);
    eng.ingest(raw.data(), raw.size());
    eng.ingest(raw.data(), raw.size());

    const Clock::time_point give_up = Clock::now() + 3s;
    while (drained.load() < 2 && Clock::now() < give_up) std::this_thread::sleep_for(5ms);

    CHECK(sink.count() == 2);
    CHECK(reports.load() >= 1);
    CHECK(drained.load() == 2);
    CHECK(eng.stop() == 0);
    CHECK_FALSE(eng.running());
}

TEST_CASE("stop discards frames still waiting for their quiet period") {
    Sink sink;
    EchoEngine eng(cfg_with_timeout(60.0), sink.fn());
    REQUIRE(eng.start());
    const std::vector<uint8_t> raw = fmo_test::bd8boj_frame(20);
    eng.ingest(raw.data(), raw.size());
    eng.ingest(raw.data(), raw.size());
    eng.ingest(raw.data(), raw.size());

    CHECK(eng.stop() == 3);
    CHECK(sink.count() == 0);
    CHECK(eng.state() == EngineState::Idle);
    CHECK(eng.stats().discarded == 3);
    CHECK(eng.stop() == 0);                                // idempotent
}

TEST_CASE("concurrent stop calls join once and count each frame once") {
    Sink sink;
    EchoEngine eng(cfg_with_timeout(60.0), sink.fn());
    REQUIRE(eng.start());
    const std::vector<uint8_t> raw = fmo_test::bd8boj_frame(8);
    for (int i = 0; i < 5; ++i) eng.ingest(raw.data(), raw.size());

    std::atomic<std::size_t> total{0};
    std::vector<std::thread> stoppers;
    for (int i = 0; i < 4; ++i) {
        stoppers.emplace_back([&] { total.fetch_add(eng.stop()); });
    }
    for (auto& t : stoppers) t.join();

    CHECK(total.load() == 5);
    CHECK_FALSE(eng.running());
    CHECK(eng.stats().discarded == 5);
    CHECK(sink.count() == 0);

    REQUIRE(eng.start());                                  // restartable after stop
    CHECK(eng.stop() == 0);
}

TEST_CASE("an oversized timeout is clamped to one day, not wrapped into the past") {
    Sink sink;
    EchoEngine eng(cfg_with_timeout(1e10), sink.fn());
    const Clock::time_point t0 = Clock::now();
    const std::vector<uint8_t> raw = fmo_test::bd8boj_frame(4);
    eng.ingest(raw.data(), raw.size(), t0);

    CHECK(eng.deadline() > t0);
    CHECK(eng.flush_if_quiet(t0 + 1s).empty());
    CHECK(eng.flush_if_quiet(t0 + std::chrono::hours(23)).empty());
    CHECK(sink.count() == 0);

    const ReplayReport rep = eng.flush_if_quiet(t0 + std::chrono::hours(24));
    CHECK(rep.drained == 1);
    CHECK(sink.count() == 1);
}

TEST_CASE("engines are independent instances") {
    Sink s1, s2;
    EchoEngine e1(cfg_with_timeout(1.0), s1.fn());
    EngineConfig c2 = cfg_with_timeout(1.0);
    c2.callsign_prefix = "E2>";
    c2.echo_uid = 1000;
    EchoEngine e2(c2, s2.fn());
    const Clock::time_point t0 = Clock::now();

    const std::vector<uint8_t> raw = fmo_test::bd8boj_frame(4);
    e1.ingest(raw.data(), raw.size(), t0);
    CHECK(e2.state() == EngineState::Idle);

    e2.ingest(raw.data(), raw.size(), t0);
    e1.flush_if_quiet(t0 + 1s);
    e2.flush_if_quiet(t0 + 1s);
    REQUIRE(s1.count() == 1);
    REQUIRE(s2.count() == 1);

    Frame f1, f2;
    REQUIRE(decode_frame(s1.frames[0].data(), s1.frames[0].size(), f1) == FrameError::None);
    REQUIRE(decode_frame(s2.frames[0].data(), s2.frames[0].size(), f2) == FrameError::None);
    CHECK(f1.header.uid == ECHO_UID);
    CHECK(f2.header.uid == 1000);
    CHECK(to_std_string(f2.header.callsign) == "E2>BD8BOJ");

    // e2's replay fed back into e2 is rejected; into e1 it is an original frame
    CHECK(e2.ingest(s2.frames[0].data(), s2.frames[0].size()).status == IngestStatus::EchoRejected);
    CHECK(e1.ingest(s2.frames[0].data(), s2.frames[0].size()).status == IngestStatus::Buffered);
}
