/**
 * @file main.cpp
 * @brief fmo-echo - FMO echo service. Reads SLIP-framed FMO frames from a link,
 *        replays each transmission after the channel goes quiet.
 *
 * Responsibilities:
 *  - Parse CLI options (CLI11); load config.json over built-in defaults.
 *  - Open the link: "-" = stdin/stdout pipe (behind a pub/sub bridge),
 *    anything else = serial tty.
 *  - Run one EchoEngine with the link as emit sink and its checker thread on.
 *  - Main loop: poll the link, pump frames, ingest, log outcomes.
 *  - SIGINT/SIGTERM or end of input: stop engine, report discarded frames, close link.
 *
 * Exit codes: 0 clean shutdown, 1 config/link failure, 2 usage error.
 */

#include <cerrno>
#include <csignal>
#include <cstdint>
#include <iostream>
#include <memory>
#include <string>
#include <vector>

#include <poll.h>
#include <unistd.h>

#include "CLI/CLI11.hpp"
#include "nlohmann/json.hpp"

#include "fmo/config.hpp"
#include "fmo/echo_engine.hpp"
#include "fmo/frame_link.hpp"
#include "fmo/header_codec.hpp"
#include "fmo/log.hpp"
#include "fmo/transport/transport_linux_serial.hpp"
#include "fmo/transport/transport_stdio.hpp"

using json = nlohmann::json;
using namespace fmo;

// ---------- signals ----------

static volatile std::sig_atomic_t g_stop_signal = 0;

static void on_signal(int signo) { g_stop_signal = signo; }

// No SA_RESTART: poll() must return EINTR so the loop notices the flag.
static void install_signal_handlers() {
  struct sigaction sa{};
  sa.sa_handler = on_signal;
  sigemptyset(&sa.sa_mask);
  sa.sa_flags = 0;
  ::sigaction(SIGINT, &sa, nullptr);
  ::sigaction(SIGTERM, &sa, nullptr);
  std::signal(SIGPIPE, SIG_IGN);          // a dead bridge shows up as a send error
}

// ---------- logging helpers ----------

static void log_ingest(log::Logger& lg, const IngestResult& r, std::size_t buffered) {
  switch (r.status) {
    case IngestStatus::Buffered:
      if (r.error == FrameError::EncodingAnomaly) {
        lg.warning("callsign_encoding_anomaly").kv("uid", r.header.uid)
          .kv("callsign", to_std_string(r.header.callsign));
      }
      if (lg.enabled(log::Level::Debug)) {
        lg.write(log::Level::Debug, "event=frame_buffered " + describe_header(r.header)
                 + " bytes=" + std::to_string(r.size) + " buffered=" + std::to_string(buffered));
      }
      break;
    case IngestStatus::EchoRejected:
      lg.debug("echo_ignored").kv("uid", r.header.uid)
        .kv("callsign", to_std_string(r.header.callsign));
      break;
    case IngestStatus::Dropped:
      if (r.error == FrameError::BufferFull) {
        lg.warning("frame_dropped").kv("reason", to_string(r.error))
          .kv("uid", r.header.uid).kv("buffered", buffered);
      } else {
        lg.warning("frame_dropped").kv("reason", to_string(r.error)).kv("bytes", r.size);
      }
      break;
  }
}

static void log_replay(log::Logger& lg, const ReplayReport& rep) {
  for (const auto& f : rep.failures) {
    lg.warning("replay_failed").kv("index", f.index)
      .kv("reason", to_string(f.error)).kv("tx", transport::to_string(f.tx))
      .kv("callsign", to_std_string(f.header.callsign));
  }
  lg.info("replay_done").kv("ok", rep.emitted).kv("failed", rep.failures.size()).kv("total", rep.drained);
}

// ---------- main ----------

int main(int argc, char** argv) {
  CLI::App app{"FMO echo service"};

  std::string config_path = "config.json";
  std::string generate_path;
  bool print_config = false;

  // overrides
  std::string dev;
  double timeout = 0.0;
  std::string prefix;
  std::string log_level;

  app.add_option("-c,--config", config_path, "Config file (JSON); missing file = defaults")->capture_default_str();
  app.add_option("--generate-config", generate_path, "Write a default config to FILE and exit");
  app.add_flag("--print-config", print_config, "Print the effective config as JSON and exit");

  CLI::Option* opt_dev     = app.add_option("--device,--dev", dev, "Link: '-' for stdin/stdout or a tty path");
  CLI::Option* opt_timeout = app.add_option("--timeout", timeout, "Quiet period in seconds");
  CLI::Option* opt_prefix  = app.add_option("--prefix", prefix, "Callsign prefix for replays");
  CLI::Option* opt_level   = app.add_option("--log-level", log_level, "DEBUG|INFO|WARNING|ERROR|CRITICAL");

  CLI11_PARSE(app, argc, argv);

  // -------- generate mode --------
  if (!generate_path.empty()) {
    std::string err;
    if (!save_default_config(generate_path, err)) {
      std::cerr << "status=error reason=" << err << "\n";
      return 1;
    }
    std::cout << "status=ok generated=" << generate_path << "\n";
    return 0;
  }

  // -------- config --------
  AppConfig cfg;
  bool from_file = false;
  std::string err;
  if (!load_config(config_path, cfg, from_file, err)) {
    std::cerr << "status=error reason=" << err << "\n";
    return 1;
  }

  // CLI overrides go back through validation like file values do
  if (opt_dev->count() || opt_timeout->count() || opt_prefix->count() || opt_level->count()) {
    json j = config_to_json(cfg);
    if (opt_dev->count())     j["link"]["device"]          = dev;
    if (opt_timeout->count()) j["echo"]["timeout"]         = timeout;
    if (opt_prefix->count())  j["echo"]["callsign_prefix"] = prefix;
    if (opt_level->count())   j["logging"]["level"]        = log_level;
    if (!config_from_json(j, cfg, err)) {
      std::cerr << "status=error reason=" << err << "\n";
      return 2;
    }
  }

  if (print_config) {
    std::cout << config_to_json(cfg).dump(2) << "\n";
    return 0;
  }

  log::Logger lg;
  if (!lg.configure(cfg.logging, err)) {
    std::cerr << "status=error reason=" << err << "\n";
    return 1;
  }

  // -------- link --------
  std::unique_ptr<transport::ITransport> tr;
  bool opened = false;
  if (cfg.link.device == "-") {
    auto p = std::make_unique<transport::StdioPipe>();
    transport::Config tc;
    opened = p->begin(tc);
    tr = std::move(p);
  } else {
    auto s = std::make_unique<transport::LinuxSerial>(cfg.link.device, cfg.link.baud);
    transport::SerialConfig sc;
    sc.path          = cfg.link.device;
    sc.baud          = cfg.link.baud;
    sc.boot_delay_ms = cfg.link.boot_delay_ms;
    opened = s->begin(sc);
    tr = std::move(s);
  }
  if (!opened) {
    lg.critical("link_open_failed").kv("device", cfg.link.device).kv("errno", errno);
    return 1;
  }

  FrameLink link(*tr);

  // -------- engine --------
  EchoEngine engine(cfg.echo, [&link](const uint8_t* p, std::size_t n) {
    return link.send_frame(p, n);
  });
  engine.set_replay_observer([&lg](const ReplayReport& rep) { log_replay(lg, rep); });

  install_signal_handlers();

  lg.info("service_start")
    .kv("config", config_path).kv("from_file", from_file)
    .kv("device", cfg.link.device).kv("transport", tr->name())
    .kv("timeout", cfg.echo.timeout).kv("echo_uid", cfg.echo.echo_uid)
    .kv("prefix", cfg.echo.callsign_prefix).kv("max_buffered", cfg.echo.max_buffered);

  if (!engine.start()) {
    lg.critical("engine_start_failed");
    return 1;
  }

  // -------- main loop --------
  std::vector<std::vector<uint8_t>> frames;
  const int fd = tr->native_handle();
  bool link_lost = false;

  while (!g_stop_signal && !link_lost) {
    bool hangup = false;
    if (fd >= 0) {
      pollfd p{fd, POLLIN, 0};
      int pr = ::poll(&p, 1, 200);                    // bounded: re-check stop flag
      if (pr < 0) {
        if (errno == EINTR) continue;
        lg.error("poll_failed").kv("errno", errno);
        break;
      }
      if (pr == 0) continue;
      hangup = (p.revents & (POLLHUP | POLLERR | POLLNVAL)) != 0;
    } else {
      ::usleep(10 * 1000);
    }

    frames.clear();
    const transport::RxResult r = link.pump(frames);
    for (const auto& f : frames) {
      const IngestResult res = engine.ingest(f.data(), f.size());
      log_ingest(lg, res, engine.buffered());
    }

    if (r == transport::RxResult::Error || (hangup && r == transport::RxResult::None)) {
      lg.warning("link_closed").kv("transport", tr->name());
      link_lost = true;
    }
  }

  if (g_stop_signal) lg.info("signal_received").kv("signal", static_cast<int>(g_stop_signal));

  // -------- shutdown --------
  const std::size_t discarded = engine.stop();
  if (discarded > 0) lg.warning("buffer_discarded").kv("frames", discarded);

  const EngineStats st = engine.stats();
  lg.info("service_stop")
    .kv("received", st.received).kv("buffered", st.buffered)
    .kv("echo_rejected", st.echo_rejected).kv("malformed", st.malformed)
    .kv("batches", st.batches).kv("emitted", st.emitted)
    .kv("emit_failures", st.emit_failures).kv("slip_dropped", link.slip_dropped());

  tr->end();
  return 0;
}
