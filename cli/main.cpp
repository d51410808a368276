/**
 * @file main.cpp
 * @brief fmo-frame - one-shot FMO frame inspector/builder around the echo codec.
 *
 * Responsibilities:
 *  - --decode FILE|- : read a raw frame (or hex text with --hex) and show its header.
 *  - --build         : assemble a frame from --uid/--callsign/--frame-version and a payload.
 *  - --rewrite       : pass the frame through the echo ReplayTransform (--prefix, --echo-uid).
 *  - --out FILE|-    : write the resulting frame bytes.
 *  - --format pretty|json|raw : pretty for humans, json for scripts, raw = hex bytes.
 *
 * Exit codes: 0 ok, 2 usage/invalid input, 3 malformed frame.
 */

#include <cstdint>
#include <cstdio>
#include <fstream>
#include <iomanip>
#include <iostream>
#include <iterator>
#include <sstream>
#include <string>
#include <vector>

#include <unistd.h> // isatty

#include "CLI/CLI11.hpp"
#include "nlohmann/json.hpp"

#include "fmo/frame_header.hpp"
#include "fmo/header_codec.hpp"
#include "fmo/replay_transform.hpp"
#include "fmo/utf8.hpp"

using json = nlohmann::json;
using namespace fmo;

// ---------- small utilities ----------

static bool is_tty_stdout() { return ::isatty(fileno(stdout)); }

struct Ansi {
  bool enabled{true};
  std::string bold(const std::string& s) const { return enabled ? "\033[1m"+s+"\033[0m" : s; }
  std::string dim (const std::string& s) const { return enabled ? "\033[2m"+s+"\033[0m" : s; }
  std::string red (const std::string& s) const { return enabled ? "\033[31m"+s+"\033[0m" : s; }
};

static bool read_all(const std::string& path, std::vector<uint8_t>& out) {
  if (path == "-") {
    out.assign(std::istreambuf_iterator<char>(std::cin), std::istreambuf_iterator<char>());
    return !std::cin.bad();
  }
  std::ifstream in(path, std::ios::binary);
  if (!in) return false;
  out.assign(std::istreambuf_iterator<char>(in), std::istreambuf_iterator<char>());
  return !in.bad();
}

static bool write_all(const std::string& path, const std::vector<uint8_t>& bytes) {
  if (path == "-") {
    std::cout.write(reinterpret_cast<const char*>(bytes.data()), static_cast<std::streamsize>(bytes.size()));
    std::cout.flush();
    return static_cast<bool>(std::cout);
  }
  std::ofstream out(path, std::ios::binary | std::ios::trunc);
  if (!out) return false;
  out.write(reinterpret_cast<const char*>(bytes.data()), static_cast<std::streamsize>(bytes.size()));
  return static_cast<bool>(out);
}

static int hex_nibble(char c) {
  if (c >= '0' && c <= '9') return c - '0';
  if (c >= 'a' && c <= 'f') return c - 'a' + 10;
  if (c >= 'A' && c <= 'F') return c - 'A' + 10;
  return -1;
}

// Hex text -> bytes. Whitespace is ignored; anything else must pair up.
static bool parse_hex(const std::vector<uint8_t>& text, std::vector<uint8_t>& out) {
  out.clear();
  int hi = -1;
  for (uint8_t ch : text) {
    const char c = static_cast<char>(ch);
    if (c == ' ' || c == '\n' || c == '\r' || c == '\t') continue;
    const int v = hex_nibble(c);
    if (v < 0) return false;
    if (hi < 0) { hi = v; continue; }
    out.push_back(static_cast<uint8_t>((hi << 4) | v));
    hi = -1;
  }
  return hi < 0;
}

static std::string to_hex(const std::vector<uint8_t>& bytes) {
  std::ostringstream os;
  os << std::hex << std::setfill('0');
  for (uint8_t b : bytes) os << std::setw(2) << static_cast<unsigned>(b);
  return os.str();
}

static void print_pretty(const Frame& f, bool anomaly, bool rewritten, const Ansi& ansi) {
  auto kv = [&](const char* k, const std::string& v) {
    std::cout << "  " << ansi.bold(std::string("[") + k + "] ") << v << "\n";
  };
  auto h4 = [](uint16_t v) {
    char b[8]; std::snprintf(b, sizeof(b), "0x%04X", static_cast<unsigned>(v)); return std::string(b);
  };
  std::cout << ansi.bold(rewritten ? "FRAME (echo)" : "FRAME") << "\n";
  kv("VERSION",  std::to_string(f.header.version));
  kv("PADDING1", h4(f.header.padding1));
  kv("UID",      std::to_string(f.header.uid) + (f.header.uid == ECHO_UID ? ansi.dim("  (echo uid)") : ""));
  kv("PADDING2", h4(f.header.padding2));
  kv("CALLSIGN", "'" + to_std_string(f.header.callsign) + "'"
                 + (anomaly ? ansi.red("  (invalid UTF-8 replaced)") : ""));
  kv("PAYLOAD",  std::to_string(f.payload.size()) + " bytes");
  kv("FRAME",    std::to_string(HEADER_SIZE + f.payload.size()) + " bytes");
}

static json frame_json(const Frame& f, bool anomaly, bool rewritten) {
  json j;
  j["version"]          = f.header.version;
  j["padding1"]         = f.header.padding1;
  j["uid"]              = f.header.uid;
  j["padding2"]         = f.header.padding2;
  j["callsign"]         = to_std_string(f.header.callsign);
  j["payload_size"]     = f.payload.size();
  j["frame_size"]       = HEADER_SIZE + f.payload.size();
  j["encoding_anomaly"] = anomaly;
  j["rewritten"]        = rewritten;
  return j;
}

// ---------- main ----------

int main(int argc, char** argv) {
  std::string opt_decode;
  bool opt_hex = false;
  bool opt_build = false;
  bool opt_rewrite = false;
  std::string opt_out;
  std::string opt_format = "pretty"; // pretty|json|raw
  bool opt_no_color = false;

  // build inputs
  uint32_t opt_version = 1;
  uint16_t opt_uid = 0;
  std::string opt_callsign;
  std::size_t opt_payload_size = 0;
  std::string opt_payload_file;

  // rewrite knobs
  std::string opt_prefix = "RE>";
  uint16_t opt_echo_uid = ECHO_UID;

  CLI::App app{"FMO frame tool"};
  app.add_option("--decode", opt_decode, "Decode a raw frame from FILE ('-' = stdin)");
  app.add_flag("--hex", opt_hex, "Input is hex text instead of raw bytes");
  app.add_flag("--build", opt_build, "Build a frame from --uid/--callsign/--frame-version/--payload*");
  app.add_flag("--rewrite", opt_rewrite, "Apply the echo rewrite (uid + callsign prefix)");
  app.add_option("--out", opt_out, "Write resulting frame bytes to FILE ('-' = stdout)");
  app.add_option("--format", opt_format, "Output format: pretty|json|raw")->check(CLI::IsMember({"pretty","json","raw"}));
  app.add_flag("--no-color", opt_no_color, "Disable ANSI colors");

  app.add_option("--frame-version", opt_version, "Header version field")->capture_default_str();
  app.add_option("--uid", opt_uid, "Header uid field")->capture_default_str();
  app.add_option("--callsign", opt_callsign, "Callsign (UTF-8, cut to 12 bytes)");
  CLI::Option* o_psize = app.add_option("--payload-size", opt_payload_size, "Zero-filled payload of N bytes");
  CLI::Option* o_pfile = app.add_option("--payload", opt_payload_file, "Payload bytes from FILE");
  o_psize->excludes(o_pfile);

  app.add_option("--prefix", opt_prefix, "Callsign prefix for --rewrite")->capture_default_str();
  app.add_option("--echo-uid", opt_echo_uid, "uid stamped by --rewrite")->capture_default_str();

  try {
    app.parse(argc, argv);
  } catch (const CLI::ParseError &e) {
    return app.exit(e);
  }

  Ansi ansi;
  ansi.enabled = !opt_no_color && is_tty_stdout() && (opt_format=="pretty");

  if (opt_build == !opt_decode.empty()) {
    std::cerr << "status=error reason=need_exactly_one_of_decode_build\n";
    return 2;
  }

  // header text must stay valid UTF-8 (json output and the wire both rely on it)
  if (!utf8::is_valid(opt_callsign.data(), opt_callsign.size())) {
    std::cerr << "status=error reason=bad_callsign detail=invalid_utf8\n";
    return 2;
  }
  if (!utf8::is_valid(opt_prefix.data(), opt_prefix.size())) {
    std::cerr << "status=error reason=bad_prefix detail=invalid_utf8\n";
    return 2;
  }

  // -------- obtain frame --------
  Frame frame;
  bool anomaly = false;

  if (!opt_decode.empty()) {
    std::vector<uint8_t> bytes;
    if (!read_all(opt_decode, bytes)) {
      std::cerr << "status=error reason=read_failed path=" << opt_decode << "\n";
      return 2;
    }
    if (opt_hex) {
      std::vector<uint8_t> raw;
      if (!parse_hex(bytes, raw)) {
        std::cerr << "status=error reason=bad_hex\n";
        return 2;
      }
      bytes.swap(raw);
    }
    const FrameError e = decode_frame(bytes.data(), bytes.size(), frame);
    if (e == FrameError::MalformedHeader) {
      std::cerr << "status=error reason=" << to_string(e) << " bytes=" << bytes.size() << "\n";
      return 3;
    }
    anomaly = (e == FrameError::EncodingAnomaly);
  } else {
    frame.header.version = opt_version;
    frame.header.uid     = opt_uid;
    frame.header.callsign = make_callsign(utf8::truncate(opt_callsign, CALLSIGN_SIZE));
    if (!opt_payload_file.empty()) {
      if (!read_all(opt_payload_file, frame.payload)) {
        std::cerr << "status=error reason=read_failed path=" << opt_payload_file << "\n";
        return 2;
      }
    } else {
      frame.payload.assign(opt_payload_size, 0);
    }
  }

  if (opt_rewrite) {
    ReplayTransform t(opt_echo_uid, opt_prefix);
    frame = t.rewrite(frame);
  }

  const std::vector<uint8_t> wire = encode_frame(frame);

  if (!opt_out.empty() && !write_all(opt_out, wire)) {
    std::cerr << "status=error reason=write_failed path=" << opt_out << "\n";
    return 2;
  }

  // stdout carries the frame bytes; keep it clean
  if (opt_out == "-") return 0;

  if (opt_format == "json") {
    std::cout << frame_json(frame, anomaly, opt_rewrite).dump(2) << "\n";
  } else if (opt_format == "raw") {
    std::cout << to_hex(wire) << "\n";
  } else {
    print_pretty(frame, anomaly, opt_rewrite, ansi);
  }
  return 0;
}
