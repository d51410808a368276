#pragma once
/**
 * @file log.hpp
 * @brief Leveled key=value logging for the echo service.
 *
 * @details
 * Output is one line per record, same shape the CLI uses for status lines:
 *
 *   2026-10-19 10:00:00 level=INFO event=replay_done ok=3 failed=0 total=3
 *
 * Sinks: console (std::cerr by default) and an optional append-mode file.
 * The parent directory of the file is created on configure(). Rotation is
 * left to logrotate (copytruncate) or the supervisor.
 *
 * Records are assembled in a Line object and written in one piece when it
 * goes out of scope, so concurrent threads never interleave within a line.
 *
 * @code
 *   fmo::log::Logger log;
 *   log.info("frame_buffered").kv("uid", 441).kv("callsign", "BD8BOJ");
 * @endcode
 */

#include <atomic>
#include <cstdint>
#include <fstream>
#include <mutex>
#include <ostream>
#include <sstream>
#include <string>

namespace fmo::log {

enum class Level : uint8_t { Debug=10, Info=20, Warning=30, Error=40, Critical=50 };

/// Accepts DEBUG, INFO, WARNING, ERROR, CRITICAL (case-insensitive).
bool parse_level(const std::string& s, Level& out);
const char* level_name(Level lv);

struct LogConfig {
  std::string level{"INFO"};
  bool        console{true};
  std::string file;            // empty = no file sink
};

class Logger;

/**
 * @brief One pending record. Written by the destructor.
 *
 * A Line made for a disabled level carries no logger and does nothing.
 */
class Line {
public:
  Line(Logger* owner, Level lv, const char* event);
  Line(Line&& other) noexcept;
  Line(const Line&) = delete;
  Line& operator=(const Line&) = delete;
  Line& operator=(Line&&) = delete;
  ~Line();

  template <typename T>
  Line& kv(const char* key, const T& value) {
    if (owner_) buf_ << ' ' << key << '=' << value;
    return *this;
  }

  /// Strings are quoted when empty or when they contain spaces.
  Line& kv(const char* key, const std::string& value);
  Line& kv(const char* key, const char* value) { return kv(key, std::string(value ? value : "")); }
  Line& kv(const char* key, bool value) { return kv<int>(key, value ? 1 : 0); }
  Line& kv(const char* key, uint8_t value) { return kv<unsigned>(key, value); }

private:
  Logger* owner_;
  Level level_;
  std::ostringstream buf_;
};

class Logger {
public:
  Logger();

  /**
   * @brief Apply level + sinks. On failure (bad level, file not writable)
   *        nothing changes and @p err says why.
   */
  bool configure(const LogConfig& cfg, std::string& err);

  void set_level(Level lv) { level_.store(lv); }
  Level level() const { return level_.load(); }
  bool enabled(Level lv) const { return static_cast<uint8_t>(lv) >= static_cast<uint8_t>(level_.load()); }

  /// Redirect the console sink (tests). nullptr disables it.
  void set_console(std::ostream* os);

  Line debug(const char* event)    { return line(Level::Debug, event); }
  Line info(const char* event)     { return line(Level::Info, event); }
  Line warning(const char* event)  { return line(Level::Warning, event); }
  Line error(const char* event)    { return line(Level::Error, event); }
  Line critical(const char* event) { return line(Level::Critical, event); }
  Line line(Level lv, const char* event);

  /// Write a fully formatted record body (without timestamp/level).
  void write(Level lv, const std::string& body);

private:
  std::mutex    mu_;
  std::atomic<Level> level_{Level::Info};
  std::ostream* console_;
  std::ofstream file_;
};

} // namespace fmo::log
