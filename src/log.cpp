// -----------------------------------------------------------------------------
// log.cpp - key=value log sink for the echo service
// -----------------------------------------------------------------------------
#include "fmo/log.hpp"

#include <cctype>
#include <ctime>
#include <filesystem>
#include <iomanip>
#include <iostream>
#include <system_error>
#include <utility>

namespace fs = std::filesystem;

namespace fmo::log {

// ---------- levels ----------

bool parse_level(const std::string& s, Level& out) {
  std::string u;
  u.reserve(s.size());
  for (char c : s) u.push_back(static_cast<char>(std::toupper(static_cast<unsigned char>(c))));

  if      (u == "DEBUG")    out = Level::Debug;
  else if (u == "INFO")     out = Level::Info;
  else if (u == "WARNING")  out = Level::Warning;
  else if (u == "ERROR")    out = Level::Error;
  else if (u == "CRITICAL") out = Level::Critical;
  else return false;
  return true;
}

const char* level_name(Level lv) {
  switch (lv) {
    case Level::Debug:    return "DEBUG";
    case Level::Info:     return "INFO";
    case Level::Warning:  return "WARNING";
    case Level::Error:    return "ERROR";
    case Level::Critical: return "CRITICAL";
  }
  return "INFO";
}

// ---------- Line ----------

Line::Line(Logger* owner, Level lv, const char* event)
: owner_(owner), level_(lv) {
  if (owner_) buf_ << "event=" << (event ? event : "");
}

Line::Line(Line&& other) noexcept
: owner_(other.owner_), level_(other.level_), buf_(std::move(other.buf_)) {
  other.owner_ = nullptr;                 // moved-from line must not write
}

Line::~Line() {
  if (owner_) owner_->write(level_, buf_.str());
}

Line& Line::kv(const char* key, const std::string& value) {
  if (!owner_) return *this;
  buf_ << ' ' << key << '=';
  if (value.empty() || value.find(' ') != std::string::npos) buf_ << '\'' << value << '\'';
  else                                                         buf_ << value;
  return *this;
}

// ---------- Logger ----------

Logger::Logger() : console_(&std::cerr) {}

bool Logger::configure(const LogConfig& cfg, std::string& err) {
  Level lv;
  if (!parse_level(cfg.level, lv)) {
    err = "invalid_log_level level=" + cfg.level;
    return false;
  }

  std::ofstream f;
  if (!cfg.file.empty()) {
    const fs::path p(cfg.file);
    std::error_code ec;
    if (p.has_parent_path()) fs::create_directories(p.parent_path(), ec);
    if (ec) { err = "log_dir_failed path=" + p.parent_path().string(); return false; }
    f.open(p, std::ios::app);
    if (!f) { err = "log_open_failed path=" + cfg.file; return false; }
  }

  std::lock_guard<std::mutex> lk(mu_);
  level_.store(lv);
  console_ = cfg.console ? &std::cerr : nullptr;
  if (file_.is_open()) file_.close();
  file_ = std::move(f);
  return true;
}

void Logger::set_console(std::ostream* os) {
  std::lock_guard<std::mutex> lk(mu_);
  console_ = os;
}

Line Logger::line(Level lv, const char* event) {
  return Line(enabled(lv) ? this : nullptr, lv, event);
}

void Logger::write(Level lv, const std::string& body) {
  if (!enabled(lv)) return;

  const std::time_t t = std::time(nullptr);
  std::tm tm{};
  localtime_r(&t, &tm);

  std::ostringstream rec;
  rec << std::put_time(&tm, "%Y-%m-%d %H:%M:%S") << " level=" << level_name(lv) << ' ' << body << '\n';
  const std::string s = rec.str();

  std::lock_guard<std::mutex> lk(mu_);
  if (console_) { *console_ << s; console_->flush(); }
  if (file_.is_open()) { file_ << s; file_.flush(); }
}

} // namespace fmo::log
