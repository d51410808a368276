// -----------------------------------------------------------------------------
// config.cpp - JSON config for fmo-echo
//
// Shape, defaults and load policy: include/fmo/config.hpp
// -----------------------------------------------------------------------------
#include "fmo/config.hpp"
#include "fmo/utf8.hpp"

#include <filesystem>
#include <fstream>
#include <limits>
#include <system_error>

namespace fs = std::filesystem;
using json = nlohmann::json;

namespace fmo {

// ---------- private helpers ----------

// Fetch section[key] or fail with "<section>.<key>_<what>".
static const json* field(const json& j, const char* section, const char* key, std::string& err) {
  if (!j.contains(section) || !j[section].is_object()) {
    err = std::string("missing_section section=") + section;
    return nullptr;
  }
  const json& sec = j[section];
  if (!sec.contains(key)) {
    err = std::string("missing_key key=") + section + "." + key;
    return nullptr;
  }
  return &sec[key];
}

static bool bad(std::string& err, const char* section, const char* key, const char* why) {
  err = std::string(why) + " key=" + section + "." + key;
  return false;
}

static bool atomic_write_json(const fs::path& p, const json& j, std::string& err) {
  std::error_code ec;
  if (p.has_parent_path()) fs::create_directories(p.parent_path(), ec);
  if (ec) { err = "mkdir_failed path=" + p.parent_path().string(); return false; }

  fs::path tmp = p;
  tmp += ".tmp";
  {
    std::ofstream out(tmp, std::ios::trunc);
    if (!out) { err = "write_failed path=" + tmp.string(); return false; }
    out << j.dump(2) << "\n";
    out.flush();
    if (!out) { err = "write_failed path=" + tmp.string(); return false; }
  }
  fs::rename(tmp, p, ec);
  if (ec) { err = "rename_failed path=" + p.string(); return false; }
  return true;
}

// ---------- public ----------

json default_config_json() {
  AppConfig d;
  return config_to_json(d);
}

json deep_merge(json base, const json& overlay) {
  if (!base.is_object() || !overlay.is_object()) return overlay;
  for (auto it = overlay.begin(); it != overlay.end(); ++it) {
    if (base.contains(it.key()) && base[it.key()].is_object() && it.value().is_object()) {
      base[it.key()] = deep_merge(base[it.key()], it.value());
    } else {
      base[it.key()] = it.value();               // scalars and arrays replace
    }
  }
  return base;
}

bool validate_config(const json& j, std::string& err) {
  constexpr long long kIntMax = std::numeric_limits<int>::max();
  if (!j.is_object()) { err = "config_not_object"; return false; }
  const json* v = nullptr;

  // ---- echo ----
  if (!(v = field(j, "echo", "timeout", err))) return false;
  if (!v->is_number() || !(v->get<double>() > 0.0)) return bad(err, "echo", "timeout", "must_be_positive_number");
  if (v->get<double>() > MAX_PERIOD_SECONDS) return bad(err, "echo", "timeout", "must_not_exceed_86400");
  const double timeout = v->get<double>();

  if (!(v = field(j, "echo", "check_interval", err))) return false;
  if (!v->is_number() || !(v->get<double>() > 0.0)) return bad(err, "echo", "check_interval", "must_be_positive_number");
  if (v->get<double>() > timeout) return bad(err, "echo", "check_interval", "must_not_exceed_timeout");

  if (!(v = field(j, "echo", "uid", err))) return false;
  if (!v->is_number_integer()) return bad(err, "echo", "uid", "must_be_integer");
  if (v->get<long long>() < 0 || v->get<long long>() > 65535) return bad(err, "echo", "uid", "out_of_range_0_65535");

  if (!(v = field(j, "echo", "callsign_prefix", err))) return false;
  if (!v->is_string()) return bad(err, "echo", "callsign_prefix", "must_be_string");
  {
    const std::string& p = v->get_ref<const std::string&>();
    if (!utf8::is_valid(p.data(), p.size())) return bad(err, "echo", "callsign_prefix", "must_be_utf8");
  }

  if (!(v = field(j, "echo", "max_buffered", err))) return false;
  if (!v->is_number_integer() || v->get<long long>() < 0) return bad(err, "echo", "max_buffered", "must_be_non_negative_integer");

  // ---- link ----
  if (!(v = field(j, "link", "device", err))) return false;
  if (!v->is_string() || v->get<std::string>().empty()) return bad(err, "link", "device", "must_be_non_empty_string");

  if (!(v = field(j, "link", "baud", err))) return false;
  if (!v->is_number_integer() || v->get<long long>() <= 0) return bad(err, "link", "baud", "must_be_positive_integer");
  if (v->get<long long>() > kIntMax) return bad(err, "link", "baud", "out_of_range");

  if (!(v = field(j, "link", "boot_delay_ms", err))) return false;
  if (!v->is_number_integer() || v->get<long long>() < 0) return bad(err, "link", "boot_delay_ms", "must_be_non_negative_integer");
  if (v->get<long long>() > kIntMax) return bad(err, "link", "boot_delay_ms", "out_of_range");

  // ---- logging ----
  if (!(v = field(j, "logging", "level", err))) return false;
  log::Level lv;
  if (!v->is_string() || !log::parse_level(v->get<std::string>(), lv)) {
    return bad(err, "logging", "level", "must_be_DEBUG_INFO_WARNING_ERROR_CRITICAL");
  }

  if (!(v = field(j, "logging", "console", err))) return false;
  if (!v->is_boolean()) return bad(err, "logging", "console", "must_be_boolean");

  if (!(v = field(j, "logging", "file", err))) return false;
  if (!v->is_string()) return bad(err, "logging", "file", "must_be_string");

  return true;
}

bool config_from_json(const json& j, AppConfig& out, std::string& err) {
  if (!validate_config(j, err)) return false;

  AppConfig c;
  const json& e = j["echo"];
  c.echo.timeout         = e["timeout"].get<double>();
  c.echo.check_interval  = e["check_interval"].get<double>();
  c.echo.echo_uid        = static_cast<uint16_t>(e["uid"].get<long long>());
  c.echo.callsign_prefix = e["callsign_prefix"].get<std::string>();
  c.echo.max_buffered    = static_cast<std::size_t>(e["max_buffered"].get<long long>());

  const json& l = j["link"];
  c.link.device        = l["device"].get<std::string>();
  c.link.baud          = l["baud"].get<int>();
  c.link.boot_delay_ms = l["boot_delay_ms"].get<int>();

  const json& g = j["logging"];
  c.logging.level   = g["level"].get<std::string>();
  c.logging.console = g["console"].get<bool>();
  c.logging.file    = g["file"].get<std::string>();

  out = c;
  return true;
}

json config_to_json(const AppConfig& cfg) {
  json j;
  j["echo"] = {
    {"timeout",         cfg.echo.timeout},
    {"uid",             cfg.echo.echo_uid},
    {"callsign_prefix", cfg.echo.callsign_prefix},
    {"check_interval",  cfg.echo.check_interval},
    {"max_buffered",    cfg.echo.max_buffered},
  };
  j["link"] = {
    {"device",        cfg.link.device},
    {"baud",          cfg.link.baud},
    {"boot_delay_ms", cfg.link.boot_delay_ms},
  };
  j["logging"] = {
    {"level",   cfg.logging.level},
    {"console", cfg.logging.console},
    {"file",    cfg.logging.file},
  };
  return j;
}

bool load_config(const std::string& path, AppConfig& out, bool& from_file, std::string& err) {
  from_file = false;
  json merged = default_config_json();

  std::error_code ec;
  if (!path.empty() && fs::exists(path, ec)) {
    std::ifstream in(path);
    if (!in) { err = "config_open_failed path=" + path; return false; }

    json user = json::parse(in, nullptr, /*allow_exceptions=*/false, /*ignore_comments=*/true);
    if (user.is_discarded()) { err = "config_parse_failed path=" + path; return false; }
    if (!user.is_object())   { err = "config_not_object path=" + path; return false; }

    merged = deep_merge(merged, user);
    from_file = true;
  }

  return config_from_json(merged, out, err);
}

bool save_default_config(const std::string& path, std::string& err) {
  if (path.empty()) { err = "empty_path"; return false; }
  return atomic_write_json(path, default_config_json(), err);
}

} // namespace fmo
