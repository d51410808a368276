/**
 * @file config.hpp
 * @brief JSON configuration for fmo-echo: defaults, deep merge, validation, template output.
 *
 * @details
 * FILE SHAPE
 * ----------
 * @code{.json}
 * {
 *   "echo":    { "timeout": 5.0, "uid": 65535, "callsign_prefix": "RE>",
 *                "check_interval": 0.1, "max_buffered": 0 },
 *   "link":    { "device": "-", "baud": 115200, "boot_delay_ms": 0 },
 *   "logging": { "level": "INFO", "console": true, "file": "" }
 * }
 * @endcode
 *
 * LOADING
 * -------
 * - Built-in defaults first; the user file is deep-merged on top (objects
 *   merge key by key, everything else replaces). A partial file is fine.
 * - Missing file: defaults are used and @p from_file is false.
 * - Unparsable file or a value that fails validation: false + reason.
 *
 * Error reasons are short key=value fragments so callers can print them as
 * `status=error reason=<err>`.
 */
#ifndef FMO_CONFIG_HPP
#define FMO_CONFIG_HPP

#include <string>
#include "nlohmann/json.hpp"
#include "fmo/echo_engine.hpp"
#include "fmo/log.hpp"

namespace fmo {

  /// Where frames come from / go to. "-" means stdin/stdout.
  struct LinkConfig {
    std::string device{"-"};
    int         baud{115200};
    int         boot_delay_ms{0};
  };

  struct AppConfig {
    EngineConfig   echo;
    LinkConfig     link;
    log::LogConfig logging;
  };

  /// The built-in defaults as JSON (also the --generate-config template).
  nlohmann::json default_config_json();

  /// Recursive merge: objects merge, other values in @p overlay replace.
  nlohmann::json deep_merge(nlohmann::json base, const nlohmann::json& overlay);

  /// Check types and ranges of a fully merged document.
  bool validate_config(const nlohmann::json& j, std::string& err);

  /// validate_config() then copy into @p out.
  bool config_from_json(const nlohmann::json& j, AppConfig& out, std::string& err);

  nlohmann::json config_to_json(const AppConfig& cfg);

  /**
   * @brief Load @p path over the defaults.
   * @param from_file set to true when the file existed and was read.
   */
  bool load_config(const std::string& path, AppConfig& out, bool& from_file, std::string& err);

  /// Write the default document to @p path (tmp file + rename).
  bool save_default_config(const std::string& path, std::string& err);

} // namespace fmo

#endif // FMO_CONFIG_HPP
