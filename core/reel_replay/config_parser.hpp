// SPDX-FileCopyrightText: 2026 ArcheBase
//
// SPDX-License-Identifier: MulanPSL-2.0

#ifndef REEL_REPLAY_CONFIG_PARSER_HPP
#define REEL_REPLAY_CONFIG_PARSER_HPP

#include <yaml-cpp/yaml.h>

#include <cstddef>
#include <string>
#include <vector>

// Forward declaration
namespace reel {
namespace logging {
struct LoggingConfig;
}
}  // namespace reel

namespace reel {
namespace replay {

class EngineConfig;

/**
 * The `cassettes:` section of a YAML config file.
 */
struct CassetteSettings {
  std::string dir;
  std::string extension = ".json";
  std::vector<std::string> ignore;
};

/**
 * The `logging:` section of a YAML config file, as written by users.
 */
struct LoggingSettings {
  // Console sink
  bool console_enabled = true;
  bool console_colors = true;
  std::string console_level = "info";  // debug, info, warn, error, fatal

  // File sink
  bool file_enabled = false;
  std::string file_level = "debug";
  std::string file_directory = "/tmp/reel/logs";
  std::string file_pattern = "reel_%Y%m%d_%H%M%S.log";
  std::string file_format = "json";  // json or text
  size_t rotation_size_mb = 20;
  size_t max_files = 5;
};

/**
 * Everything a reel YAML config file can hold.
 *
 *   cassettes:
 *     dir: test/fixtures/cassettes
 *     extension: .json
 *     ignore: [request_id, token]
 *   logging:
 *     console: {enabled: true, level: info, colors: true}
 *     file: {enabled: false, level: debug, directory: /tmp/reel/logs, format: json}
 */
struct ReelConfig {
  CassetteSettings cassettes;
  LoggingSettings logging;
};

/**
 * Convert LoggingSettings to reel::logging::LoggingConfig.
 * Unrecognized level names keep the logging library's defaults.
 */
void convert_logging_config(
  const LoggingSettings& settings, ::reel::logging::LoggingConfig& log_config
);

/**
 * Copy the cassette settings into an engine configuration. An empty `dir`
 * leaves the engine's directory unchanged.
 */
void apply_cassette_settings(const CassetteSettings& settings, EngineConfig& config);

class ConfigParser {
public:
  ConfigParser() = default;

  /**
   * Load configuration from YAML file
   */
  bool load_from_file(const std::string& path, ReelConfig& config);

  /**
   * Load configuration from YAML string
   */
  bool load_from_string(const std::string& yaml_content, ReelConfig& config);

  /**
   * Validate configuration
   */
  static bool validate(const ReelConfig& config, std::string& error_msg);

  /**
   * Get last error message
   */
  std::string get_last_error() const {
    return last_error_;
  }

private:
  bool parse_cassettes(const YAML::Node& node, CassetteSettings& cassettes);
  bool parse_logging(const YAML::Node& node, LoggingSettings& logging);

  // Last error message
  mutable std::string last_error_;
};

}  // namespace replay
}  // namespace reel

#endif  // REEL_REPLAY_CONFIG_PARSER_HPP
