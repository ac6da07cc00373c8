// SPDX-FileCopyrightText: 2026 ArcheBase
//
// SPDX-License-Identifier: MulanPSL-2.0

#ifndef REEL_LOG_INIT_HPP
#define REEL_LOG_INIT_HPP

#include <optional>
#include <string>

#include "reel_console_sink.hpp"
#include "reel_file_sink.hpp"
#include "reel_log_severity.hpp"

namespace reel {
namespace logging {

/**
 * Mode reported by records logged outside a cassette session.
 */
constexpr const char* kIdleMode = "idle";

/**
 * Logging configuration for reel libraries and tools.
 */
struct LoggingConfig {
  // Console sink
  bool console_enabled = true;
  bool console_colors = true;
  severity_level console_level = severity_level::info;

  // File sink, off unless a test run asks for it
  bool file_enabled = false;
  FileSinkConfig file_config;
  severity_level file_level = severity_level::debug;
};

/**
 * Parse a severity name ("debug", "info", "warn"/"warning", "error",
 * "fatal"), case-insensitive.
 */
std::optional<severity_level> parse_severity_level(const std::string& level_str);

/**
 * Apply REEL_LOG_* environment overrides to a LoggingConfig.
 *
 *   REEL_LOG_LEVEL           both sinks; the per-sink variables below win
 *   REEL_LOG_CONSOLE_LEVEL   console sink level
 *   REEL_LOG_FILE_LEVEL      file sink level
 *   REEL_LOG_CONSOLE_ENABLED "true"/"false" (also 1/0, yes/no, on/off)
 *   REEL_LOG_FILE_ENABLED    same
 *   REEL_LOG_FILE_DIR        log file directory
 *   REEL_LOG_FORMAT          file format, "json" or "text"
 *
 * Empty or unparseable values leave the field unchanged.
 */
void apply_env_overrides(LoggingConfig& config);

/**
 * Install the configured sinks and the session context defaults.
 *
 * Every record carries a "Mode" attribute: kIdleMode unless the logging
 * thread is inside REEL_LOG_SCOPED_CONTEXT, whose thread attributes take
 * precedence. Calling it again before shutdown_logging() is a no-op.
 */
void init_logging(const LoggingConfig& config);

/**
 * Drain and remove the sinks and the context defaults.
 */
void shutdown_logging();

bool is_logging_initialized();

}  // namespace logging
}  // namespace reel

#endif  // REEL_LOG_INIT_HPP
