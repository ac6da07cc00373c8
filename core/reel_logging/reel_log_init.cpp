// SPDX-FileCopyrightText: 2026 ArcheBase
//
// SPDX-License-Identifier: MulanPSL-2.0

#include "reel_log_init.hpp"

#include <boost/log/attributes/constant.hpp>
#include <boost/log/core.hpp>
#include <boost/log/utility/setup/common_attributes.hpp>

#include <algorithm>
#include <cctype>
#include <cstdlib>
#include <mutex>

#include "reel_log_macros.hpp"

namespace reel {
namespace logging {

namespace {

struct LoggingState {
  std::mutex mutex;
  boost::shared_ptr<async_console_sink_t> console;
  boost::shared_ptr<async_file_sink_t> file;
  boost::log::attribute_set::iterator mode_default;
  bool owns_mode_default = false;
  bool initialized = false;
};

LoggingState& state() {
  static LoggingState instance;
  return instance;
}

struct LevelName {
  const char* name;
  severity_level level;
};

constexpr LevelName kLevelNames[] = {
  {"debug", severity_level::debug},
  {"info", severity_level::info},
  {"warn", severity_level::warn},
  {"warning", severity_level::warn},
  {"error", severity_level::error},
  {"fatal", severity_level::fatal},
};

std::string lowercase(std::string s) {
  std::transform(s.begin(), s.end(), s.begin(), [](unsigned char c) {
    return static_cast<char>(std::tolower(c));
  });
  return s;
}

// Unset and empty variables both read as absent
const char* env_value(const char* name) {
  const char* value = std::getenv(name);
  return (value && value[0] != '\0') ? value : nullptr;
}

void override_level(const char* name, severity_level& target) {
  if (const char* value = env_value(name)) {
    if (auto level = parse_severity_level(value)) {
      target = *level;
    }
  }
}

void override_flag(const char* name, bool& target) {
  const char* value = env_value(name);
  if (!value) {
    return;
  }
  const std::string flag = lowercase(value);
  if (flag == "true" || flag == "1" || flag == "yes" || flag == "on") {
    target = true;
  } else if (flag == "false" || flag == "0" || flag == "no" || flag == "off") {
    target = false;
  }
}

template <typename Sink>
void drain(boost::shared_ptr<Sink>& sink) {
  if (!sink) {
    return;
  }
  boost::log::core::get()->remove_sink(sink);
  sink->stop();
  sink->flush();
  sink.reset();
}

}  // namespace

logger_type& get_logger() {
  static logger_type instance;
  return instance;
}

std::optional<severity_level> parse_severity_level(const std::string& level_str) {
  const std::string lower = lowercase(level_str);
  for (const auto& entry : kLevelNames) {
    if (lower == entry.name) {
      return entry.level;
    }
  }
  return std::nullopt;
}

void apply_env_overrides(LoggingConfig& config) {
  // Global level first so the per-sink variables override it
  if (const char* value = env_value("REEL_LOG_LEVEL")) {
    if (auto level = parse_severity_level(value)) {
      config.console_level = *level;
      config.file_level = *level;
    }
  }
  override_level("REEL_LOG_CONSOLE_LEVEL", config.console_level);
  override_level("REEL_LOG_FILE_LEVEL", config.file_level);

  override_flag("REEL_LOG_CONSOLE_ENABLED", config.console_enabled);
  override_flag("REEL_LOG_FILE_ENABLED", config.file_enabled);

  if (const char* dir = env_value("REEL_LOG_FILE_DIR")) {
    config.file_config.directory = dir;
  }
  if (const char* format = env_value("REEL_LOG_FORMAT")) {
    config.file_config.format_json = lowercase(format) == "json";
  }
}

void init_logging(const LoggingConfig& config) {
  auto& s = state();
  std::lock_guard<std::mutex> lock(s.mutex);
  if (s.initialized) {
    return;
  }

  auto core = boost::log::core::get();
  boost::log::add_common_attributes();

  // Session scopes override this with thread attributes
  auto added = core->add_global_attribute(
    "Mode", boost::log::attributes::constant<std::string>(kIdleMode)
  );
  s.mode_default = added.first;
  s.owns_mode_default = added.second;

  if (config.console_enabled) {
    s.console = create_console_sink(config.console_level, config.console_colors);
    core->add_sink(s.console);
  }
  if (config.file_enabled) {
    s.file = create_file_sink(config.file_config, config.file_level);
    core->add_sink(s.file);
  }

  s.initialized = true;
}

void shutdown_logging() {
  auto& s = state();
  std::lock_guard<std::mutex> lock(s.mutex);
  if (!s.initialized) {
    return;
  }

  drain(s.console);
  drain(s.file);
  if (s.owns_mode_default) {
    boost::log::core::get()->remove_global_attribute(s.mode_default);
    s.owns_mode_default = false;
  }

  s.initialized = false;
}

bool is_logging_initialized() {
  auto& s = state();
  std::lock_guard<std::mutex> lock(s.mutex);
  return s.initialized;
}

}  // namespace logging
}  // namespace reel
