// SPDX-FileCopyrightText: 2026 ArcheBase
//
// SPDX-License-Identifier: MulanPSL-2.0

#include "config_parser.hpp"

#include <fstream>

#include "engine_config.hpp"

// Logging infrastructure
#define REEL_LOG_COMPONENT "config_parser"
#include <reel_log_init.hpp>
#include <reel_log_macros.hpp>

namespace reel {
namespace replay {

bool ConfigParser::load_from_file(const std::string& path, ReelConfig& config) {
  std::ifstream file(path);
  if (!file.good()) {
    last_error_ = "Config file not found or not readable: " + path;
    return false;
  }

  try {
    YAML::Node yaml = YAML::LoadFile(path);
    return load_from_string(YAML::Dump(yaml), config);
  } catch (const YAML::Exception& e) {
    last_error_ = "Failed to parse YAML file: " + std::string(e.what());
    return false;
  }
}

bool ConfigParser::load_from_string(const std::string& yaml_content, ReelConfig& config) {
  try {
    YAML::Node node = YAML::Load(yaml_content);

    if (node.IsNull()) {
      // Empty document, defaults apply
      return true;
    }
    if (!node.IsMap()) {
      last_error_ = "Config root must be a mapping";
      return false;
    }

    if (node["cassettes"]) {
      if (!parse_cassettes(node["cassettes"], config.cassettes)) {
        return false;
      }
    }

    if (node["logging"]) {
      if (!parse_logging(node["logging"], config.logging)) {
        return false;
      }
    }

    return true;
  } catch (const YAML::Exception& e) {
    last_error_ = "Failed to parse YAML content: " + std::string(e.what());
    return false;
  }
}

bool ConfigParser::parse_cassettes(const YAML::Node& node, CassetteSettings& cassettes) {
  if (!node.IsMap()) {
    last_error_ = "cassettes must be a mapping";
    return false;
  }

  if (node["dir"]) {
    cassettes.dir = node["dir"].as<std::string>();
  }
  if (node["extension"]) {
    cassettes.extension = node["extension"].as<std::string>();
  }
  if (node["ignore"]) {
    const auto& ignore = node["ignore"];
    if (ignore.IsScalar()) {
      cassettes.ignore.push_back(ignore.as<std::string>());
    } else if (ignore.IsSequence()) {
      for (const auto& field : ignore) {
        cassettes.ignore.push_back(field.as<std::string>());
      }
    } else {
      last_error_ = "cassettes.ignore must be a list of field names";
      return false;
    }
  }

  return true;
}

bool ConfigParser::parse_logging(const YAML::Node& node, LoggingSettings& logging) {
  // Parse console section
  if (node["console"]) {
    const auto& console = node["console"];
    if (console["enabled"]) {
      logging.console_enabled = console["enabled"].as<bool>();
    }
    if (console["colors"]) {
      logging.console_colors = console["colors"].as<bool>();
    }
    if (console["level"]) {
      logging.console_level = console["level"].as<std::string>();
    }
  }

  // Parse file section
  if (node["file"]) {
    const auto& file = node["file"];
    if (file["enabled"]) {
      logging.file_enabled = file["enabled"].as<bool>();
    }
    if (file["level"]) {
      logging.file_level = file["level"].as<std::string>();
    }
    if (file["directory"]) {
      logging.file_directory = file["directory"].as<std::string>();
    }
    if (file["pattern"]) {
      logging.file_pattern = file["pattern"].as<std::string>();
    }
    if (file["format"]) {
      logging.file_format = file["format"].as<std::string>();
    }
    if (file["rotation_size_mb"]) {
      logging.rotation_size_mb = file["rotation_size_mb"].as<size_t>();
    }
    if (file["max_files"]) {
      logging.max_files = file["max_files"].as<size_t>();
    }
  }

  return true;
}

bool ConfigParser::validate(const ReelConfig& config, std::string& error_msg) {
  if (config.cassettes.extension.empty()) {
    error_msg = "cassettes.extension is empty";
    return false;
  }

  for (const auto& field : config.cassettes.ignore) {
    if (field.empty()) {
      error_msg = "cassettes.ignore contains an empty field name";
      return false;
    }
  }

  if (!logging::parse_severity_level(config.logging.console_level)) {
    error_msg = "Invalid logging.console.level: " + config.logging.console_level;
    return false;
  }
  if (!logging::parse_severity_level(config.logging.file_level)) {
    error_msg = "Invalid logging.file.level: " + config.logging.file_level;
    return false;
  }

  if (config.logging.file_format != "json" && config.logging.file_format != "text") {
    error_msg = "logging.file.format must be 'json' or 'text'";
    return false;
  }

  return true;
}

void convert_logging_config(
  const LoggingSettings& settings, ::reel::logging::LoggingConfig& log_config
) {
  // Console settings
  log_config.console_enabled = settings.console_enabled;
  log_config.console_colors = settings.console_colors;

  if (auto level = ::reel::logging::parse_severity_level(settings.console_level)) {
    log_config.console_level = *level;
  }

  // File settings
  log_config.file_enabled = settings.file_enabled;

  if (auto level = ::reel::logging::parse_severity_level(settings.file_level)) {
    log_config.file_level = *level;
  }

  log_config.file_config.directory = settings.file_directory;
  log_config.file_config.file_pattern = settings.file_pattern;
  log_config.file_config.format_json = (settings.file_format == "json");
  log_config.file_config.rotation_size_mb = settings.rotation_size_mb;
  log_config.file_config.max_files = static_cast<int>(settings.max_files);
}

void apply_cassette_settings(const CassetteSettings& settings, EngineConfig& config) {
  if (!settings.dir.empty()) {
    config.set_cassette_dir(settings.dir);
  }
  config.set_extension(settings.extension);
  config.ignore(settings.ignore);
  REEL_LOG_DEBUG(
    "cassette settings applied" << ::reel::logging::kv("dir", settings.dir)
                                << ::reel::logging::kv("ignored", settings.ignore.size())
  );
}

}  // namespace replay
}  // namespace reel
