// SPDX-FileCopyrightText: 2026 ArcheBase
//
// SPDX-License-Identifier: MulanPSL-2.0

#include "commands.hpp"

#include <unistd.h>

#include <cstdlib>
#include <vector>

#include <cassette_engine.hpp>
#include <cassette_errors.hpp>
#include <cassette_store.hpp>
#include <config_parser.hpp>
#include <engine_config.hpp>

#define REEL_LOG_COMPONENT "reel_cassette"
#include <reel_log_init.hpp>
#include <reel_log_macros.hpp>

namespace reel {
namespace cli {

using logging::kv;

Commands::Commands(std::ostream& out, std::ostream& err)
    : out_(out)
    , err_(err)
    , verbose_(false)
    , extension_(".json") {}

int Commands::list() {
  cassette::CassetteStore store(cassette_dir_, extension_);
  auto names = store.list();

  if (names.empty()) {
    out_ << "No cassettes in " << cassette_dir_ << std::endl;
    return 0;
  }

  for (const auto& name : names) {
    try {
      auto loaded = store.load(name);
      out_ << name << "  " << loaded->size() << " entries  "
           << (loaded->recorded_at().empty() ? "-" : loaded->recorded_at()) << std::endl;
    } catch (const cassette::Error& e) {
      out_ << name << "  (unreadable: " << e.what() << ")" << std::endl;
    }
  }

  if (verbose_) {
    out_ << names.size() << " cassettes in " << cassette_dir_ << std::endl;
  }
  return 0;
}

int Commands::show(const std::string& name) {
  if (name.empty()) {
    err_ << "Error: show requires a cassette name" << std::endl;
    return 1;
  }

  cassette::CassetteStore store(cassette_dir_, extension_);
  std::shared_ptr<cassette::Cassette> loaded;
  try {
    loaded = store.load(name);
  } catch (const cassette::Error& e) {
    err_ << "Error: " << e.what() << std::endl;
    return 1;
  }

  out_ << "Cassette: " << loaded->name() << std::endl;
  out_ << "Path: " << loaded->path() << std::endl;
  out_ << "Version: " << loaded->version() << std::endl;
  out_ << "Recorded At: " << (loaded->recorded_at().empty() ? "-" : loaded->recorded_at())
       << std::endl;
  out_ << "Entries: " << loaded->size() << std::endl;

  size_t index = 0;
  for (const auto& entry : loaded->entries()) {
    out_ << "  [" << index++ << "] " << entry.request.describe() << std::endl;
    if (verbose_) {
      out_ << "      -> " << entry.response.type() << " " << entry.response.result().dump()
           << std::endl;
    }
  }
  return 0;
}

int Commands::verify() {
  cassette::CassetteStore store(cassette_dir_, extension_);
  auto names = store.list();

  size_t failures = 0;
  for (const auto& name : names) {
    try {
      auto loaded = store.load(name);
      out_ << "OK    " << name << " (" << loaded->size() << " entries)" << std::endl;
    } catch (const cassette::Error& e) {
      ++failures;
      out_ << "FAIL  " << name << ": " << e.what() << std::endl;
    }
  }

  out_ << names.size() - failures << " of " << names.size() << " cassettes valid" << std::endl;
  REEL_LOG_DEBUG("verify finished" << kv("dir", cassette_dir_) << kv("failures", failures));
  return failures == 0 ? 0 : 1;
}

int Commands::delete_all(bool force) {
  cassette::CassetteStore store(cassette_dir_, extension_);
  auto names = store.list();

  if (names.empty()) {
    out_ << "No cassettes in " << cassette_dir_ << std::endl;
    return 0;
  }

  out_ << "This will DELETE all cassettes:" << std::endl;
  out_ << "  Directory: " << cassette_dir_ << std::endl;
  out_ << "  Cassettes: " << names.size() << std::endl;
  out_ << std::endl;

  if (!confirm("Are you sure?", force)) {
    out_ << "Operation cancelled. No changes made." << std::endl;
    return 0;
  }

  replay::EngineConfig config;
  config.set_cassette_dir(cassette_dir_);
  config.set_extension(extension_);
  replay::CassetteEngine engine(config);

  size_t removed = engine.delete_all_cassettes();
  out_ << "Deleted " << removed << " cassettes from " << cassette_dir_ << std::endl;
  return 0;
}

int Commands::execute(int argc, char* argv[]) {
  std::vector<std::string> positional;
  std::string config_path;
  bool force = false;

  for (int i = 1; i < argc; ++i) {
    std::string arg = argv[i];
    if (arg == "--dir" || arg == "-d") {
      if (i + 1 >= argc) {
        err_ << "Error: " << arg << " requires a value" << std::endl;
        return 1;
      }
      cassette_dir_ = argv[++i];
    } else if (arg == "--config" || arg == "-c") {
      if (i + 1 >= argc) {
        err_ << "Error: " << arg << " requires a value" << std::endl;
        return 1;
      }
      config_path = argv[++i];
    } else if (arg == "--force" || arg == "-f") {
      force = true;
    } else if (arg == "--verbose" || arg == "-v") {
      verbose_ = true;
    } else if (arg == "--help" || arg == "-h") {
      positional.insert(positional.begin(), "help");
    } else if (!arg.empty() && arg[0] == '-') {
      err_ << "Error: Unknown option '" << arg << "'" << std::endl;
      print_usage();
      return 1;
    } else {
      positional.push_back(arg);
    }
  }

  std::string command = positional.empty() ? "" : positional[0];
  if (command.empty() || command == "help") {
    print_usage();
    return 0;
  }

  setup_logging(config_path);
  if (!resolve_settings(config_path)) {
    return 1;
  }

  if (command == "list") {
    return list();
  } else if (command == "show") {
    return show(positional.size() > 1 ? positional[1] : "");
  } else if (command == "verify") {
    return verify();
  } else if (command == "delete-all") {
    return delete_all(force);
  } else {
    err_ << "Error: Unknown command '" << command << "'" << std::endl;
    print_usage();
    return 1;
  }
}

bool Commands::resolve_settings(const std::string& config_path) {
  replay::EngineConfig config;

  if (!config_path.empty()) {
    replay::ConfigParser parser;
    replay::ReelConfig file_config;
    if (!parser.load_from_file(config_path, file_config)) {
      err_ << "Error: " << parser.get_last_error() << std::endl;
      return false;
    }
    std::string error;
    if (!replay::ConfigParser::validate(file_config, error)) {
      err_ << "Error: " << error << std::endl;
      return false;
    }
    replay::apply_cassette_settings(file_config.cassettes, config);
  }

  // --dir wins over everything; the environment only fills a gap
  if (!cassette_dir_.empty()) {
    config.set_cassette_dir(cassette_dir_);
  } else if (!config.has_cassette_dir()) {
    replay::apply_env_overrides(config);
  }

  try {
    cassette_dir_ = config.cassette_dir();
  } catch (const cassette::ConfigError& e) {
    err_ << "Error: " << e.what() << " (use --dir, --config or REEL_CASSETTE_DIR)" << std::endl;
    return false;
  }
  extension_ = config.extension();

  if (verbose_) {
    out_ << "Cassette directory: " << cassette_dir_ << " (*" << extension_ << ")" << std::endl;
  }
  return true;
}

void Commands::setup_logging(const std::string& config_path) {
  logging::LoggingConfig log_config;
  log_config.console_level = verbose_ ? logging::severity_level::debug : logging::severity_level::warn;

  if (!config_path.empty()) {
    replay::ConfigParser parser;
    replay::ReelConfig file_config;
    if (parser.load_from_file(config_path, file_config)) {
      replay::convert_logging_config(file_config.logging, log_config);
    }
  }

  logging::apply_env_overrides(log_config);
  logging::init_logging(log_config);
}

bool Commands::confirm(const std::string& prompt, bool force) {
  if (force) {
    return true;
  }

  // Check if stdin is a terminal (interactive)
  if (!isatty(STDIN_FILENO)) {
    return false;
  }

  out_ << prompt << std::endl << "Type 'yes' to confirm: ";
  out_.flush();

  std::string input;
  if (!std::getline(std::cin, input)) {
    return false;
  }

  const char* whitespace = " \t\n\r";
  size_t start = input.find_first_not_of(whitespace);
  if (start == std::string::npos) {
    return false;
  }
  size_t end = input.find_last_not_of(whitespace);
  return input.substr(start, end - start + 1) == "yes";
}

void Commands::print_usage() {
  out_ << "Usage: reel_cassette [options] <command> [args]" << std::endl;
  out_ << std::endl;
  out_ << "Commands:" << std::endl;
  out_ << "  list            List cassettes with entry count and record time" << std::endl;
  out_ << "  show <name>     Print the requests recorded in a cassette" << std::endl;
  out_ << "  verify          Load every cassette and report failures" << std::endl;
  out_ << "  delete-all      Delete every cassette in the directory" << std::endl;
  out_ << "  help            Show this help message" << std::endl;
  out_ << std::endl;
  out_ << "Options:" << std::endl;
  out_ << "  --dir, -d DIR        Cassette directory" << std::endl;
  out_ << "  --config, -c FILE    YAML config file (cassettes, logging)" << std::endl;
  out_ << "  --force, -f          Skip confirmation prompt (for scripts)" << std::endl;
  out_ << "  --verbose, -v        Verbose output" << std::endl;
  out_ << std::endl;
  out_ << "Environment:" << std::endl;
  out_ << "  REEL_CASSETTE_DIR    Cassette directory when neither --dir nor --config sets one"
       << std::endl;
}

}  // namespace cli
}  // namespace reel
