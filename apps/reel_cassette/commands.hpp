// SPDX-FileCopyrightText: 2026 ArcheBase
//
// SPDX-License-Identifier: MulanPSL-2.0

#ifndef REEL_CLI_COMMANDS_HPP
#define REEL_CLI_COMMANDS_HPP

#include <iostream>
#include <string>

namespace reel {
namespace cli {

/**
 * Command handler for the reel_cassette CLI
 *
 *   reel_cassette [--dir DIR] [--config FILE] [-v] <command> [args]
 *
 * The cassette directory comes from --dir, else the config file's
 * cassettes.dir, else REEL_CASSETTE_DIR.
 */
class Commands {
public:
  explicit Commands(std::ostream& out = std::cout, std::ostream& err = std::cerr);
  ~Commands() = default;

  // Non-copyable
  Commands(const Commands&) = delete;
  Commands& operator=(const Commands&) = delete;

  void set_verbose(bool verbose) {
    verbose_ = verbose;
  }

  void set_cassette_dir(const std::string& dir) {
    cassette_dir_ = dir;
  }

  /**
   * Execute list command: name, entry count and recorded_at per cassette
   */
  int list();

  /**
   * Execute show command: every recorded request of one cassette
   */
  int show(const std::string& name);

  /**
   * Execute verify command: load every cassette, non-zero if any fails
   */
  int verify();

  /**
   * Execute delete-all command
   */
  int delete_all(bool force);

  /**
   * Parse and execute command line
   */
  int execute(int argc, char* argv[]);

private:
  /**
   * Apply --config and the environment. Reports its own errors.
   */
  bool resolve_settings(const std::string& config_path);

  void setup_logging(const std::string& config_path);

  void print_usage();

  /**
   * Ask for confirmation on an interactive terminal.
   * Always true with force, always false without a terminal.
   */
  bool confirm(const std::string& prompt, bool force);

  std::ostream& out_;
  std::ostream& err_;
  bool verbose_;
  std::string cassette_dir_;
  std::string extension_;
};

}  // namespace cli
}  // namespace reel

#endif  // REEL_CLI_COMMANDS_HPP
