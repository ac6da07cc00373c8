// SPDX-FileCopyrightText: 2026 ArcheBase
//
// SPDX-License-Identifier: MulanPSL-2.0

// reel_cassette - inspect and maintain recorded cassettes

#include <exception>
#include <iostream>

#include <reel_log_init.hpp>

#include "commands.hpp"

/**
 * Main entry point for reel_cassette
 */
int main(int argc, char* argv[]) {
  reel::cli::Commands commands;

  int rc = 1;
  try {
    rc = commands.execute(argc, argv);
  } catch (const std::exception& e) {
    std::cerr << "Error: " << e.what() << std::endl;
    rc = 1;
  }

  reel::logging::shutdown_logging();
  return rc;
}
