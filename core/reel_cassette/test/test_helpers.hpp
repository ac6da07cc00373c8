// SPDX-FileCopyrightText: 2026 ArcheBase
//
// SPDX-License-Identifier: MulanPSL-2.0

/**
 * @file test_helpers.hpp
 * @brief Common test utilities for cassette tests
 */

#ifndef REEL_CASSETTE_TEST_HELPERS_HPP
#define REEL_CASSETTE_TEST_HELPERS_HPP

#include <nlohmann/json.hpp>

#include <atomic>
#include <chrono>
#include <filesystem>
#include <fstream>
#include <string>

namespace reel {
namespace cassette {
namespace test {

/**
 * RAII wrapper for temporary test directories.
 * Creates a unique directory on construction and removes it (with all
 * contents) on destruction.
 */
class TempDirectory {
public:
  TempDirectory() {
    static std::atomic<int> counter{0};
    auto base = std::filesystem::temp_directory_path();
    auto timestamp = std::chrono::steady_clock::now().time_since_epoch().count();
    path_ = base / ("reel_test_" + std::to_string(timestamp) + "_" + std::to_string(counter++));
    std::filesystem::create_directories(path_);
  }

  ~TempDirectory() {
    std::error_code ec;
    if (!path_.empty()) {
      std::filesystem::remove_all(path_, ec);
    }
  }

  // Non-copyable
  TempDirectory(const TempDirectory&) = delete;
  TempDirectory& operator=(const TempDirectory&) = delete;

  std::filesystem::path path() const {
    return path_;
  }
  std::string string() const {
    return path_.string();
  }

  /**
   * Get path to a file within the temp directory.
   */
  std::filesystem::path file(const std::string& name) const {
    return path_ / name;
  }

  /**
   * Write raw text to a file within the temp directory.
   */
  void write_file(const std::string& name, const std::string& content) const {
    std::ofstream out(file(name));
    out << content;
  }

  nlohmann::json read_json(const std::string& name) const {
    std::ifstream in(file(name));
    nlohmann::json doc;
    in >> doc;
    return doc;
  }

private:
  std::filesystem::path path_;
};

}  // namespace test
}  // namespace cassette
}  // namespace reel

#endif  // REEL_CASSETTE_TEST_HELPERS_HPP
