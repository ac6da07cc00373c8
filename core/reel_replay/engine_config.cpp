// SPDX-FileCopyrightText: 2026 ArcheBase
//
// SPDX-License-Identifier: MulanPSL-2.0

#include "engine_config.hpp"

#include <algorithm>
#include <cstdlib>
#include <stdexcept>

#include <cassette_errors.hpp>

namespace reel {
namespace replay {

void EngineConfig::set_cassette_dir(std::string dir) {
  cassette_dir_ = std::move(dir);
}

const std::string& EngineConfig::cassette_dir() const {
  if (cassette_dir_.empty()) {
    throw cassette::ConfigError("no cassette dir configured");
  }
  return cassette_dir_;
}

void EngineConfig::set_extension(std::string extension) {
  if (!extension.empty() && extension[0] != '.') {
    extension.insert(extension.begin(), '.');
  }
  extension_ = std::move(extension);
}

void EngineConfig::add_stub(std::shared_ptr<transport::StubHandle> stub) {
  if (!stub) {
    throw std::invalid_argument("cannot add a null stub");
  }
  if (std::find(stubs_.begin(), stubs_.end(), stub) == stubs_.end()) {
    stubs_.push_back(std::move(stub));
  }
}

std::vector<std::shared_ptr<transport::StubHandle>> EngineConfig::stubs() const {
  if (stubs_.empty()) {
    throw cassette::ConfigError("no stubs configured");
  }
  return stubs_;
}

void EngineConfig::reset_stubs() {
  stubs_.clear();
}

void EngineConfig::ignore(const std::vector<std::string>& fields) {
  for (const auto& field : fields) {
    if (std::find(ignored_fields_.begin(), ignored_fields_.end(), field) ==
        ignored_fields_.end()) {
      ignored_fields_.push_back(field);
    }
  }
}

bool apply_env_overrides(EngineConfig& config) {
  if (const char* dir = std::getenv("REEL_CASSETTE_DIR")) {
    if (dir[0] != '\0') {
      config.set_cassette_dir(dir);
      return true;
    }
  }
  return false;
}

}  // namespace replay
}  // namespace reel
