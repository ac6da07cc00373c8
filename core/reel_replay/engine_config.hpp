// SPDX-FileCopyrightText: 2026 ArcheBase
//
// SPDX-License-Identifier: MulanPSL-2.0

#ifndef REEL_REPLAY_ENGINE_CONFIG_HPP
#define REEL_REPLAY_ENGINE_CONFIG_HPP

#include <memory>
#include <string>
#include <vector>

#include <request.hpp>
#include <stub_handle.hpp>

namespace reel {
namespace replay {

/**
 * EngineConfig holds what a CassetteEngine needs to run a session: where
 * cassettes live, which stubs to intercept, and which request fields never
 * take part in matching.
 *
 * Accessors for required settings throw ConfigError when unset. The engine
 * guards mutation while a session is active; this class itself is a plain
 * value and not thread-safe.
 */
class EngineConfig {
public:
  EngineConfig() = default;

  void set_cassette_dir(std::string dir);

  /**
   * @throws ConfigError "no cassette dir configured" if unset
   */
  const std::string& cassette_dir() const;

  bool has_cassette_dir() const {
    return !cassette_dir_.empty();
  }

  /**
   * File extension for cassettes, ".json" by default. A missing leading dot
   * is added.
   */
  void set_extension(std::string extension);

  const std::string& extension() const {
    return extension_;
  }

  /**
   * Register a stub to intercept. Adding the same handle twice has no effect.
   */
  void add_stub(std::shared_ptr<transport::StubHandle> stub);

  /**
   * @throws ConfigError "no stubs configured" if none were added
   */
  std::vector<std::shared_ptr<transport::StubHandle>> stubs() const;

  bool has_stubs() const {
    return !stubs_.empty();
  }

  void reset_stubs();

  /**
   * Add field names to the global ignore list. Duplicates are dropped;
   * first-seen order is kept.
   */
  void ignore(const std::vector<std::string>& fields);

  const std::vector<std::string>& ignored_fields() const {
    return ignored_fields_;
  }

  cassette::IgnoreSet ignore_set() const {
    return cassette::IgnoreSet(ignored_fields_.begin(), ignored_fields_.end());
  }

private:
  std::string cassette_dir_;
  std::string extension_ = ".json";
  std::vector<std::shared_ptr<transport::StubHandle>> stubs_;
  std::vector<std::string> ignored_fields_;
};

/**
 * Apply environment variable overrides to an EngineConfig.
 *
 * Supported environment variables:
 *   REEL_CASSETTE_DIR - Cassette directory
 *
 * @return true if any setting was overridden
 */
bool apply_env_overrides(EngineConfig& config);

}  // namespace replay
}  // namespace reel

#endif  // REEL_REPLAY_ENGINE_CONFIG_HPP
