// SPDX-FileCopyrightText: 2026 ArcheBase
//
// SPDX-License-Identifier: MulanPSL-2.0

#ifndef REEL_CASSETTE_ERRORS_HPP
#define REEL_CASSETTE_ERRORS_HPP

#include <cstdint>
#include <stdexcept>
#include <string>

namespace reel {
namespace cassette {

/**
 * Base class for every error raised by the cassette engine.
 */
class Error : public std::runtime_error {
public:
  explicit Error(const std::string& what)
      : std::runtime_error(what) {}
};

/**
 * Required configuration is missing (cassette directory, stubs).
 */
class ConfigError : public Error {
public:
  using Error::Error;
};

/**
 * Configuration or session change attempted while a session is active.
 */
class RunningError : public Error {
public:
  using Error::Error;
};

/**
 * Cassette file does not exist.
 */
class CassetteNotFoundError : public Error {
public:
  using Error::Error;
};

/**
 * Cassette file exists but cannot be interpreted.
 */
class CorruptCassetteError : public Error {
public:
  using Error::Error;
};

/**
 * Cassette schema version differs from the engine's.
 */
class VersionMismatchError : public Error {
public:
  VersionMismatchError(const std::string& path, std::int64_t found, int expected)
      : Error(
          "cassette version " + std::to_string(found) + " not supported (expected " +
          std::to_string(expected) + "): " + path
        )
      , found_(found)
      , expected_(expected) {}

  std::int64_t found() const {
    return found_;
  }
  int expected() const {
    return expected_;
  }

private:
  std::int64_t found_;
  int expected_;
};

/**
 * Reading or writing cassette storage failed.
 */
class StorageError : public Error {
public:
  using Error::Error;
};

/**
 * A call was intercepted for recording but no cassette is bound.
 */
class NoActiveCassetteError : public Error {
public:
  using Error::Error;
};

/**
 * Replay found no recorded entry equal to the incoming request.
 */
class NoRecordingFoundError : public Error {
public:
  NoRecordingFoundError(const std::string& method, const std::string& request_description)
      : Error("No recording found for " + request_description)
      , method_(method) {}

  const std::string& method() const {
    return method_;
  }

private:
  std::string method_;
};

}  // namespace cassette
}  // namespace reel

#endif  // REEL_CASSETTE_ERRORS_HPP
