// SPDX-FileCopyrightText: 2026 ArcheBase
//
// SPDX-License-Identifier: MulanPSL-2.0

#ifndef REEL_CASSETTE_STORE_HPP
#define REEL_CASSETTE_STORE_HPP

#include <cstddef>
#include <memory>
#include <string>
#include <vector>

#include "cassette.hpp"

namespace reel {
namespace cassette {

/**
 * CassetteStore maps cassette names to files under one directory
 * (<dir>/<name><extension>) and moves cassettes between disk and memory.
 *
 * File format:
 *   {
 *     "version": 2,
 *     "recorded_at": "2026-10-17T09:30:00Z",
 *     "reqs": [[{"method": ..., "args": {...}}, {"type": ..., "result": ...}], ...]
 *   }
 *
 * load() is all-or-nothing: entries are parsed into a local list and a
 * Cassette is only constructed once every entry parsed.
 * save() always rewrites the whole file, through a temporary file renamed
 * over the target.
 */
class CassetteStore {
public:
  explicit CassetteStore(std::string directory, std::string extension = ".json");

  const std::string& directory() const {
    return directory_;
  }

  const std::string& extension() const {
    return extension_;
  }

  std::string path_for(const std::string& name) const;

  /**
   * Whether a cassette file exists. No side effects.
   */
  bool exists(const std::string& name) const;

  /**
   * New empty cassette bound to this store's path for `name`.
   */
  std::shared_ptr<Cassette> create(const std::string& name) const;

  /**
   * @throws CassetteNotFoundError if the file does not exist
   * @throws CorruptCassetteError if the file is not a valid cassette document
   * @throws VersionMismatchError if "version" differs from kCassetteVersion
   * @throws StorageError if the file cannot be read
   */
  std::shared_ptr<Cassette> load(const std::string& name) const;

  /**
   * Write the cassette with a fresh recorded_at timestamp.
   * @throws StorageError on any I/O failure
   */
  void save(Cassette& cassette) const;

  /**
   * Names of all cassettes in the directory, sorted.
   */
  std::vector<std::string> list() const;

  /**
   * @return true if a file was removed
   */
  bool remove(const std::string& name) const;

  /**
   * Remove every cassette file in the directory.
   *
   * @return Number of files removed
   */
  size_t delete_all() const;

private:
  std::string directory_;
  std::string extension_;
};

/**
 * Current time as ISO 8601 UTC, e.g. "2026-10-17T09:30:00Z".
 */
std::string current_timestamp();

}  // namespace cassette
}  // namespace reel

#endif  // REEL_CASSETTE_STORE_HPP
