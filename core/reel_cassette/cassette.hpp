// SPDX-FileCopyrightText: 2026 ArcheBase
//
// SPDX-License-Identifier: MulanPSL-2.0

#ifndef REEL_CASSETTE_CASSETTE_HPP
#define REEL_CASSETTE_CASSETTE_HPP

#include <nlohmann/json.hpp>

#include <cstddef>
#include <optional>
#include <shared_mutex>
#include <string>
#include <vector>

#include "request.hpp"
#include "response.hpp"

namespace reel {
namespace cassette {

/**
 * Schema version written to and required from cassette files.
 */
constexpr int kCassetteVersion = 2;

/**
 * One recorded (request, response) pair.
 */
struct Entry {
  Request request;
  Response response;
};

/**
 * Cassette is the in-memory form of one named recording.
 *
 * Entries keep insertion order. Matching is first-match-wins: lookup()
 * returns the earliest entry whose request is equal under the union of the
 * caller's global ignore set and this cassette's session ignore list.
 *
 * Thread Safety:
 * - lookup()/contains()/entries() take a shared lock and may run concurrently
 * - append()/append_if_absent() take an exclusive lock; append_if_absent()
 *   performs the duplicate check and the append under the same lock
 */
class Cassette {
public:
  Cassette(std::string name, std::string path);

  /**
   * Construct a cassette from already-parsed entries (used by the store).
   */
  Cassette(std::string name, std::string path, std::vector<Entry> entries, std::string recorded_at);

  // Non-copyable, non-movable
  Cassette(const Cassette&) = delete;
  Cassette& operator=(const Cassette&) = delete;
  Cassette(Cassette&&) = delete;
  Cassette& operator=(Cassette&&) = delete;

  const std::string& name() const {
    return name_;
  }

  const std::string& path() const {
    return path_;
  }

  int version() const {
    return kCassetteVersion;
  }

  /**
   * Timestamp of the last save (ISO 8601 UTC), empty if never saved.
   */
  std::string recorded_at() const;

  void set_recorded_at(std::string recorded_at);

  /**
   * First entry equal to `request`, or std::nullopt.
   */
  std::optional<Entry> lookup(const Request& request, const IgnoreSet& global_ignored = {}) const;

  bool contains(const Request& request, const IgnoreSet& global_ignored = {}) const;

  /**
   * Append unconditionally. Duplicates are stored but unreachable by lookup().
   */
  void append(Request request, Response response);

  /**
   * Append only if no equal request is recorded yet.
   *
   * @return true if the entry was appended
   */
  bool append_if_absent(Request request, Response response, const IgnoreSet& global_ignored = {});

  /**
   * Snapshot of all entries in stored order.
   */
  std::vector<Entry> entries() const;

  size_t size() const;

  bool empty() const;

  /**
   * Add field names to this session's ignore list.
   */
  void ignore(const std::vector<std::string>& fields);

  IgnoreSet session_ignored() const;

  /**
   * Serialized document: {"version", "recorded_at", "reqs": [[req, resp], ...]}.
   */
  nlohmann::json to_document(const std::string& recorded_at) const;

private:
  // Caller holds at least a shared lock
  std::vector<Entry>::const_iterator find_locked(
    const Request& request, const IgnoreSet& global_ignored
  ) const;

  std::string name_;
  std::string path_;
  mutable std::shared_mutex mutex_;
  std::vector<Entry> entries_;
  IgnoreSet session_ignored_;
  std::string recorded_at_;
};

}  // namespace cassette
}  // namespace reel

#endif  // REEL_CASSETTE_CASSETTE_HPP
