// SPDX-FileCopyrightText: 2026 ArcheBase
//
// SPDX-License-Identifier: MulanPSL-2.0

#ifndef REEL_CASSETTE_REQUEST_HPP
#define REEL_CASSETTE_REQUEST_HPP

#include <nlohmann/json.hpp>

#include <set>
#include <string>

#include "message.hpp"

namespace reel {
namespace cassette {

/**
 * Field names skipped when comparing requests.
 */
using IgnoreSet = std::set<std::string>;

/**
 * Copy of `value` with every object key in `ignored` removed, at any depth
 * (including objects nested in arrays).
 */
nlohmann::json strip_ignored(const nlohmann::json& value, const IgnoreSet& ignored);

/**
 * Request is the normalized, immutable identity of one intercepted call:
 * the method route plus the request message fields.
 *
 * Call options (deadline, metadata, return_op) are not part of the identity,
 * so the same logical call normalizes to the same Request on every run.
 *
 * Serialized form: {"method": "<route>", "args": <body>}, where the body is
 * usually an object.
 */
class Request {
public:
  Request(std::string method, nlohmann::json args);

  /**
   * Normalize an intercepted call. The message body is kept as is, so a
   * scalar body never collides with an object that happens to hold it.
   */
  static Request from_call(
    const std::string& method, const transport::Message& request,
    const transport::CallOptions& options
  );

  /**
   * Parse the serialized form.
   * @throws CorruptCassetteError on missing or mistyped fields
   */
  static Request from_json(const nlohmann::json& j);

  nlohmann::json to_json() const;

  /**
   * Same method and equal args once `ignored` keys are removed.
   * Key order never matters.
   */
  static bool equals(const Request& a, const Request& b, const IgnoreSet& ignored);

  bool operator==(const Request& other) const;
  bool operator!=(const Request& other) const {
    return !(*this == other);
  }

  /**
   * "<method> <compact args>", used in diagnostics.
   */
  std::string describe() const;

  const std::string& method() const {
    return method_;
  }

  const nlohmann::json& args() const {
    return args_;
  }

private:
  std::string method_;
  nlohmann::json args_;
};

}  // namespace cassette
}  // namespace reel

#endif  // REEL_CASSETTE_REQUEST_HPP
