// SPDX-FileCopyrightText: 2026 ArcheBase
//
// SPDX-License-Identifier: MulanPSL-2.0

#ifndef REEL_CASSETTE_RESPONSE_HPP
#define REEL_CASSETTE_RESPONSE_HPP

#include <nlohmann/json.hpp>

#include <string>

#include "message.hpp"

namespace reel {
namespace cassette {

/**
 * Response is the serializable form of a successful call result.
 *
 * Serialized form: {"type": "<message type>", "result": {...}}
 */
class Response {
public:
  Response(std::string type, nlohmann::json result);

  static Response from_call_result(const transport::Message& result);

  /**
   * Rebuild the transport message; from_call_result(m).to_call_result() == m.
   */
  transport::Message to_call_result() const;

  /**
   * @throws CorruptCassetteError on missing or mistyped fields
   */
  static Response from_json(const nlohmann::json& j);

  nlohmann::json to_json() const;

  bool operator==(const Response& other) const {
    return type_ == other.type_ && result_ == other.result_;
  }
  bool operator!=(const Response& other) const {
    return !(*this == other);
  }

  const std::string& type() const {
    return type_;
  }

  const nlohmann::json& result() const {
    return result_;
  }

private:
  std::string type_;
  nlohmann::json result_;
};

}  // namespace cassette
}  // namespace reel

#endif  // REEL_CASSETTE_RESPONSE_HPP
