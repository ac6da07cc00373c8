// SPDX-FileCopyrightText: 2026 ArcheBase
//
// SPDX-License-Identifier: MulanPSL-2.0

#ifndef REEL_TRANSPORT_MESSAGE_HPP
#define REEL_TRANSPORT_MESSAGE_HPP

#include <nlohmann/json.hpp>

#include <chrono>
#include <map>
#include <optional>
#include <string>

namespace reel {
namespace transport {

/**
 * A typed RPC message as the transport sees it.
 *
 * `type` is the fully qualified message type name (e.g. "acme.v1.Book"),
 * `body` holds the message fields as a structured document.
 */
struct Message {
  std::string type;
  nlohmann::json body = nlohmann::json::object();

  Message() = default;
  Message(std::string type_name, nlohmann::json fields)
      : type(std::move(type_name))
      , body(std::move(fields)) {}

  bool operator==(const Message& other) const {
    return type == other.type && body == other.body;
  }
  bool operator!=(const Message& other) const {
    return !(*this == other);
  }
};

/**
 * Per-call options observed at the interception point.
 */
struct CallOptions {
  // Ask the stub for a deferred operation handle instead of the response
  bool return_op = false;

  std::map<std::string, std::string> metadata;

  std::optional<std::chrono::system_clock::time_point> deadline;
};

}  // namespace transport
}  // namespace reel

#endif  // REEL_TRANSPORT_MESSAGE_HPP
