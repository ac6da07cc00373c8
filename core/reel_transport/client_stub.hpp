// SPDX-FileCopyrightText: 2026 ArcheBase
//
// SPDX-License-Identifier: MulanPSL-2.0

#ifndef REEL_TRANSPORT_CLIENT_STUB_HPP
#define REEL_TRANSPORT_CLIENT_STUB_HPP

#include <memory>
#include <string>
#include <variant>

#include "message.hpp"
#include "operation.hpp"

namespace reel {
namespace transport {

/**
 * Result of a unary call: the response message, or a deferred operation
 * handle when the caller set CallOptions::return_op.
 */
using CallResult = std::variant<Message, std::shared_ptr<Operation>>;

/**
 * Interface for the outbound-call path of an RPC client stub.
 * Concrete transports implement it; the cassette engine decorates it.
 */
class IClientStub {
public:
  virtual ~IClientStub() = default;

  /**
   * Issue a unary call.
   *
   * @param method Full method route, e.g. "/acme.v1.Library/GetBook"
   * @param request Request message
   * @param options Per-call options
   * @return Response message or deferred operation handle
   */
  virtual CallResult request_response(
    const std::string& method, const Message& request, const CallOptions& options
  ) = 0;
};

}  // namespace transport
}  // namespace reel

#endif  // REEL_TRANSPORT_CLIENT_STUB_HPP
