// SPDX-FileCopyrightText: 2026 ArcheBase
//
// SPDX-License-Identifier: MulanPSL-2.0

#ifndef REEL_TRANSPORT_OPERATION_HPP
#define REEL_TRANSPORT_OPERATION_HPP

#include <functional>
#include <memory>
#include <mutex>
#include <string>
#include <variant>

#include "message.hpp"

namespace reel {
namespace transport {

/**
 * Operation is the handle returned by a deferred (long-running) call.
 *
 * A handle is either pending, holding the completion step that contacts the
 * service, or resolved, holding a precomputed result. execute() branches on
 * that state:
 * - pending:  runs the completion step and returns its result (every call)
 * - resolved: returns the stored result, nothing is contacted
 *
 * resolve() switches a handle to the resolved state. Recording uses it to pin
 * the value it captured; replay hands out handles that start resolved.
 *
 * Thread Safety:
 * - All methods are thread-safe. The completion step runs outside the lock.
 */
class Operation {
public:
  using Executor = std::function<Message()>;

  Operation(std::string method, Executor executor);

  /**
   * Create a handle that is already resolved to `result`.
   */
  static std::shared_ptr<Operation> completed(std::string method, Message result);

  // Non-copyable
  Operation(const Operation&) = delete;
  Operation& operator=(const Operation&) = delete;

  /**
   * Run the completion step, or return the stored result if resolved.
   * Exceptions thrown by the completion step propagate unchanged.
   */
  Message execute();

  /**
   * Pin this handle to `result`. Later execute() calls return it.
   */
  void resolve(Message result);

  bool is_resolved() const;

  const std::string& method() const {
    return method_;
  }

private:
  struct Pending {
    Executor executor;
  };
  struct Resolved {
    Message result;
  };

  Operation(std::string method, Resolved resolved);

  std::string method_;
  mutable std::mutex mutex_;
  std::variant<Pending, Resolved> state_;
};

}  // namespace transport
}  // namespace reel

#endif  // REEL_TRANSPORT_OPERATION_HPP
