// SPDX-FileCopyrightText: 2026 ArcheBase
//
// SPDX-License-Identifier: MulanPSL-2.0

#include "operation.hpp"

#include <stdexcept>

namespace reel {
namespace transport {

Operation::Operation(std::string method, Executor executor)
    : method_(std::move(method))
    , state_(Pending{std::move(executor)}) {
  if (!std::get<Pending>(state_).executor) {
    throw std::invalid_argument("Operation: executor cannot be empty for " + method_);
  }
}

Operation::Operation(std::string method, Resolved resolved)
    : method_(std::move(method))
    , state_(std::move(resolved)) {}

std::shared_ptr<Operation> Operation::completed(std::string method, Message result) {
  return std::shared_ptr<Operation>(new Operation(std::move(method), Resolved{std::move(result)}));
}

Message Operation::execute() {
  Executor executor;
  {
    std::lock_guard<std::mutex> lock(mutex_);
    if (auto* resolved = std::get_if<Resolved>(&state_)) {
      return resolved->result;
    }
    executor = std::get<Pending>(state_).executor;
  }
  return executor();
}

void Operation::resolve(Message result) {
  std::lock_guard<std::mutex> lock(mutex_);
  state_ = Resolved{std::move(result)};
}

bool Operation::is_resolved() const {
  std::lock_guard<std::mutex> lock(mutex_);
  return std::holds_alternative<Resolved>(state_);
}

}  // namespace transport
}  // namespace reel
