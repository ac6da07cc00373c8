// SPDX-FileCopyrightText: 2026 ArcheBase
//
// SPDX-License-Identifier: MulanPSL-2.0

#include "stub_handle.hpp"

#include <stdexcept>

namespace reel {
namespace transport {

StubHandle::StubHandle(std::string name, std::shared_ptr<IClientStub> stub)
    : name_(std::move(name))
    , original_(std::move(stub)) {
  if (!original_) {
    throw std::invalid_argument("StubHandle: stub cannot be null");
  }
  current_ = original_;
}

CallResult StubHandle::request_response(
  const std::string& method, const Message& request, const CallOptions& options
) {
  std::shared_ptr<IClientStub> target;
  {
    std::lock_guard<std::mutex> lock(mutex_);
    target = current_;
  }
  return target->request_response(method, request, options);
}

bool StubHandle::install(const WrapFactory& factory) {
  std::lock_guard<std::mutex> lock(mutex_);
  if (current_ != original_) {
    return false;
  }

  auto wrapper = factory(original_);
  if (!wrapper) {
    throw std::invalid_argument("StubHandle: wrapper factory returned null for " + name_);
  }
  current_ = std::move(wrapper);
  return true;
}

bool StubHandle::uninstall() {
  std::lock_guard<std::mutex> lock(mutex_);
  if (current_ == original_) {
    return false;
  }
  current_ = original_;
  return true;
}

bool StubHandle::is_intercepted() const {
  std::lock_guard<std::mutex> lock(mutex_);
  return current_ != original_;
}

std::shared_ptr<IClientStub> StubHandle::original() const {
  std::lock_guard<std::mutex> lock(mutex_);
  return original_;
}

std::shared_ptr<IClientStub> StubHandle::current() const {
  std::lock_guard<std::mutex> lock(mutex_);
  return current_;
}

}  // namespace transport
}  // namespace reel
