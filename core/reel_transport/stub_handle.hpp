// SPDX-FileCopyrightText: 2026 ArcheBase
//
// SPDX-License-Identifier: MulanPSL-2.0

#ifndef REEL_TRANSPORT_STUB_HANDLE_HPP
#define REEL_TRANSPORT_STUB_HANDLE_HPP

#include <functional>
#include <memory>
#include <mutex>
#include <string>

#include "client_stub.hpp"

namespace reel {
namespace transport {

/**
 * StubHandle is the call-dispatch point that client code calls through.
 *
 * It keeps the original stub and the stub currently in the call path. An
 * interceptor is installed by wrapping the original; uninstalling puts the
 * original back exactly.
 *
 * - install() on an intercepted handle is a no-op (no double wrapping)
 * - uninstall() on a plain handle is a no-op
 *
 * Thread Safety:
 * - All methods are thread-safe. request_response() dispatches on a copy of
 *   the current stub, so a call in flight finishes on the path it started on.
 */
class StubHandle : public IClientStub {
public:
  /**
   * Builds the wrapper from the original stub.
   */
  using WrapFactory =
    std::function<std::shared_ptr<IClientStub>(std::shared_ptr<IClientStub> original)>;

  StubHandle(std::string name, std::shared_ptr<IClientStub> stub);

  // Non-copyable
  StubHandle(const StubHandle&) = delete;
  StubHandle& operator=(const StubHandle&) = delete;

  CallResult request_response(
    const std::string& method, const Message& request, const CallOptions& options
  ) override;

  /**
   * Wrap the original call path.
   *
   * @param factory Builds the wrapper; not invoked when already intercepted
   * @return true if a wrapper was installed, false if already intercepted
   */
  bool install(const WrapFactory& factory);

  /**
   * Restore the original call path.
   *
   * @return true if a wrapper was removed, false if the handle was plain
   */
  bool uninstall();

  bool is_intercepted() const;

  std::shared_ptr<IClientStub> original() const;

  std::shared_ptr<IClientStub> current() const;

  const std::string& name() const {
    return name_;
  }

private:
  std::string name_;
  mutable std::mutex mutex_;
  std::shared_ptr<IClientStub> original_;
  std::shared_ptr<IClientStub> current_;
};

}  // namespace transport
}  // namespace reel

#endif  // REEL_TRANSPORT_STUB_HANDLE_HPP
