// SPDX-FileCopyrightText: 2026 ArcheBase
//
// SPDX-License-Identifier: MulanPSL-2.0

#ifndef REEL_REPLAY_CALL_INTERCEPTOR_HPP
#define REEL_REPLAY_CALL_INTERCEPTOR_HPP

#include <functional>
#include <memory>
#include <string>

#include <cassette.hpp>
#include <client_stub.hpp>

namespace reel {
namespace replay {

/**
 * Returns the cassette bound to the current session, or nullptr when idle.
 */
using CassetteSource = std::function<std::shared_ptr<cassette::Cassette>()>;

/**
 * Interface for what happens to a call made through an intercepted stub.
 * The original stub is passed in so an implementation can decide whether a
 * live call happens at all.
 */
class CallInterceptor {
public:
  virtual ~CallInterceptor() = default;

  virtual transport::CallResult intercept(
    transport::IClientStub& original, const std::string& method,
    const transport::Message& request, const transport::CallOptions& options
  ) = 0;

  virtual const char* name() const = 0;
};

/**
 * Forwards every call to the live stub and records the first result seen
 * for each distinct request.
 *
 * Per call:
 * - no bound cassette -> NoActiveCassetteError, nothing is forwarded
 * - forward unmodified; a thrown error propagates and nothing is recorded
 * - request already recorded -> live result returned untouched
 * - Operation result -> executed now, the caller's handle is resolved to the
 *   same value, and that value is recorded
 * - Message result -> recorded as is
 */
class RecordingInterceptor : public CallInterceptor {
public:
  RecordingInterceptor(CassetteSource source, cassette::IgnoreSet ignored);

  transport::CallResult intercept(
    transport::IClientStub& original, const std::string& method,
    const transport::Message& request, const transport::CallOptions& options
  ) override;

  const char* name() const override {
    return "recording";
  }

private:
  CassetteSource source_;
  cassette::IgnoreSet ignored_;
};

/**
 * Answers every call from the bound cassette; the live stub is never called.
 *
 * Per call:
 * - no matching entry -> NoRecordingFoundError naming the request
 * - options.return_op -> an Operation already resolved to the recorded result
 * - otherwise the recorded result message
 */
class PlayingInterceptor : public CallInterceptor {
public:
  PlayingInterceptor(CassetteSource source, cassette::IgnoreSet ignored);

  transport::CallResult intercept(
    transport::IClientStub& original, const std::string& method,
    const transport::Message& request, const transport::CallOptions& options
  ) override;

  const char* name() const override {
    return "playing";
  }

private:
  CassetteSource source_;
  cassette::IgnoreSet ignored_;
};

/**
 * Decorator that routes calls on the original stub through an interceptor.
 * This is what StubHandle::install() puts in the call path.
 */
class InterceptingStub : public transport::IClientStub {
public:
  InterceptingStub(
    std::shared_ptr<transport::IClientStub> original, std::shared_ptr<CallInterceptor> interceptor
  );

  transport::CallResult request_response(
    const std::string& method, const transport::Message& request,
    const transport::CallOptions& options
  ) override;

  const std::shared_ptr<transport::IClientStub>& original() const {
    return original_;
  }

  const std::shared_ptr<CallInterceptor>& interceptor() const {
    return interceptor_;
  }

private:
  std::shared_ptr<transport::IClientStub> original_;
  std::shared_ptr<CallInterceptor> interceptor_;
};

}  // namespace replay
}  // namespace reel

#endif  // REEL_REPLAY_CALL_INTERCEPTOR_HPP
