// SPDX-FileCopyrightText: 2026 ArcheBase
//
// SPDX-License-Identifier: MulanPSL-2.0

#include "call_interceptor.hpp"

#include <stdexcept>
#include <variant>

#include <cassette_errors.hpp>
#include <operation.hpp>

#define REEL_LOG_COMPONENT "interceptor"
#include <reel_log_macros.hpp>

namespace reel {
namespace replay {

using cassette::Request;
using cassette::Response;
using logging::kv;
using transport::CallResult;
using transport::Message;
using transport::Operation;

// ============================================================================
// RecordingInterceptor
// ============================================================================

RecordingInterceptor::RecordingInterceptor(CassetteSource source, cassette::IgnoreSet ignored)
    : source_(std::move(source))
    , ignored_(std::move(ignored)) {}

CallResult RecordingInterceptor::intercept(
  transport::IClientStub& original, const std::string& method, const Message& request,
  const transport::CallOptions& options
) {
  auto active = source_();
  if (!active) {
    throw cassette::NoActiveCassetteError("no active cassette while recording " + method);
  }

  CallResult result = original.request_response(method, request, options);

  Request normalized = Request::from_call(method, request, options);
  if (active->contains(normalized, ignored_)) {
    REEL_LOG_DEBUG_EVERY_N(100, "request already recorded" << kv("method", method));
    return result;
  }

  Message recorded;
  if (auto* operation = std::get_if<std::shared_ptr<Operation>>(&result)) {
    if (!*operation) {
      throw std::runtime_error("stub returned a null operation for " + method);
    }
    recorded = (*operation)->execute();
    (*operation)->resolve(recorded);
  } else {
    recorded = std::get<Message>(result);
  }

  if (active->append_if_absent(
        std::move(normalized), Response::from_call_result(recorded), ignored_
      )) {
    REEL_LOG_DEBUG(
      "recorded call" << kv("method", method) << kv("deferred", options.return_op)
                      << kv("entries", active->size())
    );
  }
  return result;
}

// ============================================================================
// PlayingInterceptor
// ============================================================================

PlayingInterceptor::PlayingInterceptor(CassetteSource source, cassette::IgnoreSet ignored)
    : source_(std::move(source))
    , ignored_(std::move(ignored)) {}

CallResult PlayingInterceptor::intercept(
  transport::IClientStub& /*original*/, const std::string& method, const Message& request,
  const transport::CallOptions& options
) {
  auto active = source_();
  if (!active) {
    throw cassette::NoActiveCassetteError("no active cassette while playing " + method);
  }

  Request normalized = Request::from_call(method, request, options);
  auto entry = active->lookup(normalized, ignored_);
  if (!entry) {
    REEL_LOG_WARN("no recording found" << kv("cassette", active->name()) << kv("method", method));
    throw cassette::NoRecordingFoundError(method, normalized.describe());
  }

  Message recorded = entry->response.to_call_result();
  if (options.return_op) {
    return Operation::completed(method, std::move(recorded));
  }
  return recorded;
}

// ============================================================================
// InterceptingStub
// ============================================================================

InterceptingStub::InterceptingStub(
  std::shared_ptr<transport::IClientStub> original, std::shared_ptr<CallInterceptor> interceptor
)
    : original_(std::move(original))
    , interceptor_(std::move(interceptor)) {
  if (!original_) {
    throw std::invalid_argument("InterceptingStub requires an original stub");
  }
  if (!interceptor_) {
    throw std::invalid_argument("InterceptingStub requires an interceptor");
  }
}

CallResult InterceptingStub::request_response(
  const std::string& method, const Message& request, const transport::CallOptions& options
) {
  return interceptor_->intercept(*original_, method, request, options);
}

}  // namespace replay
}  // namespace reel
