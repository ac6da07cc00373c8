// SPDX-FileCopyrightText: 2026 ArcheBase
//
// SPDX-License-Identifier: MulanPSL-2.0

#ifndef REEL_TRANSPORT_MOCKS_HPP
#define REEL_TRANSPORT_MOCKS_HPP

#include <gmock/gmock.h>

#include <atomic>
#include <memory>
#include <string>

#include "client_stub.hpp"

namespace reel {
namespace transport {
namespace test {

/**
 * Mock implementation of IClientStub for testing
 */
class MockClientStub : public IClientStub {
public:
  MOCK_METHOD(
    CallResult, request_response,
    (const std::string& method, const Message& request, const CallOptions& options), (override)
  );
};

/**
 * In-process stand-in for a live library service.
 *
 * GetBook returns {"id": <id>, "title": "Book <id>", "revision": <n>} where n
 * counts live calls, so a replayed response is distinguishable from a live one.
 * With return_op set it hands back a pending Operation whose completion step
 * also counts as a live call.
 */
class FakeLibraryStub : public IClientStub {
public:
  CallResult request_response(
    const std::string& method, const Message& request, const CallOptions& options
  ) override {
    ++calls_;
    if (options.return_op) {
      return std::make_shared<Operation>(method, [this, request] {
        ++completions_;
        return make_book(request);
      });
    }
    return make_book(request);
  }

  Message make_book(const Message& request) {
    int id = request.body.value("id", 0);
    return Message(
      "acme.v1.Book",
      {{"id", id}, {"title", "Book " + std::to_string(id)}, {"revision", revision_++}}
    );
  }

  int calls() const {
    return calls_.load();
  }

  int completions() const {
    return completions_.load();
  }

private:
  std::atomic<int> calls_{0};
  std::atomic<int> completions_{0};
  std::atomic<int> revision_{0};
};

}  // namespace test
}  // namespace transport
}  // namespace reel

#endif  // REEL_TRANSPORT_MOCKS_HPP
