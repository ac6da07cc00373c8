// SPDX-FileCopyrightText: 2026 ArcheBase
//
// SPDX-License-Identifier: MulanPSL-2.0

/**
 * Unit tests for StubHandle install/uninstall
 */

#include <gmock/gmock.h>
#include <gtest/gtest.h>

#include <memory>
#include <stdexcept>

#include "stub_handle.hpp"
#include "transport_mocks.hpp"

using namespace reel::transport;
using reel::transport::test::FakeLibraryStub;
using reel::transport::test::MockClientStub;
using ::testing::_;
using ::testing::Return;

namespace {

/**
 * Wrapper that tags every response body so tests can see which path ran.
 */
class TaggingStub : public IClientStub {
public:
  explicit TaggingStub(std::shared_ptr<IClientStub> inner)
      : inner_(std::move(inner)) {}

  CallResult request_response(
    const std::string& method, const Message& request, const CallOptions& options
  ) override {
    auto result = inner_->request_response(method, request, options);
    auto message = std::get<Message>(result);
    message.body["wrapped"] = true;
    return message;
  }

private:
  std::shared_ptr<IClientStub> inner_;
};

StubHandle::WrapFactory tagging_factory(int* invocations) {
  return [invocations](std::shared_ptr<IClientStub> original) {
    ++*invocations;
    return std::make_shared<TaggingStub>(std::move(original));
  };
}

}  // namespace

class StubHandleTest : public ::testing::Test {
protected:
  void SetUp() override {
    fake_ = std::make_shared<FakeLibraryStub>();
    handle_ = std::make_unique<StubHandle>("library", fake_);
  }

  Message get_book(int id) {
    return std::get<Message>(
      handle_->request_response("/acme.v1.Library/GetBook", Message("acme.v1.GetBookRequest", {{"id", id}}), {})
    );
  }

  std::shared_ptr<FakeLibraryStub> fake_;
  std::unique_ptr<StubHandle> handle_;
};

TEST_F(StubHandleTest, PlainHandleDispatchesToOriginal) {
  EXPECT_FALSE(handle_->is_intercepted());
  EXPECT_EQ(handle_->name(), "library");

  auto book = get_book(1);
  EXPECT_EQ(book.type, "acme.v1.Book");
  EXPECT_FALSE(book.body.contains("wrapped"));
  EXPECT_EQ(fake_->calls(), 1);
}

TEST_F(StubHandleTest, InstallWrapsCallPath) {
  int factory_calls = 0;
  EXPECT_TRUE(handle_->install(tagging_factory(&factory_calls)));
  EXPECT_TRUE(handle_->is_intercepted());

  auto book = get_book(1);
  EXPECT_TRUE(book.body.value("wrapped", false));
  EXPECT_EQ(factory_calls, 1);
}

TEST_F(StubHandleTest, InstallTwiceWrapsOnce) {
  int factory_calls = 0;
  EXPECT_TRUE(handle_->install(tagging_factory(&factory_calls)));
  auto first_wrapper = handle_->current();

  EXPECT_FALSE(handle_->install(tagging_factory(&factory_calls)));
  EXPECT_EQ(factory_calls, 1);
  EXPECT_EQ(handle_->current(), first_wrapper);
}

TEST_F(StubHandleTest, UninstallRestoresOriginalExactly) {
  int factory_calls = 0;
  auto original = handle_->current();
  ASSERT_TRUE(handle_->install(tagging_factory(&factory_calls)));

  EXPECT_TRUE(handle_->uninstall());
  EXPECT_FALSE(handle_->is_intercepted());
  EXPECT_EQ(handle_->current(), original);
  EXPECT_EQ(handle_->original(), original);
  EXPECT_FALSE(get_book(2).body.contains("wrapped"));
}

TEST_F(StubHandleTest, UninstallPlainHandleIsNoop) {
  auto original = handle_->current();
  EXPECT_FALSE(handle_->uninstall());
  EXPECT_FALSE(handle_->uninstall());
  EXPECT_EQ(handle_->current(), original);
}

TEST_F(StubHandleTest, ReinstallAfterUninstall) {
  int factory_calls = 0;
  ASSERT_TRUE(handle_->install(tagging_factory(&factory_calls)));
  ASSERT_TRUE(handle_->uninstall());
  EXPECT_TRUE(handle_->install(tagging_factory(&factory_calls)));
  EXPECT_EQ(factory_calls, 2);
}

TEST_F(StubHandleTest, NullFactoryResultRejected) {
  EXPECT_THROW(
    handle_->install([](std::shared_ptr<IClientStub>) { return std::shared_ptr<IClientStub>(); }),
    std::invalid_argument
  );
  EXPECT_FALSE(handle_->is_intercepted());
}

TEST(StubHandleConstructionTest, NullStubRejected) {
  EXPECT_THROW(StubHandle("empty", nullptr), std::invalid_argument);
}

TEST(StubHandleConstructionTest, ForwardsArgumentsUnchanged) {
  auto mock = std::make_shared<MockClientStub>();
  StubHandle handle("mock", mock);

  CallOptions options;
  options.metadata["authorization"] = "Bearer abc";
  EXPECT_CALL(*mock, request_response("/svc/Method", Message("req", {{"a", 1}}), _))
    .WillOnce(Return(CallResult(Message("resp", {{"ok", true}}))));

  auto result = handle.request_response("/svc/Method", Message("req", {{"a", 1}}), options);
  EXPECT_EQ(std::get<Message>(result), Message("resp", {{"ok", true}}));
}
