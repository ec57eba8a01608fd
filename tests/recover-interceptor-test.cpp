#include <gtest/gtest.h>
#include "relay/rpc/interceptors/log-interceptor.hpp"
#include "relay/rpc/interceptors/recover-interceptor.hpp"
#include "helpers.hpp"

namespace {

using relay::Context;
using relay::Status;
using relay::StatusCode;
using relay::pb::Message;
using relay::test::contains;

relay::UnaryHandler throwing(std::function<void()> thrower) {
  return [thrower](Context const&, Message const&, Message*) -> Status {
    thrower();
    return relay::make_status(StatusCode::OK);
  };
}

Status serve(relay::UnaryHandler handler) {
  Status reply;
  return relay::RecoverInterceptor().wrap_unary(handler)(Context().with_call("m", ""), Status(),
                                                          &reply);
}

TEST(Recover, StdException) {
  auto status = serve(throwing([] { throw std::runtime_error("broken"); }));
  EXPECT_EQ(status.code(), StatusCode::INTERNAL_ERROR);
  EXPECT_EQ(status.why(), "broken");
}

TEST(Recover, ErrorKeepsItsStatus) {
  auto status = serve(throwing([] { throw relay::Error(StatusCode::NOT_FOUND, "no user"); }));
  EXPECT_EQ(status.code(), StatusCode::NOT_FOUND);
  EXPECT_EQ(status.why(), "no user");
}

TEST(Recover, StringsAndOtherValues) {
  auto from_string = serve(throwing([] { throw std::string("boom"); }));
  EXPECT_EQ(from_string.code(), StatusCode::INTERNAL_ERROR);
  EXPECT_EQ(from_string.why(), "boom");

  auto from_literal = serve(throwing([] { throw "literal"; }));
  EXPECT_EQ(from_literal.why(), "literal");

  auto from_int = serve(throwing([] { throw 42; }));
  EXPECT_EQ(from_int.code(), StatusCode::INTERNAL_ERROR);
  EXPECT_FALSE(from_int.why().empty());
}

TEST(Recover, NoThrowPassesThrough) {
  auto status = serve([](Context const&, Message const&, Message*) {
    return relay::make_status(StatusCode::ALREADY_EXISTS, "dup");
  });
  EXPECT_EQ(status.code(), StatusCode::ALREADY_EXISTS);
  EXPECT_EQ(status.why(), "dup");
}

TEST(Recover, FieldsGetTheEventAndStack) {
  auto fields = std::make_shared<relay::LogFields>();
  auto status = relay::recover(Context().with_fields(fields), []() -> Status {
    throw std::string("boom");
  });
  EXPECT_EQ(status.why(), "boom");
  EXPECT_EQ(fields->get("event"), "recover");
  EXPECT_TRUE(fields->contains("stack"));
  EXPECT_LE(fields->get("stack").size(), 4096u);
}

TEST(Recover, StackIsTruncated) {
  EXPECT_LE(relay::capture_stack(16).size(), 16u);
}

TEST(Recover, AccessLogRecordsTheRecovery) {
  relay::test::LogCapture capture;
  relay::ServerConfig config;
  config.enable_access_interceptor = false;
  config.enable_trace_interceptor = false;

  relay::ServerLogInterceptor log(config, capture.logger());
  auto handler =
      log.wrap_unary(relay::RecoverInterceptor().wrap_unary(throwing([] {
        throw std::string("boom");
      })));
  Status reply;
  auto status = handler(Context().with_call("Greeter.Hello", ""), Status(), &reply);
  EXPECT_EQ(status.code(), StatusCode::INTERNAL_ERROR);

  auto records = capture.records();
  ASSERT_EQ(records.size(), 1u);
  EXPECT_EQ(records[0].level, spdlog::level::err);
  EXPECT_TRUE(contains(records[0].payload, "event=recover"));
  EXPECT_TRUE(contains(records[0].payload, "desc=boom"));
  EXPECT_TRUE(contains(records[0].payload, "stack="));
  EXPECT_TRUE(contains(records[0].payload, "code=500"));
}

TEST(Recover, Streams) {
  auto handler = relay::RecoverInterceptor().wrap_stream(
      [](relay::ServerStream*) -> Status { throw std::runtime_error("stream broke"); });
  relay::test::FakeServerStream stream(Context());
  auto status = handler(&stream);
  EXPECT_EQ(status.code(), StatusCode::INTERNAL_ERROR);
  EXPECT_EQ(status.why(), "stream broke");
}

}  // namespace
