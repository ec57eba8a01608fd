#include <gtest/gtest.h>
#include "relay/rpc/headers.hpp"
#include "relay/rpc/interceptors/log-interceptor.hpp"
#include "helpers.hpp"

namespace {

using relay::Context;
using relay::Status;
using relay::StatusCode;
using relay::pb::Message;
using relay::pb::TimeUtil;
using relay::test::contains;

// Service answering with the status it receives, after the given delay
relay::UnaryHandler echo(int delay_ms = 0) {
  return [delay_ms](Context const&, Message const& request, Message* reply) {
    if (delay_ms > 0) relay::test::sleep_ms(delay_ms);
    auto const& status = static_cast<Status const&>(request);
    static_cast<Status*>(reply)->set_why("pong");
    return status;
  };
}

Context server_context() {
  return Context()
      .with_call("Greeter.Hello", "10.0.0.1:5672")
      .with_incoming({{"app", "web"}, {"x-user", "jon"}});
}

class ServerAccessLog : public ::testing::Test {
 protected:
  relay::test::LogCapture capture;
  relay::ServerConfig config;

  void SetUp() override {
    config.enable_trace_interceptor = false;
    config.slow_log_threshold = TimeUtil::MillisecondsToDuration(100);
  }
  void TearDown() override { relay::set_propagated_headers({}); }

  Status call(Status const& request, int delay_ms = 0) {
    relay::ServerLogInterceptor interceptor(config, capture.logger());
    Status reply;
    return interceptor.wrap_unary(echo(delay_ms))(server_context(), request, &reply);
  }
};

TEST_F(ServerAccessLog, SuccessfulCall) {
  auto status = call(relay::make_status(StatusCode::OK));
  EXPECT_EQ(status.code(), StatusCode::OK);

  auto records = capture.records();
  ASSERT_EQ(records.size(), 1u);
  EXPECT_EQ(records[0].level, spdlog::level::info);
  auto const& line = records[0].payload;
  EXPECT_EQ(line.compare(0, 7, "access "), 0);
  EXPECT_TRUE(contains(line, "type=unary"));
  EXPECT_TRUE(contains(line, "code=200"));
  EXPECT_TRUE(contains(line, "ucode=0"));
  EXPECT_TRUE(contains(line, "event=normal"));
  EXPECT_TRUE(contains(line, "method=Greeter.Hello"));
  EXPECT_TRUE(contains(line, "peer=web"));
  EXPECT_TRUE(contains(line, "ip=10.0.0.1"));
  EXPECT_TRUE(contains(line, "cost="));
  EXPECT_FALSE(contains(line, "req="));
  EXPECT_FALSE(contains(line, "res="));
  EXPECT_FALSE(contains(line, "tid="));
}

TEST_F(ServerAccessLog, NothingWhenDisabledAndFast) {
  config.enable_access_interceptor = false;
  call(relay::make_status(StatusCode::OK), 50);
  EXPECT_TRUE(capture.records().empty());
}

TEST_F(ServerAccessLog, FieldsStayEmptyUntilLogged) {
  config.enable_access_interceptor = false;
  relay::ServerLogInterceptor interceptor(config, capture.logger());
  auto capacity = std::make_shared<std::size_t>(1);
  auto handler = interceptor.wrap_unary([capacity](Context const& context, Message const&,
                                                   Message*) {
    if (context.fields() != nullptr) *capacity = context.fields()->values().capacity();
    return relay::make_status(StatusCode::OK);
  });
  Status reply;
  handler(server_context(), Status(), &reply);

  EXPECT_EQ(*capacity, 0u);
  EXPECT_TRUE(capture.records().empty());
}

TEST_F(ServerAccessLog, SlowCallWhenDisabled) {
  config.enable_access_interceptor = false;
  call(relay::make_status(StatusCode::OK), 150);

  auto records = capture.records();
  ASSERT_EQ(records.size(), 1u);
  EXPECT_EQ(records[0].level, spdlog::level::warn);
  EXPECT_EQ(records[0].payload.compare(0, 5, "slow "), 0);
  EXPECT_TRUE(contains(records[0].payload, "event=slow"));
}

TEST_F(ServerAccessLog, ZeroThresholdNeverSlow) {
  config.enable_access_interceptor = false;
  config.slow_log_threshold = TimeUtil::MillisecondsToDuration(0);
  call(relay::make_status(StatusCode::OK), 20);
  EXPECT_TRUE(capture.records().empty());
}

TEST_F(ServerAccessLog, CallerFaultIsAWarning) {
  config.enable_access_interceptor = false;
  call(relay::make_status(StatusCode::INVALID_ARGUMENT, "empty name"));

  auto records = capture.records();
  ASSERT_EQ(records.size(), 1u);
  EXPECT_EQ(records[0].level, spdlog::level::warn);
  auto const& line = records[0].payload;
  EXPECT_EQ(line.compare(0, 7, "access "), 0);
  EXPECT_TRUE(contains(line, "code=400"));
  EXPECT_TRUE(contains(line, "ucode=3"));
  EXPECT_TRUE(contains(line, "desc='empty name'"));
  EXPECT_TRUE(contains(line, "event=error"));
  EXPECT_TRUE(contains(line, "err='code = INVALID_ARGUMENT desc = empty name'"));
}

TEST_F(ServerAccessLog, ServiceFaultIsAnError) {
  call(relay::make_status(StatusCode::UNAVAILABLE, "down"));

  auto records = capture.records();
  ASSERT_EQ(records.size(), 1u);
  EXPECT_EQ(records[0].level, spdlog::level::err);
  EXPECT_TRUE(contains(records[0].payload, "code=503"));
}

TEST_F(ServerAccessLog, SlowFailureIsLoggedOnce) {
  config.enable_access_interceptor = false;
  call(relay::make_status(StatusCode::NOT_FOUND, "missing"), 150);

  auto records = capture.records();
  ASSERT_EQ(records.size(), 1u);
  EXPECT_EQ(records[0].level, spdlog::level::warn);
  EXPECT_TRUE(contains(records[0].payload, "event=error"));
  EXPECT_TRUE(contains(records[0].payload, "slow=true"));
}

TEST_F(ServerAccessLog, Payloads) {
  config.enable_access_interceptor_req = true;
  config.enable_access_interceptor_res = true;
  call(relay::make_status(StatusCode::OK, "ping"));

  auto records = capture.records();
  ASSERT_EQ(records.size(), 1u);
  auto const& line = records[0].payload;
  EXPECT_TRUE(contains(line, R"(req={"payload":{"why":"ping"},"metadata":{"app":["web"])"));
  EXPECT_TRUE(contains(line, R"(res={"payload":{"why":"pong"}})"));
}

TEST_F(ServerAccessLog, PropagatedHeaders) {
  relay::set_propagated_headers({"x-user", "x-tenant"});
  call(relay::make_status(StatusCode::OK));

  auto records = capture.records();
  ASSERT_EQ(records.size(), 1u);
  EXPECT_TRUE(contains(records[0].payload, "x-user=jon"));
  EXPECT_FALSE(contains(records[0].payload, "x-tenant="));
}

TEST_F(ServerAccessLog, Streams) {
  relay::ServerLogInterceptor interceptor(config, capture.logger());
  auto handler = interceptor.wrap_stream([](relay::ServerStream* stream) {
    EXPECT_NE(stream->context().fields(), nullptr);
    return relay::make_status(StatusCode::OK);
  });
  relay::test::FakeServerStream stream(server_context());
  handler(&stream);

  auto records = capture.records();
  ASSERT_EQ(records.size(), 1u);
  EXPECT_TRUE(contains(records[0].payload, "type=stream"));
  EXPECT_TRUE(contains(records[0].payload, "peer=web"));
}

class ClientAccessLog : public ::testing::Test {
 protected:
  relay::test::LogCapture capture;
  relay::ClientConfig config;

  void SetUp() override {
    config.target = "Greeter";
    config.enable_trace_interceptor = false;
  }
};

TEST_F(ClientAccessLog, DisabledByDefault) {
  relay::ClientLogInterceptor interceptor(config, capture.logger());
  auto invoker = interceptor.wrap_unary(
      [](Context const&, std::string const&, Message const&, Message*) {
        return relay::make_status(StatusCode::OK);
      });
  Status reply;
  invoker(Context(), "Greeter.Hello", Status(), &reply);
  EXPECT_TRUE(capture.records().empty());
}

TEST_F(ClientAccessLog, FailedCall) {
  relay::ClientLogInterceptor interceptor(config, capture.logger());
  auto invoker = interceptor.wrap_unary(
      [](Context const&, std::string const&, Message const&, Message*) {
        return relay::make_status(StatusCode::DEADLINE_EXCEEDED, "too late");
      });
  Status reply;
  invoker(Context(), "Greeter.Hello", Status(), &reply);

  auto records = capture.records();
  ASSERT_EQ(records.size(), 1u);
  EXPECT_EQ(records[0].level, spdlog::level::err);
  EXPECT_TRUE(contains(records[0].payload, "name=Greeter"));
  EXPECT_TRUE(contains(records[0].payload, "method=Greeter.Hello"));
  EXPECT_TRUE(contains(records[0].payload, "code=504"));
}

TEST_F(ClientAccessLog, StreamIsLoggedWhenItEnds) {
  config.enable_access_interceptor = true;
  relay::ClientLogInterceptor interceptor(config, capture.logger());
  auto streamer = interceptor.wrap_stream([](Context const&, std::string const&) {
    return std::unique_ptr<relay::ClientStream>(new relay::test::FakeClientStream());
  });

  auto stream = streamer(Context(), "Greeter.Chat");
  EXPECT_TRUE(capture.records().empty());
  stream->finish();
  stream.reset();

  auto records = capture.records();
  ASSERT_EQ(records.size(), 1u);
  EXPECT_EQ(records[0].level, spdlog::level::info);
  EXPECT_TRUE(contains(records[0].payload, "type=stream"));
}

}  // namespace
