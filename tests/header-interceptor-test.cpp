#include <gtest/gtest.h>
#include <fstream>
#include "relay/rpc/headers.hpp"
#include "relay/rpc/interceptors/header-interceptor.hpp"
#include "helpers.hpp"

namespace {

using relay::Context;
using relay::Metadata;
using relay::Status;
using relay::StatusCode;
using relay::pb::Message;
using relay::test::FakeCpuSampler;

Context cpu_request() {
  return Context().with_call("Greeter.Hello", "").with_incoming({{"enable-cpu-usage", "true"}});
}

// Runs a call through the server interceptor and returns the response metadata
Metadata serve(relay::ServerHeaderInterceptor const& interceptor, Context const& context) {
  auto handler = interceptor.wrap_unary(
      [](Context const&, Message const&, Message*) { return relay::make_status(StatusCode::OK); });
  Status reply;
  handler(context, Status(), &reply);
  return context.response_metadata();
}

TEST(CpuUsage, Reported) {
  auto sampler = std::make_shared<FakeCpuSampler>(250);
  relay::ServerHeaderInterceptor interceptor(true, sampler);
  EXPECT_EQ(serve(interceptor, cpu_request()).get("cpu-usage"), "250");
}

TEST(CpuUsage, NotReportedWhenZeroOrUnknown) {
  relay::ServerHeaderInterceptor zero(true, std::make_shared<FakeCpuSampler>(0));
  EXPECT_FALSE(serve(zero, cpu_request()).contains("cpu-usage"));

  relay::ServerHeaderInterceptor unknown(true, std::make_shared<FakeCpuSampler>(boost::none));
  EXPECT_FALSE(serve(unknown, cpu_request()).contains("cpu-usage"));
}

TEST(CpuUsage, OnlyWhenAskedAndEnabled) {
  auto sampler = std::make_shared<FakeCpuSampler>(250);
  relay::ServerHeaderInterceptor enabled(true, sampler);
  EXPECT_FALSE(serve(enabled, Context()).contains("cpu-usage"));
  auto declined = Context().with_incoming({{"enable-cpu-usage", "false"}});
  EXPECT_FALSE(serve(enabled, declined).contains("cpu-usage"));

  relay::ServerHeaderInterceptor disabled(false, sampler);
  EXPECT_FALSE(serve(disabled, cpu_request()).contains("cpu-usage"));
  EXPECT_EQ(sampler->calls, 0);
}

TEST(CpuUsage, ClientAsksWhenEnabled) {
  auto seen = std::make_shared<Metadata>();
  auto transport = [seen](Context const& context, std::string const&, Message const&, Message*) {
    *seen = context.outgoing();
    return relay::make_status(StatusCode::OK);
  };
  Status reply;

  relay::ClientHeaderInterceptor(true).wrap_unary(transport)(Context(), "m", Status(), &reply);
  EXPECT_EQ(seen->get("enable-cpu-usage"), "true");

  relay::ClientHeaderInterceptor(false).wrap_unary(transport)(Context(), "m", Status(), &reply);
  EXPECT_FALSE(seen->contains("enable-cpu-usage"));
}

TEST(ProcStat, UsageSinceThePreviousSample) {
  auto path = ::testing::TempDir() + "relay-proc-stat";
  auto write = [&](std::string const& line) {
    std::ofstream file(path, std::ios::trunc);
    file << line << "\ncpu0 0 0 0 0 0 0 0 0\n";
  };

  relay::ProcStatSampler sampler(path);
  // user nice system idle iowait irq softirq steal
  write("cpu  100 0 100 700 100 0 0 0");
  auto first = sampler.usage();
  ASSERT_TRUE(first);
  EXPECT_EQ(*first, 200u);

  write("cpu  400 0 100 1300 100 0 0 0");
  auto second = sampler.usage();
  ASSERT_TRUE(second);
  EXPECT_EQ(*second, 333u);

  // counters did not move
  EXPECT_FALSE(sampler.usage());
  EXPECT_FALSE(relay::ProcStatSampler("/nonexistent/stat").usage());
}

class Propagation : public ::testing::Test {
 protected:
  void SetUp() override { relay::set_propagated_headers({"x-user", "x-tenant"}); }
  void TearDown() override { relay::set_propagated_headers({}); }
};

TEST_F(Propagation, ServerExposesIncomingValues) {
  auto seen = std::make_shared<Context>();
  relay::ServerHeaderInterceptor interceptor(false, nullptr);
  auto handler = interceptor.wrap_unary([seen](Context const& context, Message const&, Message*) {
    *seen = context;
    return relay::make_status(StatusCode::OK);
  });
  Status reply;
  handler(Context().with_incoming({{"X-User", "jon"}, {"x-other", "1"}}), Status(), &reply);

  EXPECT_EQ(seen->value("x-user"), "jon");
  EXPECT_EQ(seen->value("x-other"), "");
  EXPECT_EQ(seen->value("x-tenant"), "");
}

TEST_F(Propagation, ClientAttachesValuesAndApp) {
  relay::set_app_name("web");
  relay::ClientHeaderInterceptor interceptor(false);

  auto context = Context()
                     .with_value("x-user", "jon")
                     .with_outgoing({{"x-tenant", "explicit"}, {"app", "spoofed"}});
  auto outgoing = interceptor.attach(context).outgoing();

  EXPECT_EQ(outgoing.get("x-user"), "jon");
  EXPECT_EQ(outgoing.values("x-tenant"), std::vector<std::string>({"explicit"}));
  EXPECT_EQ(outgoing.values("app"), std::vector<std::string>({"web"}));
  EXPECT_FALSE(outgoing.contains("enable-cpu-usage"));
}

TEST_F(Propagation, ClientSendsItsAddress) {
  relay::ClientHeaderInterceptor interceptor(false);
  auto outgoing =
      interceptor.attach(Context().with_outgoing({{"client-ip", "10.9.9.9"}})).outgoing();

  auto address = relay::local_address();
  if (address.empty()) {
    EXPECT_EQ(outgoing.get("client-ip"), "10.9.9.9");
  } else {
    EXPECT_EQ(outgoing.values("client-ip"), std::vector<std::string>({address}));
  }
}

}  // namespace
