#include <gtest/gtest.h>
#include "relay/rpc/call.hpp"
#include "relay/rpc/status.hpp"

namespace {

using relay::StatusCode;

TEST(Status, HttpMapping) {
  EXPECT_EQ(relay::http_status(StatusCode::OK), 200);
  EXPECT_EQ(relay::http_status(StatusCode::INVALID_ARGUMENT), 400);
  EXPECT_EQ(relay::http_status(StatusCode::FAILED_PRECONDITION), 400);
  EXPECT_EQ(relay::http_status(StatusCode::UNAUTHENTICATED), 401);
  EXPECT_EQ(relay::http_status(StatusCode::PERMISSION_DENIED), 403);
  EXPECT_EQ(relay::http_status(StatusCode::NOT_FOUND), 404);
  EXPECT_EQ(relay::http_status(StatusCode::RESOURCE_EXHAUSTED), 429);
  EXPECT_EQ(relay::http_status(StatusCode::CANCELLED), 499);
  EXPECT_EQ(relay::http_status(StatusCode::INTERNAL_ERROR), 500);
  EXPECT_EQ(relay::http_status(StatusCode::UNIMPLEMENTED), 501);
  EXPECT_EQ(relay::http_status(StatusCode::UNAVAILABLE), 503);
  EXPECT_EQ(relay::http_status(StatusCode::DEADLINE_EXCEEDED), 504);
}

TEST(Status, ServerFaults) {
  EXPECT_TRUE(relay::is_server_fault(StatusCode::INTERNAL_ERROR));
  EXPECT_TRUE(relay::is_server_fault(StatusCode::UNAVAILABLE));
  EXPECT_TRUE(relay::is_server_fault(StatusCode::UNKNOWN));
  EXPECT_FALSE(relay::is_server_fault(StatusCode::INVALID_ARGUMENT));
  EXPECT_FALSE(relay::is_server_fault(StatusCode::CANCELLED));
  EXPECT_FALSE(relay::is_server_fault(StatusCode::OK));
}

TEST(Status, Outcome) {
  EXPECT_EQ(relay::outcome(relay::make_status(StatusCode::OK)), "OK");
  EXPECT_EQ(relay::outcome(relay::make_status(StatusCode::NOT_FOUND)), "Not Found");
  EXPECT_EQ(relay::http_status_text(418), "Unknown");
}

TEST(Status, ErrorCarriesItsStatus) {
  relay::Error error(StatusCode::NOT_FOUND, "no such user");
  EXPECT_EQ(error.status().code(), StatusCode::NOT_FOUND);
  EXPECT_EQ(error.status().why(), "no such user");
  EXPECT_STREQ(error.what(), "no such user");
}

TEST(Call, PeerName) {
  relay::Context context;
  EXPECT_EQ(relay::peer_name(context), "unknown");
  EXPECT_EQ(relay::peer_name(context.with_incoming({{"app", "caller"}})), "caller");
}

TEST(Call, PeerIp) {
  relay::Context context;
  EXPECT_EQ(relay::peer_ip(context.with_call("m", "10.0.0.1:5672")), "10.0.0.1");
  EXPECT_EQ(relay::peer_ip(context.with_call("m", "[::1]:5672")), "::1");
  EXPECT_EQ(relay::peer_ip(context.with_call("m", "10.0.0.1:5672")
                               .with_incoming({{"client-ip", "192.168.0.7"}})),
            "192.168.0.7");
  EXPECT_EQ(relay::peer_ip(context), "");
}

TEST(Call, PropagatedValuePrefersUpstream) {
  auto context = relay::Context()
                     .with_incoming({{"x-user", "incoming"}})
                     .with_outgoing({{"x-user", "outgoing"}, {"x-tenant", "acme"}});
  EXPECT_EQ(relay::propagated_value(context, "x-user"), "incoming");
  EXPECT_EQ(relay::propagated_value(context.with_value("x-user", "value"), "x-user"), "value");
  EXPECT_EQ(relay::propagated_value(context, "x-tenant"), "acme");
  EXPECT_EQ(relay::propagated_value(context, "x-none"), "");
}

}  // namespace
