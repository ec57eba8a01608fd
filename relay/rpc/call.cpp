#include "call.hpp"
#include "headers.hpp"

namespace relay {

std::string peer_name(Context const& context) {
  auto name = context.incoming().joined(kAppHeader);
  return name.empty() ? "unknown" : name;
}

std::string peer_ip(Context const& context) {
  auto client_ip = context.incoming().get(kClientIpHeader);
  if (!client_ip.empty()) return client_ip;

  auto const& peer = context.peer();
  if (!peer.empty() && peer.front() == '[') {
    auto end = peer.find(']');
    return end != std::string::npos ? peer.substr(1, end - 1) : "";
  }
  auto colon = peer.find(':');
  return colon != std::string::npos ? peer.substr(0, colon) : "";
}

std::string propagated_value(Context const& context, std::string const& key) {
  auto value = context.value(key);
  if (value.empty()) value = context.incoming().get(key);
  if (value.empty()) value = context.outgoing().get(key);
  return value;
}

double to_seconds(pb::Duration const& duration) {
  return pb::TimeUtil::DurationToNanoseconds(duration) / 1e9;
}

double to_milliseconds(pb::Duration const& duration) {
  return pb::TimeUtil::DurationToNanoseconds(duration) / 1e6;
}

std::string outcome(Status const& status) {
  return http_status_text(http_status(status.code()));
}

}  // namespace relay
