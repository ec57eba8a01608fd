#pragma once

#include <string>
#include "../core.hpp"

namespace relay {

// Options of the server side chain, read once when the chain is built
struct ServerConfig {
  std::string name = "relay";
  // log every call, not only failed and slow ones
  bool enable_access_interceptor = true;
  bool enable_access_interceptor_req = false;
  bool enable_access_interceptor_res = false;
  // trace calls and add the trace id to the access log
  bool enable_trace_interceptor = true;
  bool enable_metric_interceptor = true;
  // report the cpu usage to callers asking for it
  bool enable_cpu_usage = true;
  // calls taking longer are logged as slow, zero or negative disables it
  pb::Duration slow_log_threshold = pb::TimeUtil::MillisecondsToDuration(500);
};

// Options of the client side chain, read once when the chain is built
struct ClientConfig {
  std::string name = "relay";
  // address of the service being called, used in metrics and logs
  std::string target;
  bool enable_access_interceptor = false;
  bool enable_access_interceptor_req = false;
  bool enable_access_interceptor_res = false;
  bool enable_trace_interceptor = true;
  bool enable_metric_interceptor = true;
  // ask the called service to report its cpu usage
  bool enable_cpu_usage = false;
  pb::Duration slow_log_threshold = pb::TimeUtil::MillisecondsToDuration(600);
  // deadline applied to calls made without one
  pb::Duration timeout = pb::TimeUtil::SecondsToDuration(1);
};

// Program options bound to the fields of the configuration. The configuration must outlive the
// parsing of the options.
po::options_description server_options(ServerConfig* config);
po::options_description client_options(ClientConfig* config);

// --propagated-headers: comma separated list replacing the process wide propagated headers
po::options_description header_options();

}  // namespace relay
