#include "config.hpp"
#include <boost/algorithm/string/classification.hpp>
#include <boost/algorithm/string/split.hpp>
#include <boost/algorithm/string/trim.hpp>
#include "headers.hpp"

namespace relay {

namespace {

void add_access_options(po::options_description_easy_init& options, bool* access, bool* req,
                        bool* res) {
  options("access-log", po::value<bool>(access)->default_value(*access),
          "log every call, failed and slow calls are always logged");
  options("access-log-req", po::value<bool>(req)->default_value(*req),
          "add the request payload to the access log");
  options("access-log-res", po::value<bool>(res)->default_value(*res),
          "add the reply payload to the access log");
}

auto to_duration(pb::Duration* duration) {
  return [duration](int64_t ms) { *duration = pb::TimeUtil::MillisecondsToDuration(ms); };
}

}  // namespace

po::options_description server_options(ServerConfig* config) {
  po::options_description description("Server");
  auto options = description.add_options();
  options("name", po::value<std::string>(&config->name)->default_value(config->name),
          "service name used in metrics");
  add_access_options(options, &config->enable_access_interceptor,
                     &config->enable_access_interceptor_req,
                     &config->enable_access_interceptor_res);
  options("trace", po::value<bool>(&config->enable_trace_interceptor)
                       ->default_value(config->enable_trace_interceptor),
          "trace calls and log trace ids");
  options("metrics", po::value<bool>(&config->enable_metric_interceptor)
                         ->default_value(config->enable_metric_interceptor),
          "record call metrics");
  options("cpu-usage",
          po::value<bool>(&config->enable_cpu_usage)->default_value(config->enable_cpu_usage),
          "report the cpu usage to callers asking for it");
  options("slow-log-ms",
          po::value<int64_t>()
              ->default_value(pb::TimeUtil::DurationToMilliseconds(config->slow_log_threshold))
              ->notifier(to_duration(&config->slow_log_threshold)),
          "calls taking longer than this are logged as slow, 0 disables it");
  return description;
}

po::options_description client_options(ClientConfig* config) {
  po::options_description description("Client");
  auto options = description.add_options();
  options("client-name", po::value<std::string>(&config->name)->default_value(config->name),
          "client name used in metrics");
  options("target", po::value<std::string>(&config->target)->default_value(config->target),
          "address of the called service");
  add_access_options(options, &config->enable_access_interceptor,
                     &config->enable_access_interceptor_req,
                     &config->enable_access_interceptor_res);
  options("trace", po::value<bool>(&config->enable_trace_interceptor)
                       ->default_value(config->enable_trace_interceptor),
          "trace calls and log trace ids");
  options("metrics", po::value<bool>(&config->enable_metric_interceptor)
                         ->default_value(config->enable_metric_interceptor),
          "record call metrics");
  options("cpu-usage",
          po::value<bool>(&config->enable_cpu_usage)->default_value(config->enable_cpu_usage),
          "ask the called service for its cpu usage");
  options("slow-log-ms",
          po::value<int64_t>()
              ->default_value(pb::TimeUtil::DurationToMilliseconds(config->slow_log_threshold))
              ->notifier(to_duration(&config->slow_log_threshold)),
          "calls taking longer than this are logged as slow, 0 disables it");
  options("timeout-ms",
          po::value<int64_t>()
              ->default_value(pb::TimeUtil::DurationToMilliseconds(config->timeout))
              ->notifier(to_duration(&config->timeout)),
          "deadline of calls made without one");
  return description;
}

po::options_description header_options() {
  po::options_description description("Headers");
  description.add_options()(
      "propagated-headers",
      po::value<std::string>()->notifier([](std::string const& list) {
        HeaderNames names;
        boost::split(names, list, boost::is_any_of(","));
        for (auto& name : names)
          boost::trim(name);
        set_propagated_headers(names);
      }),
      "comma separated headers carried from incoming calls to logs and outgoing calls");
  return description;
}

}  // namespace relay
