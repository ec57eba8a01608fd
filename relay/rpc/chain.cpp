#include "chain.hpp"
#include "interceptors/deadline-interceptor.hpp"
#include "interceptors/header-interceptor.hpp"
#include "interceptors/log-interceptor.hpp"
#include "interceptors/metrics-interceptor.hpp"
#include "interceptors/recover-interceptor.hpp"
#include "interceptors/trace-interceptor.hpp"

namespace relay {

namespace {

std::shared_ptr<CpuSampler> default_cpu_sampler() {
  static auto sampler = std::make_shared<ProcStatSampler>();
  return sampler;
}

template <typename Interceptors>
std::vector<std::string> names_of(Interceptors const& interceptors) {
  std::vector<std::string> names;
  for (auto&& interceptor : interceptors)
    names.push_back(interceptor->name());
  return names;
}

}  // namespace

UnaryHandler ServerChain::wrap_unary(UnaryHandler handler) const {
  for (auto it = interceptors.rbegin(); it != interceptors.rend(); ++it)
    handler = (*it)->wrap_unary(std::move(handler));
  return handler;
}

StreamHandler ServerChain::wrap_stream(StreamHandler handler) const {
  for (auto it = interceptors.rbegin(); it != interceptors.rend(); ++it)
    handler = (*it)->wrap_stream(std::move(handler));
  return handler;
}

std::vector<std::string> ServerChain::names() const {
  return names_of(interceptors);
}

UnaryInvoker ClientChain::wrap_unary(UnaryInvoker invoker) const {
  for (auto it = interceptors.rbegin(); it != interceptors.rend(); ++it)
    invoker = (*it)->wrap_unary(std::move(invoker));
  return invoker;
}

Streamer ClientChain::wrap_stream(Streamer streamer) const {
  for (auto it = interceptors.rbegin(); it != interceptors.rend(); ++it)
    streamer = (*it)->wrap_stream(std::move(streamer));
  return streamer;
}

std::vector<std::string> ClientChain::names() const {
  return names_of(interceptors);
}

std::shared_ptr<MetricsCollector> default_metrics() {
  static auto collector = std::make_shared<MetricsCollector>();
  return collector;
}

Status call_unary(UnaryInvoker const& invoker, Context const& context, std::string const& method,
                  pb::Message const& request, pb::Message* reply, Metadata* response_metadata) {
  auto call_context = context.with_response();
  auto status = invoker(call_context, method, request, reply);
  if (response_metadata != nullptr) *response_metadata = call_context.response_metadata();
  return status;
}

ServerChain make_server_chain(ServerConfig const& config, Instruments const& instruments) {
  auto metrics = instruments.metrics != nullptr ? instruments.metrics : default_metrics();
  auto log = instruments.logger != nullptr ? instruments.logger : logger();
  auto cpu = instruments.cpu != nullptr ? instruments.cpu : default_cpu_sampler();

  std::vector<std::shared_ptr<ServerInterceptor const>> interceptors;
  if (config.enable_trace_interceptor)
    interceptors.push_back(std::make_shared<ServerTraceInterceptor>());
  if (config.enable_metric_interceptor)
    interceptors.push_back(std::make_shared<ServerMetricsInterceptor>(metrics, config.name));
  interceptors.push_back(std::make_shared<ServerHeaderInterceptor>(config.enable_cpu_usage, cpu));
  interceptors.push_back(std::make_shared<ServerLogInterceptor>(config, log));
  interceptors.push_back(std::make_shared<RecoverInterceptor>());
  return ServerChain(std::move(interceptors));
}

ClientChain make_client_chain(ClientConfig const& config, Instruments const& instruments) {
  auto metrics = instruments.metrics != nullptr ? instruments.metrics : default_metrics();
  auto log = instruments.logger != nullptr ? instruments.logger : logger();

  std::vector<std::shared_ptr<ClientInterceptor const>> interceptors;
  if (config.enable_trace_interceptor)
    interceptors.push_back(std::make_shared<ClientTraceInterceptor>());
  if (config.enable_metric_interceptor) {
    interceptors.push_back(
        std::make_shared<ClientMetricsInterceptor>(metrics, config.name, config.target));
  }
  interceptors.push_back(std::make_shared<DeadlineInterceptor>(config.timeout));
  interceptors.push_back(std::make_shared<ClientHeaderInterceptor>(config.enable_cpu_usage));
  interceptors.push_back(std::make_shared<ClientLogInterceptor>(config, log));
  return ClientChain(std::move(interceptors));
}

}  // namespace relay
