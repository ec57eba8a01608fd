#pragma once

#include <spdlog/spdlog.h>
#include <memory>
#include <vector>
#include "config.hpp"
#include "cpu.hpp"
#include "interceptor.hpp"
#include "metrics.hpp"

namespace relay {

// Ordered interceptors wrapped around every call, the first one being the outermost
class ServerChain {
  std::vector<std::shared_ptr<ServerInterceptor const>> interceptors;

 public:
  ServerChain() = default;
  explicit ServerChain(std::vector<std::shared_ptr<ServerInterceptor const>> interceptors)
      : interceptors(std::move(interceptors)) {}

  UnaryHandler wrap_unary(UnaryHandler handler) const;
  StreamHandler wrap_stream(StreamHandler handler) const;

  std::vector<std::string> names() const;
};

class ClientChain {
  std::vector<std::shared_ptr<ClientInterceptor const>> interceptors;

 public:
  ClientChain() = default;
  explicit ClientChain(std::vector<std::shared_ptr<ClientInterceptor const>> interceptors)
      : interceptors(std::move(interceptors)) {}

  UnaryInvoker wrap_unary(UnaryInvoker invoker) const;
  Streamer wrap_stream(Streamer streamer) const;

  std::vector<std::string> names() const;
};

// Backends used by the interceptors. Missing ones are replaced by the process defaults: the
// relay logger, a metrics collector on its own registry and a /proc/stat cpu sampler.
struct Instruments {
  std::shared_ptr<MetricsCollector> metrics;
  std::shared_ptr<spdlog::logger> logger;
  std::shared_ptr<CpuSampler> cpu;
};

std::shared_ptr<MetricsCollector> default_metrics();

/* The interceptors run in this order, each one wrapping the next:

    server: trace -> metrics -> headers -> access-log -> recover -> service
    client: trace -> metrics -> deadline -> headers -> access-log -> transport

  trace and metrics are closest to the transport to account for the cost of every other layer;
  recover is the innermost server stage so no other layer sees an exception thrown by a service.
  trace and metrics are left out when disabled in the configuration.
*/
// Calls invoker with a response metadata of its own, so the metadata the callee answers with never
// reaches the response of the call that context belongs to. It is stored in response_metadata
// when given.
Status call_unary(UnaryInvoker const& invoker, Context const& context, std::string const& method,
                  pb::Message const& request, pb::Message* reply,
                  Metadata* response_metadata = nullptr);

ServerChain make_server_chain(ServerConfig const& config, Instruments const& instruments = {});
ClientChain make_client_chain(ClientConfig const& config, Instruments const& instruments = {});

}  // namespace relay
