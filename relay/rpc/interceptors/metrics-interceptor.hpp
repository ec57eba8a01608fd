#pragma once

#include "../interceptor.hpp"
#include "../metrics.hpp"

namespace relay {

// Counts calls by outcome and observes their latency. Server calls are labeled with the name of
// the calling application, client calls with the target address.
class ServerMetricsInterceptor : public ServerInterceptor {
  std::shared_ptr<MetricsCollector> collector;
  std::string service;

 public:
  ServerMetricsInterceptor(std::shared_ptr<MetricsCollector> collector, std::string service);

  std::string name() const override { return "metrics"; }
  UnaryHandler wrap_unary(UnaryHandler next) const override;
  StreamHandler wrap_stream(StreamHandler next) const override;
};

class ClientMetricsInterceptor : public ClientInterceptor {
  std::shared_ptr<MetricsCollector> collector;
  std::string client;
  std::string target;

 public:
  ClientMetricsInterceptor(std::shared_ptr<MetricsCollector> collector, std::string client,
                           std::string target);

  std::string name() const override { return "metrics"; }
  UnaryInvoker wrap_unary(UnaryInvoker next) const override;
  Streamer wrap_stream(Streamer next) const override;
};

}  // namespace relay
