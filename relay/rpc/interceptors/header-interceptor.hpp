#pragma once

#include "../cpu.hpp"
#include "../interceptor.hpp"

namespace relay {

// Makes the propagated headers found in the incoming metadata visible to the service and to the
// calls it makes. Reports the cpu usage in the response metadata to callers asking for it.
class ServerHeaderInterceptor : public ServerInterceptor {
  bool enable_cpu_usage;
  std::shared_ptr<CpuSampler> sampler;

 public:
  ServerHeaderInterceptor(bool enable_cpu_usage, std::shared_ptr<CpuSampler> sampler);

  std::string name() const override { return "headers"; }
  UnaryHandler wrap_unary(UnaryHandler next) const override;
  StreamHandler wrap_stream(StreamHandler next) const override;

  Context propagate(Context const& context) const;
  void report_cpu_usage(Context const& context) const;
};

// Attaches the application name, the propagated headers of the calling context and, if enabled,
// the cpu usage request to the outgoing metadata.
class ClientHeaderInterceptor : public ClientInterceptor {
  bool enable_cpu_usage;

 public:
  explicit ClientHeaderInterceptor(bool enable_cpu_usage) : enable_cpu_usage(enable_cpu_usage) {}

  std::string name() const override { return "headers"; }
  UnaryInvoker wrap_unary(UnaryInvoker next) const override;
  Streamer wrap_stream(Streamer next) const override;

  Context attach(Context const& context) const;
};

}  // namespace relay
