#include "header-interceptor.hpp"
#include "../call.hpp"
#include "../headers.hpp"

namespace relay {

ServerHeaderInterceptor::ServerHeaderInterceptor(bool enable_cpu_usage,
                                                 std::shared_ptr<CpuSampler> sampler)
    : enable_cpu_usage(enable_cpu_usage), sampler(std::move(sampler)) {}

Context ServerHeaderInterceptor::propagate(Context const& context) const {
  auto propagated = context;
  auto names = propagated_headers();
  for (auto&& key : *names) {
    auto value = context.incoming().get(key);
    if (!value.empty()) propagated = propagated.with_value(key, value);
  }
  return propagated;
}

void ServerHeaderInterceptor::report_cpu_usage(Context const& context) const {
  if (!enable_cpu_usage || sampler == nullptr) return;
  if (context.incoming().get(kCpuUsageRequestHeader) != "true") return;
  auto usage = sampler->usage();
  if (usage && *usage > 0) {
    context.set_response_metadata(kCpuUsageHeader, std::to_string(*usage));
  }
}

UnaryHandler ServerHeaderInterceptor::wrap_unary(UnaryHandler next) const {
  auto self = *this;
  return [next, self](Context const& context, pb::Message const& request, pb::Message* reply) {
    auto propagated = self.propagate(context);
    self.report_cpu_usage(propagated);
    return next(propagated, request, reply);
  };
}

StreamHandler ServerHeaderInterceptor::wrap_stream(StreamHandler next) const {
  auto self = *this;
  return [next, self](ServerStream* stream) {
    ContextedServerStream propagated(stream, self.propagate(stream->context()));
    self.report_cpu_usage(propagated.context());
    return next(&propagated);
  };
}

Context ClientHeaderInterceptor::attach(Context const& context) const {
  auto metadata = context.outgoing().with_replaced(kAppHeader, app_name());
  if (enable_cpu_usage) metadata = metadata.with_replaced(kCpuUsageRequestHeader, "true");
  auto address = local_address();
  if (!address.empty()) metadata = metadata.with_replaced(kClientIpHeader, address);

  auto names = propagated_headers();
  for (auto&& key : *names) {
    if (metadata.contains(key)) continue;
    auto value = propagated_value(context, key);
    if (!value.empty()) metadata = metadata.with(key, value);
  }
  return context.with_outgoing(metadata);
}

UnaryInvoker ClientHeaderInterceptor::wrap_unary(UnaryInvoker next) const {
  auto self = *this;
  return [next, self](Context const& context, std::string const& method,
                      pb::Message const& request, pb::Message* reply) {
    return next(self.attach(context), method, request, reply);
  };
}

Streamer ClientHeaderInterceptor::wrap_stream(Streamer next) const {
  auto self = *this;
  return [next, self](Context const& context, std::string const& method) {
    return next(self.attach(context), method);
  };
}

}  // namespace relay
