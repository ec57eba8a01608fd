#include "metrics-interceptor.hpp"
#include "../call.hpp"

namespace relay {

ServerMetricsInterceptor::ServerMetricsInterceptor(std::shared_ptr<MetricsCollector> collector,
                                                   std::string service)
    : collector(std::move(collector)), service(std::move(service)) {}

UnaryHandler ServerMetricsInterceptor::wrap_unary(UnaryHandler next) const {
  auto collector = this->collector;
  auto service = this->service;
  return [next, collector, service](Context const& context, pb::Message const& request,
                                    pb::Message* reply) {
    auto started_at = current_time();
    auto status = next(context, request, reply);
    collector->record(Side::Server, CallType::Unary, service, context.method(),
                      peer_name(context), outcome(status),
                      to_seconds(current_time() - started_at));
    return status;
  };
}

StreamHandler ServerMetricsInterceptor::wrap_stream(StreamHandler next) const {
  auto collector = this->collector;
  auto service = this->service;
  return [next, collector, service](ServerStream* stream) {
    auto started_at = current_time();
    auto status = next(stream);
    auto const& context = stream->context();
    collector->record(Side::Server, CallType::Stream, service, context.method(),
                      peer_name(context), outcome(status),
                      to_seconds(current_time() - started_at));
    return status;
  };
}

ClientMetricsInterceptor::ClientMetricsInterceptor(std::shared_ptr<MetricsCollector> collector,
                                                   std::string client, std::string target)
    : collector(std::move(collector)), client(std::move(client)), target(std::move(target)) {}

UnaryInvoker ClientMetricsInterceptor::wrap_unary(UnaryInvoker next) const {
  auto collector = this->collector;
  auto client = this->client;
  auto target = this->target;
  return [next, collector, client, target](Context const& context, std::string const& method,
                                           pb::Message const& request, pb::Message* reply) {
    auto started_at = current_time();
    auto status = next(context, method, request, reply);
    collector->record(Side::Client, CallType::Unary, client, method, target, outcome(status),
                      to_seconds(current_time() - started_at));
    return status;
  };
}

Streamer ClientMetricsInterceptor::wrap_stream(Streamer next) const {
  auto collector = this->collector;
  auto client = this->client;
  auto target = this->target;
  return [next, collector, client, target](Context const& context, std::string const& method) {
    auto started_at = current_time();
    auto on_finish = [collector, client, target, method, started_at](Status const& status) {
      collector->record(Side::Client, CallType::Stream, client, method, target, outcome(status),
                        to_seconds(current_time() - started_at));
    };
    return std::unique_ptr<ClientStream>(
        new ObservedClientStream(next(context, method), on_finish));
  };
}

}  // namespace relay
