#include "metrics.hpp"
#include "../log.hpp"

namespace relay {

std::string to_string(CallType type) {
  return type == CallType::Unary ? "unary" : "stream";
}

MetricsCollector::MetricsCollector(std::shared_ptr<prometheus::Registry> const& reg,
                                   std::map<std::string, std::string> const& constant_labels)
    : registry(reg),
      client_counter(prometheus::BuildCounter()
                         .Name("relay_client_handle_total")
                         .Help("Number of calls made, by outcome")
                         .Labels(constant_labels)
                         .Register(*registry)),
      client_histogram(prometheus::BuildHistogram()
                           .Name("relay_client_handle_seconds")
                           .Help("Latency of the calls made in seconds")
                           .Labels(constant_labels)
                           .Register(*registry)),
      server_counter(prometheus::BuildCounter()
                         .Name("relay_server_handle_total")
                         .Help("Number of calls served, by outcome")
                         .Labels(constant_labels)
                         .Register(*registry)),
      server_histogram(prometheus::BuildHistogram()
                           .Name("relay_server_handle_seconds")
                           .Help("Latency of the calls served in seconds")
                           .Labels(constant_labels)
                           .Register(*registry)),
      boundaries{0.005, 0.01, 0.025, 0.05, 0.1, 0.25, 0.5, 1.0, 2.5, 5.0, 10.0} {}

void MetricsCollector::record(Side side, CallType type, std::string const& name,
                              std::string const& method, std::string const& peer,
                              std::string const& code, double seconds) noexcept {
  auto& counter = side == Side::Client ? client_counter : server_counter;
  auto& histogram = side == Side::Client ? client_histogram : server_histogram;
  auto kind = to_string(type);
  try {
    counter
        .Add({{"type", kind}, {"name", name}, {"method", method}, {"peer", peer}, {"code", code}})
        .Increment();
    histogram.Add({{"type", kind}, {"name", name}, {"method", method}, {"peer", peer}}, boundaries)
        .Observe(seconds);
  } catch (std::exception const& e) {
    warn("Failed to record metrics of '{}': {}", method, e.what());
  }
}

std::unique_ptr<prometheus::Exposer> expose_metrics(
    std::shared_ptr<prometheus::Registry> const& registry, std::string const& address) {
  auto exposer = std::make_unique<prometheus::Exposer>(address);
  exposer->RegisterCollectable(registry);
  return exposer;
}

}  // namespace relay
