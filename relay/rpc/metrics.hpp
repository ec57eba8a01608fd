#pragma once

#include <prometheus/counter.h>
#include <prometheus/exposer.h>
#include <prometheus/family.h>
#include <prometheus/histogram.h>
#include <prometheus/registry.h>
#include <map>
#include <memory>
#include <string>

namespace relay {

enum class CallType { Unary, Stream };
enum class Side { Client, Server };

std::string to_string(CallType type);

/* Go to: https://github.com/jupp0r/prometheus-cpp/ for more API details;

  The collector registers the following families on the given registry:
    relay_{client,server}_handle_total   counter   {type, name, method, peer, code}
    relay_{client,server}_handle_seconds histogram {type, name, method, peer}

  Constant labels, e.g.: {"env", "staging"}, are added to every family.
*/
class MetricsCollector {
  std::shared_ptr<prometheus::Registry> registry;

  prometheus::Family<prometheus::Counter>& client_counter;
  prometheus::Family<prometheus::Histogram>& client_histogram;
  prometheus::Family<prometheus::Counter>& server_counter;
  prometheus::Family<prometheus::Histogram>& server_histogram;

  prometheus::Histogram::BucketBoundaries boundaries;

 public:
  explicit MetricsCollector(std::shared_ptr<prometheus::Registry> const& registry =
                                std::make_shared<prometheus::Registry>(),
                            std::map<std::string, std::string> const& constant_labels = {});

  // Counts one finished call and observes its latency. Safe to call from any number of threads;
  // a failure of the metrics backend is logged and never reaches the caller.
  void record(Side side, CallType type, std::string const& name, std::string const& method,
              std::string const& peer, std::string const& code, double seconds) noexcept;

  std::shared_ptr<prometheus::Registry> const& get_registry() const { return registry; }
};

// Serves the registry for scraping on the given "host:port"
std::unique_ptr<prometheus::Exposer> expose_metrics(
    std::shared_ptr<prometheus::Registry> const& registry, std::string const& address);

}  // namespace relay
