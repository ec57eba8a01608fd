#include <relay/relay.hpp>
#include "hello.pb.h"

int main(int argc, char** argv) {
  using hello::GreeterReply;
  using hello::GreeterRequest;

  std::string uri, service_name, metrics_address, zipkin_host;
  uint32_t zipkin_port;
  relay::ServerConfig config;
  config.name = "Greeter";

  // Define our parser to read command line arguments
  relay::po::options_description opts("Options");
  auto opt_add = opts.add_options();
  opt_add("uri,u", relay::po::value<std::string>(&uri)->required(), "amqp broker uri");
  opt_add("queue,q", relay::po::value<std::string>(&service_name)->default_value("Greeter"),
          "queue the requests are consumed from");
  opt_add("metrics-address",
          relay::po::value<std::string>(&metrics_address)->default_value("0.0.0.0:8080"),
          "address metrics are exposed on");
  opt_add("zipkin-host", relay::po::value<std::string>(&zipkin_host)->default_value(""),
          "zipkin collector host, tracing is disabled when empty");
  opt_add("zipkin-port", relay::po::value<uint32_t>(&zipkin_port)->default_value(9411),
          "zipkin collector port");
  opts.add(relay::server_options(&config));
  opts.add(relay::header_options());
  relay::parse_program_options(argc, argv, opts);

  if (!zipkin_host.empty()) {
    relay::set_global_tracer(relay::make_zipkin_tracer(config.name, zipkin_host, zipkin_port));
  }
  auto exposer = relay::expose_metrics(relay::default_metrics()->get_registry(), metrics_address);

  relay::ServiceProvider provider(config);
  provider.connect(uri);  // Connect to the AMQP broker

  // Declares a queue with "service_name" on the broker to storage service requests.
  auto tag = provider.declare_queue(service_name);

  // Delegate the callback that is going to be executed when we receive a Hello request.
  provider.delegate<GreeterRequest, GreeterReply>(
      tag, "Hello", [](relay::Context const& context, GreeterRequest const& request,
                       GreeterReply* reply) {
        // Check if request data is valid
        if (request.name().empty())
          return relay::make_status(relay::StatusCode::INVALID_ARGUMENT, "Name can't be empty");
        // Fill our reply
        *reply->mutable_greeting() = fmt::format("Hello {}, how are you ? :)", request.name());
        // Values of the propagated headers are available to the service
        auto user = context.value("x-user");
        if (!user.empty()) *reply->mutable_greeting() += fmt::format(" (asked by {})", user);
        return relay::make_status(relay::StatusCode::OK);
      });

  // If one of the services throw (like this one) the caller (client) will be notified with an
  // INTERNAL_ERROR and the stack trace ends up in the access log
  provider.delegate<GreeterRequest, GreeterReply>(
      tag, "Throw",
      [](relay::Context const&, GreeterRequest const&, GreeterReply*) -> relay::Status {
        throw std::runtime_error("My exception message");
      });

  relay::info("Listening for incoming requests...");
  provider.run();  // blocks forever
}
