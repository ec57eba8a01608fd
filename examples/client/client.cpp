#include <relay/relay.hpp>
#include "hello.pb.h"

using hello::GreeterReply;
using hello::GreeterRequest;

int main(int argc, char** argv) {
  std::string uri, endpoint, user;
  relay::ClientConfig config;
  config.name = "greeter-client";
  config.target = "Greeter";
  config.enable_access_interceptor = true;

  // Define our parser to read command line arguments
  relay::po::options_description opts("Options");
  auto opt_add = opts.add_options();
  opt_add("uri,u", relay::po::value<std::string>(&uri)->required(), "amqp broker uri");
  opt_add("endpoint,e",
          relay::po::value<std::string>(&endpoint)->default_value("Greeter.Hello"),
          "service endpoint");
  opt_add("user", relay::po::value<std::string>(&user)->default_value("jon"),
          "value sent in the x-user header");
  opts.add(relay::client_options(&config));
  relay::parse_program_options(argc, argv, opts);

  relay::set_propagated_headers({"x-user"});
  relay::Client client(relay::make_channel(uri), config);

  GreeterRequest request;
  request.set_name("John Snow");
  GreeterReply reply;

  // Propagated values of the context are sent along with the request
  auto context = relay::Context().with_value("x-user", user);
  auto status = client.call(context, endpoint, request, &reply);
  if (status.code() == relay::StatusCode::OK) {
    relay::info("Reply: {}", relay::to_json(reply));
  } else {
    relay::error("RPC failed: {}", relay::to_json(status));
    return -1;
  }
}
