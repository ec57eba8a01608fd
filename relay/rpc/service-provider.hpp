#pragma once

#include <functional>
#include <memory>
#include <unordered_map>
#include "../core.hpp"
#include "chain.hpp"
#include "context.hpp"
#include "status.hpp"
#include "transport.hpp"

namespace relay {

// Serves unary methods over AMQP. Every method is wrapped by the server chain built from the
// configuration given at construction.
class ServiceProvider {
  struct Method {
    std::function<std::unique_ptr<pb::Message>()> new_request;
    std::function<std::unique_ptr<pb::Message>()> new_reply;
    UnaryHandler handler;
    // answers requests that could not be decoded, going through the chain as well
    UnaryHandler reject;
  };

  rmq::Channel::ptr_t channel;
  std::unordered_map<std::string, Method> methods;
  ServerChain chain;
  std::string tag;

 public:
  explicit ServiceProvider(ServerConfig const& config = ServerConfig(),
                           Instruments const& instruments = Instruments())
      : chain(make_server_chain(config, instruments)), tag(consumer_id()) {}

  void connect(std::string const& uri) { channel = make_channel(uri); }
  void connect(rmq::Channel::ptr_t const& ch) { channel = ch; }

  rmq::Channel::ptr_t const& get_channel() const { return channel; }
  std::string const& get_tag() const { return tag; }
  ServerChain const& get_chain() const { return chain; }

  std::string declare_queue(std::string name, std::string const& id = "",
                            int queue_size = 64) const;

  // Bind a function to a particular topic, so everytime a message is received in this topic the
  // function will be called
  template <typename Request, typename Reply>
  void delegate(std::string const& queue, std::string const& name,
                std::function<Status(Context const&, Request const&, Reply*)> method);

  void serve(rmq::Envelope::ptr_t const& envelope) const;

  // Blocks the current thread listening for requests
  void run() const;
};

}  // namespace relay

// ===== Template Imlementations ==========
namespace relay {

template <typename Request, typename Reply>
void ServiceProvider::delegate(
    std::string const& queue, std::string const& name,
    std::function<Status(Context const&, Request const&, Reply*)> method) {
  std::string binding = fmt::format("{}.{}", queue, name);
  channel->BindQueue(queue, kExchange, binding);

  UnaryHandler handler = [method](Context const& context, pb::Message const& request,
                                  pb::Message* reply) {
    return method(context, static_cast<Request const&>(request), static_cast<Reply*>(reply));
  };
  UnaryHandler reject = [](Context const&, pb::Message const&, pb::Message*) {
    auto reason = fmt::format("Expected type '{}' but received something else",
                              Request::descriptor()->full_name());
    return make_status(StatusCode::FAILED_PRECONDITION, reason);
  };

  Method entry;
  entry.new_request = [] { return std::unique_ptr<pb::Message>(new Request()); };
  entry.new_reply = [] { return std::unique_ptr<pb::Message>(new Reply()); };
  entry.handler = chain.wrap_unary(handler);
  entry.reject = chain.wrap_unary(reject);
  methods[binding] = std::move(entry);
}

}  // namespace relay
