#pragma once

#include <string>
#include "../core.hpp"
#include "chain.hpp"
#include "context.hpp"
#include "status.hpp"
#include "transport.hpp"

namespace relay {

// Calls unary methods served by a ServiceProvider. Every call goes through the client chain built
// from the configuration given at construction. Calls on the same client must not overlap since
// they share the channel and the reply queue.
class Client {
  rmq::Channel::ptr_t channel;
  std::string tag;
  ClientChain chain;
  UnaryInvoker invoker;

 public:
  Client(rmq::Channel::ptr_t channel, ClientConfig const& config = ClientConfig(),
         Instruments const& instruments = Instruments());
  Client(Client const&) = delete;
  Client& operator=(Client const&) = delete;

  ClientChain const& get_chain() const { return chain; }

  // Call method endpoint (e.g. "Greeter.SayHello") with the context outgoing metadata. The
  // metadata the service answered with is stored in response_metadata when given; the response
  // metadata of context itself is left untouched.
  Status call(Context const& context, std::string const& endpoint, pb::Message const& request,
              pb::Message* reply, Metadata* response_metadata = nullptr) const;

 private:
  Status invoke(Context const& context, std::string const& endpoint, pb::Message const& request,
                pb::Message* reply) const;
};

}  // namespace relay
