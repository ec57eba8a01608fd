#pragma once

#include <functional>
#include <memory>
#include <string>
#include "context.hpp"
#include "status.hpp"
#include "stream.hpp"

namespace relay {

// Innermost stages of a call, provided by the service implementation (server) or by the
// transport (client).
using UnaryHandler =
    std::function<Status(Context const& context, pb::Message const& request, pb::Message* reply)>;
using StreamHandler = std::function<Status(ServerStream* stream)>;

using UnaryInvoker = std::function<Status(Context const& context, std::string const& method,
                                          pb::Message const& request, pb::Message* reply)>;
using Streamer = std::function<std::unique_ptr<ClientStream>(Context const& context,
                                                             std::string const& method)>;

// An Interceptor wraps the next stage of a call to run code before and after it. The wrapped
// stage must call next exactly once, or, for client streams, wrap the stream next returns so that
// the post work runs when the call ends. Interceptors are shared by all the calls going through
// a chain and must not keep per call state as members.
class ServerInterceptor {
 public:
  virtual ~ServerInterceptor() {}

  virtual std::string name() const = 0;
  virtual UnaryHandler wrap_unary(UnaryHandler next) const = 0;
  virtual StreamHandler wrap_stream(StreamHandler next) const = 0;
};

class ClientInterceptor {
 public:
  virtual ~ClientInterceptor() {}

  virtual std::string name() const = 0;
  virtual UnaryInvoker wrap_unary(UnaryInvoker next) const = 0;
  virtual Streamer wrap_stream(Streamer next) const = 0;
};

}  // namespace relay
