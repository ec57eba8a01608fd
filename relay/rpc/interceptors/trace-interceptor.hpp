#pragma once

#include "../interceptor.hpp"

namespace relay {

// Starts a span per call on the global tracer. Server spans continue the trace found in the
// incoming metadata; client spans are children of the span of the calling context and are
// injected in the outgoing metadata.
class ServerTraceInterceptor : public ServerInterceptor {
 public:
  std::string name() const override { return "trace"; }
  UnaryHandler wrap_unary(UnaryHandler next) const override;
  StreamHandler wrap_stream(StreamHandler next) const override;
};

class ClientTraceInterceptor : public ClientInterceptor {
 public:
  std::string name() const override { return "trace"; }
  UnaryInvoker wrap_unary(UnaryInvoker next) const override;
  Streamer wrap_stream(Streamer next) const override;
};

}  // namespace relay
