#pragma once

#include "../interceptor.hpp"

namespace relay {

// Gives calls made without a deadline one that expires after the default timeout. A deadline set
// by the caller is left untouched. The derived deadline is released when the call returns, or
// for streams, when the stream ends.
class DeadlineInterceptor : public ClientInterceptor {
  pb::Duration timeout;

 public:
  explicit DeadlineInterceptor(pb::Duration const& timeout) : timeout(timeout) {}

  std::string name() const override { return "deadline"; }
  UnaryInvoker wrap_unary(UnaryInvoker next) const override;
  Streamer wrap_stream(Streamer next) const override;
};

}  // namespace relay
