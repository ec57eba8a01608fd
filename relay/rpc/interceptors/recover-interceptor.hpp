#pragma once

#include <cstddef>
#include <functional>
#include "../interceptor.hpp"

namespace relay {

// Runs call and turns anything it throws into the status of the call, never letting an exception
// escape. A thrown Error reports its own status, anything else becomes INTERNAL_ERROR with the
// exception rendered as the reason. The stack trace and a "recover" event are added to the log
// fields of the context, or logged right away when the call has none.
Status recover(Context const& context, std::function<Status()> const& call) noexcept;

// Stack trace of the calling thread, truncated to max_size bytes
std::string capture_stack(std::size_t max_size = 4096);

// Innermost server stage: no exception thrown by a service reaches the layers above it
class RecoverInterceptor : public ServerInterceptor {
 public:
  std::string name() const override { return "recover"; }
  UnaryHandler wrap_unary(UnaryHandler next) const override;
  StreamHandler wrap_stream(StreamHandler next) const override;
};

}  // namespace relay
