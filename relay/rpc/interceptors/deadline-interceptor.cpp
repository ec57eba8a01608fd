#include "deadline-interceptor.hpp"

namespace relay {

UnaryInvoker DeadlineInterceptor::wrap_unary(UnaryInvoker next) const {
  auto timeout = this->timeout;
  return [next, timeout](Context const& context, std::string const& method,
                         pb::Message const& request, pb::Message* reply) {
    if (context.deadline() || timeout <= pb::Duration()) {
      return next(context, method, request, reply);
    }
    auto scoped = context.with_timeout(timeout);
    return next(scoped.first, method, request, reply);
  };
}

Streamer DeadlineInterceptor::wrap_stream(Streamer next) const {
  auto timeout = this->timeout;
  return [next, timeout](Context const& context, std::string const& method) {
    if (context.deadline() || timeout <= pb::Duration()) return next(context, method);

    auto scoped = context.with_timeout(timeout);
    auto guard = std::make_shared<CancelGuard>(std::move(scoped.second));
    auto stream = next(scoped.first, method);
    return std::unique_ptr<ClientStream>(new ObservedClientStream(
        std::move(stream), [guard](Status const&) { guard->cancel(); }));
  };
}

}  // namespace relay
