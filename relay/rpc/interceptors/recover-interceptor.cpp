#include "recover-interceptor.hpp"
#include <boost/exception/diagnostic_information.hpp>
#include <boost/stacktrace.hpp>

namespace relay {

std::string capture_stack(std::size_t max_size) {
  auto stack = boost::stacktrace::to_string(boost::stacktrace::stacktrace());
  if (stack.size() > max_size) stack.resize(max_size);
  return stack;
}

Status recover(Context const& context, std::function<Status()> const& call) noexcept {
  Status status;
  try {
    return call();
  } catch (Error const& e) {
    status = e.status();
  } catch (std::exception const& e) {
    status = make_status(StatusCode::INTERNAL_ERROR, e.what());
  } catch (std::string const& e) {
    status = make_status(StatusCode::INTERNAL_ERROR, e);
  } catch (char const* e) {
    status = make_status(StatusCode::INTERNAL_ERROR, e);
  } catch (...) {
    status = make_status(StatusCode::INTERNAL_ERROR,
                         boost::current_exception_diagnostic_information());
  }

  auto stack = capture_stack();
  if (auto fields = context.fields()) {
    fields->add("event", "recover");
    fields->add("stack", stack);
  } else {
    error("Recovered '{}' on {}\n{}", status.why(), context.method(), stack);
  }
  return status;
}

UnaryHandler RecoverInterceptor::wrap_unary(UnaryHandler next) const {
  return [next](Context const& context, pb::Message const& request, pb::Message* reply) {
    return recover(context, [&] { return next(context, request, reply); });
  };
}

StreamHandler RecoverInterceptor::wrap_stream(StreamHandler next) const {
  return [next](ServerStream* stream) {
    return recover(stream->context(), [&] { return next(stream); });
  };
}

}  // namespace relay
