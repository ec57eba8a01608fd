#include "trace-interceptor.hpp"
#include <opentracing/ext/tags.h>
#include "../../tracing.hpp"

namespace relay {

namespace {

std::shared_ptr<ot::Span> start_span(ot::Tracer const& tracer, std::string const& name,
                                     ot::SpanContext const* parent, std::string const& kind) {
  auto span = parent != nullptr ? tracer.StartSpan(name, {ot::ChildOf(parent)})
                                : tracer.StartSpan(name);
  span->SetTag(ot::ext::span_kind, kind);
  span->SetTag(ot::ext::component, "rpc");
  return std::shared_ptr<ot::Span>(std::move(span));
}

std::shared_ptr<ot::Span> start_server_span(Context const& context, std::string const& kind) {
  auto tracer = ot::Tracer::Global();
  auto parent = extract(*tracer, context.incoming());
  return start_span(*tracer, context.method(), parent.get(), kind);
}

void finish(ot::Span& span, Status const& status) {
  if (status.code() != StatusCode::OK) {
    span.SetTag("code", static_cast<int>(status.code()));
    span.SetTag(ot::ext::error, true);
    span.Log({{"event", "error"}, {"message", status.why()}});
  }
  span.Finish();
}

}  // namespace

UnaryHandler ServerTraceInterceptor::wrap_unary(UnaryHandler next) const {
  return [next](Context const& context, pb::Message const& request, pb::Message* reply) {
    auto span = start_server_span(context, "server.unary");
    auto status = next(context.with_span(span), request, reply);
    finish(*span, status);
    return status;
  };
}

StreamHandler ServerTraceInterceptor::wrap_stream(StreamHandler next) const {
  return [next](ServerStream* stream) {
    auto span = start_server_span(stream->context(), "server.stream");
    ContextedServerStream traced(stream, stream->context().with_span(span));
    auto status = next(&traced);
    finish(*span, status);
    return status;
  };
}

UnaryInvoker ClientTraceInterceptor::wrap_unary(UnaryInvoker next) const {
  return [next](Context const& context, std::string const& method, pb::Message const& request,
                pb::Message* reply) {
    auto tracer = ot::Tracer::Global();
    auto parent = context.span() != nullptr ? &context.span()->context() : nullptr;
    auto span = start_span(*tracer, method, parent, "client");
    auto traced = context.with_span(span).with_outgoing(
        inject(*tracer, span->context(), context.outgoing()));
    auto status = next(traced, method, request, reply);
    finish(*span, status);
    return status;
  };
}

Streamer ClientTraceInterceptor::wrap_stream(Streamer next) const {
  return [next](Context const& context, std::string const& method) {
    auto tracer = ot::Tracer::Global();
    auto parent = context.span() != nullptr ? &context.span()->context() : nullptr;
    auto span = start_span(*tracer, method, parent, "client");
    auto traced = context.with_span(span).with_outgoing(
        inject(*tracer, span->context(), context.outgoing()));
    return std::unique_ptr<ClientStream>(new ObservedClientStream(
        next(traced, method), [span](Status const& status) { finish(*span, status); }));
  };
}

}  // namespace relay
