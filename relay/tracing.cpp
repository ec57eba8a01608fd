#include "tracing.hpp"
#include <zipkin/opentracing.h>
#include <atomic>

namespace relay {

namespace zk = zipkin;

namespace {

std::atomic<bool> tracer_registered{false};

}  // namespace

ot::expected<void> MetadataCarrier::Set(ot::string_view key, ot::string_view value) const {
  metadata =
      metadata.with_replaced(static_cast<std::string>(key), static_cast<std::string>(value));
  return {};
}

ot::expected<void> MetadataCarrier::ForeachKey(
    std::function<ot::expected<void>(ot::string_view key, ot::string_view value)> f) const {
  for (auto const& key_value : metadata) {
    if (key_value.second.empty()) continue;
    auto result = f(key_value.first, key_value.second.front());
    if (!result) return result;
  }
  return {};
}

std::shared_ptr<ot::Tracer> make_zipkin_tracer(std::string const& name, std::string const& host,
                                               uint32_t port) {
  zk::ZipkinOtTracerOptions options;
  options.collector_host = host;
  options.collector_port = port;
  options.service_name = name;
  return zk::makeZipkinOtTracer(options);
}

void set_global_tracer(std::shared_ptr<ot::Tracer> tracer) {
  ot::Tracer::InitGlobal(std::move(tracer));
  tracer_registered.store(true);
}

bool global_tracer_registered() {
  return tracer_registered.load();
}

std::unique_ptr<ot::SpanContext> extract(ot::Tracer const& tracer, Metadata const& metadata) {
  auto copy = metadata;
  MetadataCarrier carrier(copy);
  auto maybe_span = tracer.Extract(static_cast<ot::TextMapReader const&>(carrier));
  if (!maybe_span) return nullptr;
  return std::move(*maybe_span);
}

Metadata inject(ot::Tracer const& tracer, ot::SpanContext const& span, Metadata metadata) {
  MetadataCarrier carrier(metadata);
  tracer.Inject(span, static_cast<ot::TextMapWriter const&>(carrier));
  return metadata;
}

std::string trace_id(Context const& context) {
  if (context.span() == nullptr) return "";
  return context.span()->context().ToTraceID();
}

}  // namespace relay
