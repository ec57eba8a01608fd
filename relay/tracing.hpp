#pragma once

#include <opentracing/propagation.h>
#include <opentracing/tracer.h>
#include <cstdint>
#include <memory>
#include <string>
#include "rpc/context.hpp"
#include "rpc/metadata.hpp"

namespace relay {

namespace ot = opentracing;

// Reads and writes span contexts from/to call metadata
class MetadataCarrier : public ot::TextMapReader, public ot::TextMapWriter {
 public:
  explicit MetadataCarrier(Metadata& metadata) : metadata(metadata) {}

  ot::expected<void> Set(ot::string_view key, ot::string_view value) const override;

  ot::expected<void> ForeachKey(
      std::function<ot::expected<void>(ot::string_view key, ot::string_view value)> f)
      const override;

 private:
  Metadata& metadata;
};

// Tracer reporting to a zipkin collector
std::shared_ptr<ot::Tracer> make_zipkin_tracer(std::string const& name,
                                               std::string const& host = "localhost",
                                               uint32_t port = 9411);

// Installs the tracer used by the trace interceptors
void set_global_tracer(std::shared_ptr<ot::Tracer> tracer);
bool global_tracer_registered();

// Span context found in the metadata, null if there is none
std::unique_ptr<ot::SpanContext> extract(ot::Tracer const& tracer, Metadata const& metadata);

// Returns a copy of metadata carrying the span context
Metadata inject(ot::Tracer const& tracer, ot::SpanContext const& span, Metadata metadata);

// Trace id of the active span of the context, empty if the call is not being traced
std::string trace_id(Context const& context);

}  // namespace relay
