#include "log-interceptor.hpp"
#include "../../tracing.hpp"
#include "../call.hpp"
#include "../headers.hpp"

namespace relay {

namespace {

bool is_slow(AccessLogOptions const& options, pb::Duration const& cost) {
  return options.slow_threshold > pb::Duration() && cost > options.slow_threshold;
}

// Successful calls that are neither slow nor recovered are only logged with the access log on
bool must_log(AccessLogOptions const& options, Status const& status, bool slow,
              LogFields const& fields) {
  return status.code() != StatusCode::OK || slow || options.enable_access ||
         fields.contains("event");
}

void add_call_fields(LogFields& fields, CallType type, std::string const& method,
                     Status const& status, pb::Duration const& cost, bool slow) {
  auto failed = status.code() != StatusCode::OK;
  fields.reserve(16);
  fields.add("type", to_string(type));
  fields.add("code", http_status(status.code()));
  fields.add("ucode", static_cast<int>(status.code()));
  fields.add("desc", status.why());
  // a recovered call already carries its event
  if (!fields.contains("event")) fields.add("event", failed ? "error" : slow ? "slow" : "normal");
  fields.add("method", method);
  fields.add("cost", fmt::format("{:.3f}", to_milliseconds(cost)));
}

void add_context_fields(LogFields& fields, AccessLogOptions const& options,
                        Context const& context) {
  auto names = propagated_headers();
  for (auto&& key : *names) {
    auto value = propagated_value(context, key);
    if (!value.empty()) fields.add(key, value);
  }

  if (options.enable_trace && global_tracer_registered()) {
    auto id = trace_id(context);
    if (!id.empty()) fields.add("tid", id);
  }
}

void flush(spdlog::logger& log, LogFields& fields, Status const& status, bool slow) {
  if (status.code() != StatusCode::OK) {
    fields.add("err",
               fmt::format("code = {} desc = {}", StatusCode_Name(status.code()), status.why()));
    if (slow) fields.add("slow", true);
    auto level = is_server_fault(status.code()) ? spdlog::level::err : spdlog::level::warn;
    log.log(level, "access {}", fields.to_string());
  } else if (slow) {
    log.warn("slow {}", fields.to_string());
  } else {
    log.info("access {}", fields.to_string());
  }
}

AccessLogOptions make_options(bool access, bool req, bool res, bool trace,
                              pb::Duration const& slow_threshold) {
  AccessLogOptions options;
  options.enable_access = access;
  options.enable_req = req;
  options.enable_res = res;
  options.enable_trace = trace;
  options.slow_threshold = slow_threshold;
  return options;
}

}  // namespace

ServerLogInterceptor::ServerLogInterceptor(ServerConfig const& config,
                                           std::shared_ptr<spdlog::logger> logger)
    : options(make_options(config.enable_access_interceptor, config.enable_access_interceptor_req,
                           config.enable_access_interceptor_res, config.enable_trace_interceptor,
                           config.slow_log_threshold)),
      log(std::move(logger)) {}

UnaryHandler ServerLogInterceptor::wrap_unary(UnaryHandler next) const {
  auto options = this->options;
  auto log = this->log;
  return [next, options, log](Context const& context, pb::Message const& request,
                              pb::Message* reply) {
    auto started_at = current_time();
    auto fields = std::make_shared<LogFields>();
    auto status = next(context.with_fields(fields), request, reply);
    auto cost = current_time() - started_at;
    auto slow = is_slow(options, cost);
    if (!must_log(options, status, slow, *fields)) return status;

    add_call_fields(*fields, CallType::Unary, context.method(), status, cost, slow);
    fields->add("peer", peer_name(context));
    fields->add("ip", peer_ip(context));
    add_context_fields(*fields, options, context);
    if (options.enable_req) {
      fields->add("req", fmt::format("{{\"payload\":{},\"metadata\":{}}}", to_json(request),
                                     context.incoming().to_json()));
    }
    if (options.enable_res && reply != nullptr) {
      fields->add("res", fmt::format("{{\"payload\":{}}}", to_json(*reply)));
    }
    flush(*log, *fields, status, slow);
    return status;
  };
}

StreamHandler ServerLogInterceptor::wrap_stream(StreamHandler next) const {
  auto options = this->options;
  auto log = this->log;
  return [next, options, log](ServerStream* stream) {
    auto started_at = current_time();
    auto fields = std::make_shared<LogFields>();
    ContextedServerStream logged(stream, stream->context().with_fields(fields));
    auto status = next(&logged);
    auto cost = current_time() - started_at;
    auto slow = is_slow(options, cost);
    if (!must_log(options, status, slow, *fields)) return status;

    auto const& context = stream->context();
    add_call_fields(*fields, CallType::Stream, context.method(), status, cost, slow);
    fields->add("peer", peer_name(context));
    fields->add("ip", peer_ip(context));
    add_context_fields(*fields, options, context);
    flush(*log, *fields, status, slow);
    return status;
  };
}

ClientLogInterceptor::ClientLogInterceptor(ClientConfig const& config,
                                           std::shared_ptr<spdlog::logger> logger)
    : options(make_options(config.enable_access_interceptor, config.enable_access_interceptor_req,
                           config.enable_access_interceptor_res, config.enable_trace_interceptor,
                           config.slow_log_threshold)),
      target(config.target),
      log(std::move(logger)) {}

UnaryInvoker ClientLogInterceptor::wrap_unary(UnaryInvoker next) const {
  auto options = this->options;
  auto target = this->target;
  auto log = this->log;
  return [next, options, target, log](Context const& context, std::string const& method,
                                      pb::Message const& request, pb::Message* reply) {
    auto started_at = current_time();
    auto status = next(context, method, request, reply);
    auto cost = current_time() - started_at;
    auto slow = is_slow(options, cost);
    LogFields fields;
    if (!must_log(options, status, slow, fields)) return status;

    add_call_fields(fields, CallType::Unary, method, status, cost, slow);
    fields.add("name", target);
    add_context_fields(fields, options, context);
    if (options.enable_req) fields.add("req", to_json(request));
    if (options.enable_res && reply != nullptr) fields.add("res", to_json(*reply));
    flush(*log, fields, status, slow);
    return status;
  };
}

Streamer ClientLogInterceptor::wrap_stream(Streamer next) const {
  auto options = this->options;
  auto target = this->target;
  auto log = this->log;
  return [next, options, target, log](Context const& context, std::string const& method) {
    auto started_at = current_time();
    auto on_finish = [options, target, log, context, method, started_at](Status const& status) {
      auto cost = current_time() - started_at;
      auto slow = is_slow(options, cost);
      LogFields fields;
      if (!must_log(options, status, slow, fields)) return;

      add_call_fields(fields, CallType::Stream, method, status, cost, slow);
      fields.add("name", target);
      add_context_fields(fields, options, context);
      flush(*log, fields, status, slow);
    };
    return std::unique_ptr<ClientStream>(
        new ObservedClientStream(next(context, method), on_finish));
  };
}

}  // namespace relay
