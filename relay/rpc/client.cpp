#include "client.hpp"

namespace relay {

Client::Client(rmq::Channel::ptr_t channel, ClientConfig const& config,
               Instruments const& instruments)
    : channel(std::move(channel)), chain(make_client_chain(config, instruments)) {
  tag = consumer_id();
  declare_queue(this->channel, tag, tag);
  invoker = chain.wrap_unary([this](Context const& context, std::string const& endpoint,
                                    pb::Message const& request, pb::Message* reply) {
    return invoke(context, endpoint, request, reply);
  });
}

Status Client::call(Context const& context, std::string const& endpoint,
                    pb::Message const& request, pb::Message* reply,
                    Metadata* response_metadata) const {
  return call_unary(invoker, context, endpoint, request, reply, response_metadata);
}

Status Client::invoke(Context const& context, std::string const& endpoint,
                      pb::Message const& request, pb::Message* reply) const {
  if (context.cancelled()) return make_status(StatusCode::CANCELLED, "call cancelled");
  if (context.deadline_exceeded()) {
    return make_status(StatusCode::DEADLINE_EXCEEDED, "deadline exceeded before the call");
  }

  auto message = pack_proto(request);
  auto id = make_random_uid();
  message->ReplyTo(tag);
  message->CorrelationId(id);
  add_metadata(message, context.outgoing());
  if (context.deadline()) set_deadline(message, *context.deadline());
  publish(channel, endpoint, message);

  for (;;) {
    auto envelope = consume(channel, tag, context.deadline());
    if (envelope == nullptr) {
      return make_status(StatusCode::DEADLINE_EXCEEDED,
                         fmt::format("no reply from '{}' before the deadline", endpoint));
    }
    // replies to calls that already gave up
    auto const& received = envelope->Message();
    if (!received->CorrelationIdIsSet() || received->CorrelationId() != id) continue;

    context.set_response_metadata(get_metadata(received));
    auto status = rpc_status(envelope);
    if (status.code() == StatusCode::OK && reply != nullptr && !unpack(envelope, reply)) {
      return make_status(StatusCode::INTERNAL_ERROR,
                         fmt::format("Expected type '{}' but received something else",
                                     reply->GetDescriptor()->full_name()));
    }
    return status;
  }
}

}  // namespace relay
