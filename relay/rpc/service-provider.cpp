#include "service-provider.hpp"

namespace relay {

std::string ServiceProvider::declare_queue(std::string name, std::string const& id,
                                           int queue_size) const {
  QueueOptions options;
  options.exclusive = !id.empty();
  options.ack = true;
  options.max_length = queue_size;
  if (options.exclusive) name += '.' + id;
  relay::declare_queue(channel, name, tag, options);
  return name;
}

void ServiceProvider::serve(rmq::Envelope::ptr_t const& envelope) const {
  auto method = methods.find(envelope->RoutingKey());
  if (method != methods.end()) {
    auto message = envelope->Message();
    auto reply_to = message->ReplyToIsSet() ? message->ReplyTo() : "";
    auto context =
        Context().with_call(envelope->RoutingKey(), reply_to).with_incoming(get_metadata(message));

    CancelGuard guard;
    auto deadline = get_deadline(message);
    if (deadline) {
      auto scoped = context.with_deadline(*deadline);
      context = scoped.first;
      guard = std::move(scoped.second);
    }

    if (!context.deadline_exceeded()) {
      auto request = method->second.new_request();
      auto reply = method->second.new_reply();
      auto status = unpack(envelope, request.get())
                        ? method->second.handler(context, *request, reply.get())
                        : method->second.reject(context, *request, reply.get());

      if (!reply_to.empty() && !context.deadline_exceeded()) {
        auto packed = rmq::BasicMessage::Create();
        if (status.code() == StatusCode::OK) {
          packed = is_json(envelope) ? pack_json(*reply) : pack_proto(*reply);
        }
        if (message->CorrelationIdIsSet()) packed->CorrelationId(message->CorrelationId());
        add_metadata(packed, context.response_metadata());
        set_status(packed, status);
        publish(channel, reply_to, packed);
      }
    }
  }

  channel->BasicAck(envelope);
}

void ServiceProvider::run() const {
  for (;;) {
    serve(consume(channel, tag));
  }
}

}  // namespace relay
