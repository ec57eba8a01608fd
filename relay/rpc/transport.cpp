#include "transport.hpp"

namespace relay {

namespace {

bool is_transport_header(std::string const& key) {
  return key == "rpc-status" || key == "deadline";
}

}  // namespace

rmq::Channel::ptr_t make_channel(std::string const& uri) {
  return rmq::Channel::CreateFromUri(uri);
}

void declare_queue(rmq::Channel::ptr_t const& channel, std::string const& name,
                   std::string const& tag, QueueOptions const& options) {
  rmq::Table arguments{{rmq::TableKey("x-max-length"), rmq::TableValue(options.max_length)}};
  channel->DeclareExchange(kExchange, rmq::Channel::EXCHANGE_TYPE_TOPIC);
  channel->DeclareQueue(name, /*passive*/ false, /*durable*/ false, options.exclusive,
                        /*autodelete*/ true, arguments);
  channel->BindQueue(name, kExchange, name);
  // prefetch is only meaningful when messages are acknowledged
  channel->BasicConsume(name, tag, /*nolocal*/ false, /*noack*/ !options.ack, options.exclusive,
                        options.ack ? 1 : 0);
}

void publish(rmq::Channel::ptr_t const& channel, std::string const& topic,
             rmq::BasicMessage::ptr_t const& message) {
  if (!message->TimestampIsSet()) {
    message->Timestamp(pb::TimeUtil::TimestampToMilliseconds(current_time()));
  }
  channel->BasicPublish(kExchange, topic, message);
}

rmq::Envelope::ptr_t consume(rmq::Channel::ptr_t const& channel, std::string const& tag,
                             boost::optional<pb::Timestamp> const& deadline) {
  if (!deadline) return channel->BasicConsumeMessage(tag);

  rmq::Envelope::ptr_t envelope;
  auto ms = pb::TimeUtil::DurationToMilliseconds(*deadline - current_time());
  if (ms > 0) channel->BasicConsumeMessage(tag, envelope, static_cast<int>(ms));
  return envelope;
}

void set_deadline(rmq::BasicMessage::ptr_t const& message, pb::Timestamp const& deadline) {
  add_header(message, "deadline", deadline.SerializeAsString());
}

boost::optional<pb::Timestamp> get_deadline(rmq::BasicMessage::ptr_t const& message) {
  if (!message->HeaderTableIsSet()) return boost::none;
  auto const& headers = message->HeaderTable();
  auto header = headers.find("deadline");
  pb::Timestamp deadline;
  if (header == headers.end() || !deadline.ParseFromString(header->second.GetString())) {
    return boost::none;
  }
  return deadline;
}

Metadata get_metadata(rmq::BasicMessage::ptr_t const& message) {
  Metadata metadata;
  if (!message->HeaderTableIsSet()) return metadata;
  for (auto&& header : message->HeaderTable()) {
    if (is_transport_header(header.first)) continue;
    auto const& value = header.second;
    if (value.GetType() == rmq::TableValue::VT_string) {
      metadata = metadata.with(header.first, value.GetString());
    } else if (value.GetType() == rmq::TableValue::VT_array) {
      for (auto&& item : value.GetArray()) {
        if (item.GetType() == rmq::TableValue::VT_string)
          metadata = metadata.with(header.first, item.GetString());
      }
    }
  }
  return metadata;
}

void add_metadata(rmq::BasicMessage::ptr_t const& message, Metadata const& metadata) {
  if (metadata.empty()) return;
  auto table = message->HeaderTableIsSet() ? message->HeaderTable() : rmq::Table();
  for (auto&& entry : metadata) {
    if (entry.second.size() == 1) {
      table[rmq::TableKey(entry.first)] = rmq::TableValue(entry.second.front());
    } else {
      std::vector<rmq::TableValue> values(entry.second.begin(), entry.second.end());
      table[rmq::TableKey(entry.first)] = rmq::TableValue(values);
    }
  }
  message->HeaderTable(table);
}

void set_status(rmq::BasicMessage::ptr_t const& message, Status const& status) {
  std::string packed_status;
  pb::MessageToJsonString(status, &packed_status);
  add_header(message, "rpc-status", packed_status);
}

Status rpc_status(rmq::Envelope::ptr_t const& envelope) {
  if (envelope != nullptr && envelope->Message()->HeaderTableIsSet()) {
    auto headers = envelope->Message()->HeaderTable();
    auto header = headers.find("rpc-status");
    Status status;
    if (header != headers.end() &&
        pb::JsonStringToMessage(header->second.GetString(), &status).ok()) {
      return status;
    }
  }
  return make_status(StatusCode::UNKNOWN, "reply without status");
}

}  // namespace relay
