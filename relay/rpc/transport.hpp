#pragma once

#include "../core.hpp"
#include "metadata.hpp"
#include "status.hpp"

namespace relay {

// Topic exchange every request and reply is published to
constexpr char const* kExchange = "relay";

rmq::Channel::ptr_t make_channel(std::string const& uri);

struct QueueOptions {
  // only this connection may consume, the queue is named after the consumer
  bool exclusive = true;
  // messages must be acknowledged by the consumer
  bool ack = false;
  // oldest messages are dropped beyond this length
  int max_length = 64;
};

// Declares an auto deleted queue on the exchange, bound to its own name, and starts consuming
// from it under tag.
void declare_queue(rmq::Channel::ptr_t const& channel, std::string const& name,
                   std::string const& tag, QueueOptions const& options = QueueOptions());

void publish(rmq::Channel::ptr_t const& channel, std::string const& topic,
             rmq::BasicMessage::ptr_t const& message);

// Next message for the consumer tag. Without a deadline it blocks until one arrives, otherwise
// it returns null when none arrives in time.
rmq::Envelope::ptr_t consume(rmq::Channel::ptr_t const& channel, std::string const& tag,
                             boost::optional<pb::Timestamp> const& deadline = boost::none);

void set_deadline(rmq::BasicMessage::ptr_t const& message, pb::Timestamp const& deadline);
boost::optional<pb::Timestamp> get_deadline(rmq::BasicMessage::ptr_t const& message);

// Call metadata carried in the AMQP header table. Headers used by the transport itself
// (rpc-status, deadline) are not part of it.
Metadata get_metadata(rmq::BasicMessage::ptr_t const& message);
void add_metadata(rmq::BasicMessage::ptr_t const& message, Metadata const& metadata);

void set_status(rmq::BasicMessage::ptr_t const& message, Status const& status);
// UNKNOWN when the message carries no status
Status rpc_status(rmq::Envelope::ptr_t const& envelope);

}  // namespace relay
