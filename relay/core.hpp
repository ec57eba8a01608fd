#pragma once

#include <SimpleAmqpClient/SimpleAmqpClient.h>
#include <google/protobuf/message.h>
#include <google/protobuf/util/json_util.h>
#include <google/protobuf/util/time_util.h>
#include <relay/msgs/common.pb.h>
#include <boost/asio.hpp>
#include <boost/optional.hpp>
#include <boost/program_options.hpp>
#include <boost/uuid/uuid.hpp>
#include <boost/uuid/uuid_generators.hpp>
#include <boost/uuid/uuid_io.hpp>
#include "log.hpp"

namespace relay {

namespace po = boost::program_options;
namespace rmq = AmqpClient;
namespace pb {
using namespace google::protobuf::util;
using namespace google::protobuf;
}  // namespace pb

using common::Status;
using common::StatusCode;

// Returns a unique id
std::string make_random_uid();

// Returns the machine hostname
std::string hostname();

// First address the hostname resolves to, preferring non loopback ones. Resolved once; empty if
// the hostname does not resolve.
std::string local_address();

// Tag to identify AMQP consumers. The hostname is used because normally container orchestration
// tools set the container hostname to be its id. The uid part is added to avoid name collisions
// when running outside a container.
std::string consumer_id();

// Return the timestamp that represents the current time with nanosecond precision in relation
// to the 1970/1/1 epoch.
pb::Timestamp current_time();

// Name this process announces to the services it calls. Defaults to the RELAY_APP_NAME
// environment variable or, if unset, to the hostname.
std::string app_name();
void set_app_name(std::string const& name);

// Add key value pair to the message header
template <typename T>
void add_header(rmq::BasicMessage::ptr_t const& message, std::string const& key, T const& value);

/* =================================
   Serialization / Deserialization
   ================================= */

// Check if the envelope contains a protobuf payload
bool is_protobuf(rmq::Envelope::ptr_t const& envelope);

// Check if the envelope contains a json payload
bool is_json(rmq::Envelope::ptr_t const& envelope);

// Tries to deserialize the contents of an envelope into the given message based on the
// content-type specified. If no content-type is provided the implementation will try all the
// supported types (First JSON then Protobuf).
bool unpack(rmq::Envelope::ptr_t const& envelope, pb::Message* object);

// Serializes the message to the protobuf binary protocol and use it as the message payload.
rmq::BasicMessage::ptr_t pack_proto(pb::Message const& object);

// Serializes the message to the json protocol and use it as the message payload.
rmq::BasicMessage::ptr_t pack_json(pb::Message const& object);

// Compact json rendering of a message, used for logging payloads.
std::string to_json(pb::Message const& object);

}  // namespace relay

// ===== Template Imlementations ==========
namespace relay {

template <typename T>
void add_header(rmq::BasicMessage::ptr_t const& message, std::string const& key, T const& value) {
  auto table = message->HeaderTableIsSet() ? message->HeaderTable() : rmq::Table();
  table[rmq::TableKey(key)] = rmq::TableValue(value);
  message->HeaderTable(table);
}

}  // namespace relay
