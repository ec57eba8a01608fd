#include "core.hpp"
#include <boost/date_time/gregorian/gregorian.hpp>
#include <boost/date_time/posix_time/posix_time.hpp>
#include <atomic>
#include <cstdlib>
#include <memory>

namespace relay {

namespace {

std::shared_ptr<const std::string>& app_name_storage() {
  static std::shared_ptr<const std::string> name = [] {
    auto env = std::getenv("RELAY_APP_NAME");
    return std::make_shared<const std::string>(env != nullptr && *env != '\0' ? env : hostname());
  }();
  return name;
}

}  // namespace

std::string make_random_uid() {
  return boost::uuids::to_string(boost::uuids::random_generator()());
}

std::string hostname() {
  return boost::asio::ip::host_name();
}

std::string local_address() {
  static std::string const address = [] {
    boost::asio::io_context context;
    boost::asio::ip::tcp::resolver resolver(context);
    boost::system::error_code error;
    auto results = resolver.resolve(hostname(), "0", error);
    if (error) {
      warn("Failed to resolve '{}': {}", hostname(), error.message());
      return std::string();
    }
    std::string loopback;
    for (auto&& entry : results) {
      auto ip = entry.endpoint().address();
      if (!ip.is_loopback()) return ip.to_string();
      if (loopback.empty()) loopback = ip.to_string();
    }
    return loopback;
  }();
  return address;
}

std::string consumer_id() {
  return fmt::format("{}/{}", hostname(), make_random_uid());
}

pb::Timestamp current_time() {
  const boost::posix_time::ptime epoch(boost::gregorian::date(1970, 1, 1));
  auto nanos = (boost::posix_time::microsec_clock::universal_time() - epoch).total_nanoseconds();
  pb::Timestamp timestamp;
  timestamp.set_seconds(nanos / 1000000000);
  timestamp.set_nanos(nanos % 1000000000);
  return timestamp;
}

std::string app_name() {
  return *std::atomic_load(&app_name_storage());
}

void set_app_name(std::string const& name) {
  std::atomic_store(&app_name_storage(), std::make_shared<const std::string>(name));
}

bool is_protobuf(rmq::Envelope::ptr_t const& envelope) {
  return envelope->Message()->ContentTypeIsSet() &&
         envelope->Message()->ContentType() == "application/x-protobuf";
}

bool is_json(rmq::Envelope::ptr_t const& envelope) {
  return envelope->Message()->ContentTypeIsSet() &&
         envelope->Message()->ContentType() == "application/json";
}

bool unpack(rmq::Envelope::ptr_t const& envelope, pb::Message* object) {
  auto const& body = envelope->Message()->Body();
  if (is_protobuf(envelope)) return object->ParseFromString(body);
  if (is_json(envelope)) return pb::JsonStringToMessage(body, object).ok();
  // User didn't provide a valid type, try all.
  if (pb::JsonStringToMessage(body, object).ok()) {
    envelope->Message()->ContentType("application/json");
    return true;
  }
  object->Clear();
  if (object->ParseFromString(body)) {
    envelope->Message()->ContentType("application/x-protobuf");
    return true;
  }
  return false;
}

rmq::BasicMessage::ptr_t pack_proto(pb::Message const& object) {
  std::string packed;
  object.SerializeToString(&packed);
  auto message = rmq::BasicMessage::Create(packed);
  message->ContentType("application/x-protobuf");
  return message;
}

rmq::BasicMessage::ptr_t pack_json(pb::Message const& object) {
  pb::JsonPrintOptions options;
  options.always_print_primitive_fields = true;
  std::string packed;
  if (!pb::MessageToJsonString(object, &packed, options).ok()) {
    warn("Failed to serialize '{}' to json", object.GetDescriptor()->full_name());
  }
  auto message = rmq::BasicMessage::Create(packed);
  message->ContentType("application/json");
  return message;
}

std::string to_json(pb::Message const& object) {
  std::string json;
  if (!pb::MessageToJsonString(object, &json).ok()) return object.ShortDebugString();
  return json;
}

}  // namespace relay
