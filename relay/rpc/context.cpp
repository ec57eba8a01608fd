#include "context.hpp"

namespace relay {

CancelGuard& CancelGuard::operator=(CancelGuard&& other) noexcept {
  if (this != &other) {
    cancel();
    token = std::move(other.token);
  }
  return *this;
}

void CancelGuard::cancel() {
  if (token != nullptr) {
    token->cancel();
    token.reset();
  }
}

Context::Context()
    : values(std::make_shared<const std::map<std::string, std::string>>()),
      response(std::make_shared<ResponseMetadata>()) {}

std::string Context::value(std::string const& key) const {
  auto it = values->find(to_lower(key));
  return it != values->end() ? it->second : "";
}

Metadata Context::response_metadata() const {
  std::lock_guard<std::mutex> lock(response->mutex);
  return response->metadata;
}

void Context::set_response_metadata(std::string const& key, std::string const& value) const {
  std::lock_guard<std::mutex> lock(response->mutex);
  response->metadata = response->metadata.with(key, value);
}

void Context::set_response_metadata(Metadata const& metadata) const {
  std::lock_guard<std::mutex> lock(response->mutex);
  response->metadata = response->metadata.merged(metadata);
}

Context Context::with_call(std::string method, std::string peer) const {
  Context derived(*this);
  derived.method_name = std::move(method);
  derived.peer_address = std::move(peer);
  return derived;
}

Context Context::with_incoming(Metadata metadata) const {
  Context derived(*this);
  derived.in = std::move(metadata);
  return derived;
}

Context Context::with_outgoing(Metadata metadata) const {
  Context derived(*this);
  derived.out = std::move(metadata);
  return derived;
}

Context Context::with_value(std::string const& key, std::string const& value) const {
  auto copy = std::make_shared<std::map<std::string, std::string>>(*values);
  (*copy)[to_lower(key)] = value;
  Context derived(*this);
  derived.values = std::move(copy);
  return derived;
}

Context Context::with_span(std::shared_ptr<opentracing::Span> span) const {
  Context derived(*this);
  derived.active_span = std::move(span);
  return derived;
}

Context Context::with_fields(std::shared_ptr<LogFields> fields) const {
  Context derived(*this);
  derived.log_fields = std::move(fields);
  return derived;
}

Context Context::with_response() const {
  Context derived(*this);
  derived.response = std::make_shared<ResponseMetadata>();
  return derived;
}

std::pair<Context, CancelGuard> Context::with_deadline(pb::Timestamp const& deadline) const {
  auto token = std::make_shared<Cancellation>(cancellation);
  Context derived(*this);
  derived.cancellation = token;
  if (!deadline_at || deadline < *deadline_at) derived.deadline_at = deadline;
  return std::make_pair(std::move(derived), CancelGuard(token));
}

std::pair<Context, CancelGuard> Context::with_timeout(pb::Duration const& timeout) const {
  return with_deadline(current_time() + timeout);
}

}  // namespace relay
