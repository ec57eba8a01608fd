#pragma once

#include <opentracing/span.h>
#include <atomic>
#include <map>
#include <memory>
#include <mutex>
#include <utility>
#include "../core.hpp"
#include "../log.hpp"
#include "metadata.hpp"

namespace relay {

// Cancellation state shared by a context and everything derived from it. A token is cancelled
// when it, or any of its ancestors, has been cancelled.
class Cancellation {
  std::shared_ptr<const Cancellation> parent;
  std::atomic<bool> flag;

 public:
  explicit Cancellation(std::shared_ptr<const Cancellation> parent = nullptr)
      : parent(std::move(parent)), flag(false) {}

  void cancel() { flag.store(true); }
  bool cancelled() const { return flag.load() || (parent != nullptr && parent->cancelled()); }
};

// Releases a derived cancellation scope when it goes out of scope
class CancelGuard {
  std::shared_ptr<Cancellation> token;

 public:
  CancelGuard() = default;
  explicit CancelGuard(std::shared_ptr<Cancellation> token) : token(std::move(token)) {}
  CancelGuard(CancelGuard&& other) noexcept : token(std::move(other.token)) {}
  CancelGuard& operator=(CancelGuard&& other) noexcept;
  CancelGuard(CancelGuard const&) = delete;
  CancelGuard& operator=(CancelGuard const&) = delete;
  ~CancelGuard() { cancel(); }

  void cancel();
};

// Everything a layer knows about the call it is handling. A Context is never modified after being
// handed to another layer; the with_* functions return a derived copy instead. Copies of the same
// call share the response metadata, which is written by the server side and read by the caller.
// A call made on behalf of another one starts its own with with_response().
class Context {
 public:
  Context();

  Metadata const& incoming() const { return in; }
  Metadata const& outgoing() const { return out; }
  std::string const& method() const { return method_name; }
  std::string const& peer() const { return peer_address; }

  boost::optional<pb::Timestamp> const& deadline() const { return deadline_at; }
  bool cancelled() const { return cancellation != nullptr && cancellation->cancelled(); }
  bool deadline_exceeded() const { return deadline_at && current_time() >= *deadline_at; }

  // Value propagated from upstream under key, empty if there is none
  std::string value(std::string const& key) const;

  std::shared_ptr<opentracing::Span> const& span() const { return active_span; }
  LogFields* fields() const { return log_fields.get(); }

  Metadata response_metadata() const;
  void set_response_metadata(std::string const& key, std::string const& value) const;
  void set_response_metadata(Metadata const& metadata) const;

  Context with_call(std::string method, std::string peer) const;
  Context with_incoming(Metadata metadata) const;
  Context with_outgoing(Metadata metadata) const;
  Context with_value(std::string const& key, std::string const& value) const;
  Context with_span(std::shared_ptr<opentracing::Span> span) const;
  Context with_fields(std::shared_ptr<LogFields> fields) const;
  // Same context with a new, empty, response metadata
  Context with_response() const;

  // Derive a context that expires at the given time, or at the current deadline if that one is
  // earlier. The derived context is cancelled when the returned guard is destroyed.
  std::pair<Context, CancelGuard> with_deadline(pb::Timestamp const& deadline) const;
  std::pair<Context, CancelGuard> with_timeout(pb::Duration const& timeout) const;

 private:
  struct ResponseMetadata {
    std::mutex mutex;
    Metadata metadata;
  };

  Metadata in;
  Metadata out;
  std::string method_name;
  std::string peer_address;
  boost::optional<pb::Timestamp> deadline_at;
  std::shared_ptr<Cancellation> cancellation;
  std::shared_ptr<const std::map<std::string, std::string>> values;
  std::shared_ptr<opentracing::Span> active_span;
  std::shared_ptr<LogFields> log_fields;
  std::shared_ptr<ResponseMetadata> response;
};

}  // namespace relay
