#pragma once

#include <functional>
#include <memory>
#include "context.hpp"
#include "status.hpp"

namespace relay {

// Server side of a streaming call, implemented by the transport
class ServerStream {
 public:
  virtual ~ServerStream() {}

  virtual Context const& context() const = 0;
  virtual Status send(pb::Message const& message) = 0;
  virtual Status recv(pb::Message* message) = 0;
};

// Forwards everything to the transport stream but reports a derived context
class ContextedServerStream : public ServerStream {
  ServerStream* stream;
  Context ctx;

 public:
  ContextedServerStream(ServerStream* stream, Context context)
      : stream(stream), ctx(std::move(context)) {}

  Context const& context() const override { return ctx; }
  Status send(pb::Message const& message) override { return stream->send(message); }
  Status recv(pb::Message* message) override { return stream->recv(message); }
};

// Client side of a streaming call, implemented by the transport. finish() ends the call and
// returns its final status.
class ClientStream {
 public:
  virtual ~ClientStream() {}

  virtual Status send(pb::Message const& message) = 0;
  virtual Status recv(pb::Message* message) = 0;
  virtual Status finish() = 0;
};

// Wraps a client stream to observe the end of the call. on_finish runs exactly once: when the
// call is finished or, if the stream is dropped before that, on destruction with CANCELLED.
class ObservedClientStream : public ClientStream {
 public:
  using FinishCallback = std::function<void(Status const&)>;

  ObservedClientStream(std::unique_ptr<ClientStream> stream, FinishCallback on_finish)
      : stream(std::move(stream)), on_finish(std::move(on_finish)) {}
  ~ObservedClientStream() override;

  Status send(pb::Message const& message) override { return stream->send(message); }
  Status recv(pb::Message* message) override { return stream->recv(message); }
  Status finish() override;

 private:
  void done(Status const& status);

  std::unique_ptr<ClientStream> stream;
  FinishCallback on_finish;
};

// Stream that failed before reaching the transport
class FailedClientStream : public ClientStream {
  Status status;

 public:
  explicit FailedClientStream(Status status) : status(std::move(status)) {}

  Status send(pb::Message const&) override { return status; }
  Status recv(pb::Message*) override { return status; }
  Status finish() override { return status; }
};

}  // namespace relay
