#include "stream.hpp"

namespace relay {

ObservedClientStream::~ObservedClientStream() {
  // inner layers observe the end of the call first
  stream.reset();
  if (on_finish) done(make_status(StatusCode::CANCELLED, "stream dropped before finish"));
}

Status ObservedClientStream::finish() {
  auto status = stream->finish();
  if (on_finish) done(status);
  return status;
}

void ObservedClientStream::done(Status const& status) {
  auto callback = std::move(on_finish);
  on_finish = nullptr;
  callback(status);
}

}  // namespace relay
