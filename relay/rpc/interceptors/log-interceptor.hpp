#pragma once

#include <spdlog/spdlog.h>
#include "../config.hpp"
#include "../interceptor.hpp"

namespace relay {

// Settings shared by the client and server access logs
struct AccessLogOptions {
  bool enable_access = false;
  bool enable_req = false;
  bool enable_res = false;
  bool enable_trace = false;
  pb::Duration slow_threshold;
};

// Writes one access log record per call. Failed calls are always logged, at error level when the
// failure is on the service side and at warn level otherwise; slow calls are logged at warn level;
// successful calls only when the access log is enabled. A call matching none of these is not
// logged and pays nothing for it.
class ServerLogInterceptor : public ServerInterceptor {
  AccessLogOptions options;
  std::shared_ptr<spdlog::logger> log;

 public:
  ServerLogInterceptor(ServerConfig const& config, std::shared_ptr<spdlog::logger> logger);

  std::string name() const override { return "access-log"; }
  UnaryHandler wrap_unary(UnaryHandler next) const override;
  StreamHandler wrap_stream(StreamHandler next) const override;
};

class ClientLogInterceptor : public ClientInterceptor {
  AccessLogOptions options;
  std::string target;
  std::shared_ptr<spdlog::logger> log;

 public:
  ClientLogInterceptor(ClientConfig const& config, std::shared_ptr<spdlog::logger> logger);

  std::string name() const override { return "access-log"; }
  UnaryInvoker wrap_unary(UnaryInvoker next) const override;
  Streamer wrap_stream(Streamer next) const override;
};

}  // namespace relay
