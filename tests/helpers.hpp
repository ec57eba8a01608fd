#pragma once

#include <spdlog/sinks/ringbuffer_sink.h>
#include <spdlog/spdlog.h>
#include <chrono>
#include <string>
#include <thread>
#include <vector>
#include "relay/rpc/cpu.hpp"
#include "relay/rpc/interceptor.hpp"

namespace relay {
namespace test {

struct Record {
  spdlog::level::level_enum level;
  std::string payload;
};

// Logger keeping the records in memory
class LogCapture {
  std::shared_ptr<spdlog::sinks::ringbuffer_sink_mt> sink;
  std::shared_ptr<spdlog::logger> log;

 public:
  LogCapture()
      : sink(std::make_shared<spdlog::sinks::ringbuffer_sink_mt>(32)),
        log(std::make_shared<spdlog::logger>("capture", sink)) {
    log->set_level(spdlog::level::trace);
  }

  std::shared_ptr<spdlog::logger> const& logger() const { return log; }

  std::vector<Record> records() const {
    std::vector<Record> records;
    for (auto&& msg : sink->last_raw()) {
      records.push_back(Record{msg.level, std::string(msg.payload.data(), msg.payload.size())});
    }
    return records;
  }
};

class FakeCpuSampler : public CpuSampler {
  boost::optional<uint64_t> value;

 public:
  int calls = 0;

  explicit FakeCpuSampler(boost::optional<uint64_t> value) : value(value) {}
  boost::optional<uint64_t> usage() override {
    ++calls;
    return value;
  }
};

class FakeServerStream : public ServerStream {
  Context ctx;

 public:
  explicit FakeServerStream(Context context) : ctx(std::move(context)) {}

  Context const& context() const override { return ctx; }
  Status send(pb::Message const&) override { return make_status(StatusCode::OK); }
  Status recv(pb::Message*) override { return make_status(StatusCode::OK); }
};

class FakeClientStream : public ClientStream {
  Status status;

 public:
  int finished = 0;

  explicit FakeClientStream(Status status = make_status(StatusCode::OK))
      : status(std::move(status)) {}

  Status send(pb::Message const&) override { return make_status(StatusCode::OK); }
  Status recv(pb::Message*) override { return make_status(StatusCode::OK); }
  Status finish() override {
    ++finished;
    return status;
  }
};

inline bool contains(std::string const& text, std::string const& part) {
  return text.find(part) != std::string::npos;
}

inline void sleep_ms(int ms) {
  std::this_thread::sleep_for(std::chrono::milliseconds(ms));
}

}  // namespace test
}  // namespace relay
