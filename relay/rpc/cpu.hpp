#pragma once

#include <cstdint>
#include <mutex>
#include <string>
#include <utility>
#include <boost/optional.hpp>

namespace relay {

// Source of the local cpu utilization reported to callers
class CpuSampler {
 public:
  virtual ~CpuSampler() {}

  // Utilization in permille (0 to 1000), none if it can't be measured
  virtual boost::optional<uint64_t> usage() = 0;
};

// Busy share of all cpus since the previous sample, read from /proc/stat. The first sample
// covers the time since boot.
class ProcStatSampler : public CpuSampler {
  std::string path;
  std::mutex mutex;
  uint64_t last_total = 0;
  uint64_t last_idle = 0;

 public:
  explicit ProcStatSampler(std::string path = "/proc/stat") : path(std::move(path)) {}
  boost::optional<uint64_t> usage() override;
};

}  // namespace relay
