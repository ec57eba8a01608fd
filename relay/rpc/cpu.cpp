#include "cpu.hpp"
#include <fstream>
#include <sstream>

namespace relay {

boost::optional<uint64_t> ProcStatSampler::usage() {
  std::ifstream file(path);
  std::string line;
  if (!file || !std::getline(file, line)) return boost::none;

  // cpu  user nice system idle iowait irq softirq steal
  std::istringstream fields(line);
  std::string label;
  fields >> label;
  if (label != "cpu") return boost::none;

  uint64_t value = 0, total = 0, idle = 0;
  for (int column = 0; fields >> value; ++column) {
    if (column == 3 || column == 4) idle += value;
    if (column < 8) total += value;
  }

  std::lock_guard<std::mutex> lock(mutex);
  if (total <= last_total) return boost::none;
  auto delta_total = total - last_total;
  auto delta_idle = idle >= last_idle ? idle - last_idle : 0;
  last_total = total;
  last_idle = idle;
  if (delta_idle > delta_total) return boost::none;
  return (delta_total - delta_idle) * 1000 / delta_total;
}

}  // namespace relay
