#pragma once

#include <spdlog/fmt/ostr.h>
#include <spdlog/spdlog.h>
#include <cstdlib>
#include <string>
#include <utility>
#include <vector>

namespace relay {

std::shared_ptr<spdlog::logger> logger();

template <class... Args>
inline void info(Args&&... args) {
  logger()->info(std::forward<Args>(args)...);
}

template <class... Args>
inline void warn(Args&&... args) {
  logger()->warn(std::forward<Args>(args)...);
}

template <class... Args>
inline void error(Args&&... args) {
  logger()->error(std::forward<Args>(args)...);
}

template <class... Args>
inline void critical(Args&&... args) {
  logger()->critical(std::forward<Args>(args)...);
  std::exit(-1);
}

// Returns 0 on success, -1 if the level is not one of i[nfo], w[arn] or e[rror]
int set_loglevel(char level);

// Ordered set of named values attached to a single log record. Names may repeat, the record
// renders them in insertion order as "name=value" pairs. Nothing is allocated until the first
// field is added or room is reserved.
class LogFields {
  std::vector<std::pair<std::string, std::string>> fields;

 public:
  void reserve(std::size_t extra) { fields.reserve(fields.size() + extra); }

  void add(std::string name, std::string value);

  template <typename T>
  void add(std::string name, T const& value) {
    add(std::move(name), fmt::format("{}", value));
  }

  // Last value added under name, or empty if there is none
  std::string get(std::string const& name) const;
  bool contains(std::string const& name) const;

  std::size_t size() const { return fields.size(); }
  std::vector<std::pair<std::string, std::string>> const& values() const { return fields; }

  std::string to_string() const;
};

}  // namespace relay
