#include "log.hpp"
#include <spdlog/sinks/stdout_color_sinks.h>
#include <algorithm>
#include <iterator>

namespace relay {

std::shared_ptr<spdlog::logger> logger() {
  static auto ptr = [] {
    auto ptr = spdlog::stdout_color_mt("relay");
    ptr->set_pattern("[%L][%t][%d-%m-%Y %H:%M:%S:%e] %v");
    return ptr;
  }();
  return ptr;
}

int set_loglevel(char level) {
  if (level == 'i')
    spdlog::set_level(spdlog::level::info);
  else if (level == 'w')
    spdlog::set_level(spdlog::level::warn);
  else if (level == 'e')
    spdlog::set_level(spdlog::level::err);
  else
    return -1;  // failed
  return 0;     // success
}

void LogFields::add(std::string name, std::string value) {
  fields.emplace_back(std::move(name), std::move(value));
}

std::string LogFields::get(std::string const& name) const {
  auto it = std::find_if(fields.rbegin(), fields.rend(),
                         [&](auto const& field) { return field.first == name; });
  return it != fields.rend() ? it->second : "";
}

bool LogFields::contains(std::string const& name) const {
  return std::any_of(fields.begin(), fields.end(),
                     [&](auto const& field) { return field.first == name; });
}

std::string LogFields::to_string() const {
  fmt::memory_buffer out;
  for (auto&& field : fields) {
    if (out.size() > 0) out.push_back(' ');
    auto const& value = field.second;
    if (value.find_first_of(" \t\n") != std::string::npos) {
      fmt::format_to(std::back_inserter(out), "{}='{}'", field.first, value);
    } else {
      fmt::format_to(std::back_inserter(out), "{}={}", field.first, value);
    }
  }
  return fmt::to_string(out);
}

}  // namespace relay
