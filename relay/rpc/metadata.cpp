#include "metadata.hpp"
#include <spdlog/fmt/fmt.h>
#include <algorithm>
#include <cctype>
#include <iterator>

namespace relay {

namespace {

void append_json_string(fmt::memory_buffer& out, std::string const& value) {
  out.push_back('"');
  for (auto c : value) {
    switch (c) {
      case '"': fmt::format_to(std::back_inserter(out), "\\\""); break;
      case '\\': fmt::format_to(std::back_inserter(out), "\\\\"); break;
      case '\n': fmt::format_to(std::back_inserter(out), "\\n"); break;
      case '\t': fmt::format_to(std::back_inserter(out), "\\t"); break;
      default:
        if (static_cast<unsigned char>(c) < 0x20) {
          fmt::format_to(std::back_inserter(out), "\\u{:04x}", static_cast<int>(c));
        } else {
          out.push_back(c);
        }
    }
  }
  out.push_back('"');
}

}  // namespace

std::string to_lower(std::string key) {
  std::transform(key.begin(), key.end(), key.begin(),
                 [](unsigned char c) { return std::tolower(c); });
  return key;
}

Metadata::Metadata() : entries(std::make_shared<const Entries>()) {}

Metadata::Metadata(std::shared_ptr<const Entries> entries) : entries(std::move(entries)) {}

Metadata::Metadata(std::initializer_list<std::pair<std::string, std::string>> pairs) {
  auto fresh = std::make_shared<Entries>();
  for (auto&& pair : pairs) {
    (*fresh)[to_lower(pair.first)].push_back(pair.second);
  }
  entries = std::move(fresh);
}

Metadata Metadata::with(std::string const& key, std::string const& value) const {
  auto copy = std::make_shared<Entries>(*entries);
  (*copy)[to_lower(key)].push_back(value);
  return Metadata(std::move(copy));
}

Metadata Metadata::with_replaced(std::string const& key, std::string const& value) const {
  auto copy = std::make_shared<Entries>(*entries);
  (*copy)[to_lower(key)] = {value};
  return Metadata(std::move(copy));
}

Metadata Metadata::merged(Metadata const& other) const {
  if (other.empty()) return *this;
  auto copy = std::make_shared<Entries>(*entries);
  for (auto&& entry : other) {
    auto& values = (*copy)[entry.first];
    values.insert(values.end(), entry.second.begin(), entry.second.end());
  }
  return Metadata(std::move(copy));
}

bool Metadata::contains(std::string const& key) const {
  return entries->find(to_lower(key)) != entries->end();
}

std::vector<std::string> Metadata::values(std::string const& key) const {
  auto it = entries->find(to_lower(key));
  return it != entries->end() ? it->second : std::vector<std::string>{};
}

std::string Metadata::get(std::string const& key) const {
  auto it = entries->find(to_lower(key));
  if (it == entries->end() || it->second.empty()) return "";
  return it->second.front();
}

std::string Metadata::joined(std::string const& key) const {
  return fmt::format("{}", fmt::join(values(key), ","));
}

std::string Metadata::to_json() const {
  fmt::memory_buffer out;
  out.push_back('{');
  bool first_key = true;
  for (auto&& entry : *entries) {
    if (!first_key) out.push_back(',');
    first_key = false;
    append_json_string(out, entry.first);
    out.push_back(':');
    out.push_back('[');
    for (std::size_t i = 0; i < entry.second.size(); ++i) {
      if (i > 0) out.push_back(',');
      append_json_string(out, entry.second[i]);
    }
    out.push_back(']');
  }
  out.push_back('}');
  return fmt::to_string(out);
}

}  // namespace relay
