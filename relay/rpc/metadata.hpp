#pragma once

#include <initializer_list>
#include <map>
#include <memory>
#include <string>
#include <utility>
#include <vector>

namespace relay {

// Key/value bag shipped along with a call. Keys are case insensitive and stored in lower case,
// each key holds one or more values. A Metadata value is never modified once shared: every
// mutation returns a new instance and leaves the original untouched.
class Metadata {
 public:
  using Entries = std::map<std::string, std::vector<std::string>>;

  Metadata();
  Metadata(std::initializer_list<std::pair<std::string, std::string>> pairs);

  // Returns a copy with value appended to the values of key
  Metadata with(std::string const& key, std::string const& value) const;
  // Returns a copy where key holds only value
  Metadata with_replaced(std::string const& key, std::string const& value) const;
  // Returns a copy holding the entries of both, values of other appended after ours
  Metadata merged(Metadata const& other) const;

  bool contains(std::string const& key) const;
  std::vector<std::string> values(std::string const& key) const;
  // First value of key, empty if absent
  std::string get(std::string const& key) const;
  // All values of key joined with ","
  std::string joined(std::string const& key) const;

  bool empty() const { return entries->empty(); }
  std::size_t size() const { return entries->size(); }
  Entries::const_iterator begin() const { return entries->begin(); }
  Entries::const_iterator end() const { return entries->end(); }

  std::string to_json() const;

  friend bool operator==(Metadata const& lhs, Metadata const& rhs) {
    return *lhs.entries == *rhs.entries;
  }

 private:
  explicit Metadata(std::shared_ptr<const Entries> entries);

  std::shared_ptr<const Entries> entries;
};

std::string to_lower(std::string key);

}  // namespace relay
