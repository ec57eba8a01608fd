#include "headers.hpp"
#include <algorithm>
#include <atomic>

namespace relay {

namespace {

std::shared_ptr<const HeaderNames>& registry() {
  static std::shared_ptr<const HeaderNames> names = std::make_shared<const HeaderNames>();
  return names;
}

}  // namespace

std::shared_ptr<const HeaderNames> propagated_headers() {
  return std::atomic_load(&registry());
}

void set_propagated_headers(HeaderNames names) {
  auto snapshot = std::make_shared<HeaderNames>();
  snapshot->reserve(names.size());
  for (auto&& name : names) {
    if (name.empty()) continue;
    if (std::find(snapshot->begin(), snapshot->end(), name) == snapshot->end()) {
      snapshot->push_back(std::move(name));
    }
  }
  std::atomic_store(&registry(), std::shared_ptr<const HeaderNames>(std::move(snapshot)));
}

}  // namespace relay
