#pragma once

#include <memory>
#include <string>
#include <vector>

namespace relay {

// Well known metadata keys
constexpr char const* kAppHeader = "app";
constexpr char const* kClientIpHeader = "client-ip";
constexpr char const* kCpuUsageRequestHeader = "enable-cpu-usage";
constexpr char const* kCpuUsageHeader = "cpu-usage";

using HeaderNames = std::vector<std::string>;

// Process wide set of header names that are extracted from incoming calls, written to the access
// logs and attached again to outgoing calls. Readers get an immutable snapshot; an update
// replaces the whole set at once so a reader sees either the old or the new set, never a mix.
std::shared_ptr<const HeaderNames> propagated_headers();

// Duplicated names are dropped, the first occurrence keeps its position
void set_propagated_headers(HeaderNames names);

}  // namespace relay
