#pragma once

#include <string>
#include "context.hpp"
#include "status.hpp"

namespace relay {

// Application name announced by the caller, "unknown" if it didn't announce one
std::string peer_name(Context const& context);

// Address of the caller: the client-ip header if present, else the host part of the transport
// peer address
std::string peer_ip(Context const& context);

// Value of a propagated header as seen by this call: from upstream, else from the incoming or the
// outgoing metadata
std::string propagated_value(Context const& context, std::string const& key);

double to_seconds(pb::Duration const& duration);
double to_milliseconds(pb::Duration const& duration);

// Reason phrase of the normalized status, used to label metrics
std::string outcome(Status const& status);

}  // namespace relay
