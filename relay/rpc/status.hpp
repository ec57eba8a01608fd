#pragma once

#include <stdexcept>
#include "../core.hpp"

namespace relay {

Status make_status(StatusCode code, std::string const& why = "");

// Exception carrying the status a service wants to report. Thrown by a service implementation
// it is reported to the caller as is.
class Error : public std::runtime_error {
  Status stat;

 public:
  explicit Error(Status const& status);
  Error(StatusCode code, std::string const& why);

  Status const& status() const { return stat; }
};

// HTTP-like status a raw code normalizes to: 2xx success, 4xx caller fault, 5xx service fault.
int http_status(StatusCode code);

// Reason phrase of an HTTP-like status, "Unknown" for codes not produced by http_status
std::string http_status_text(int http_code);

inline bool is_server_fault(StatusCode code) {
  return http_status(code) >= 500;
}

}  // namespace relay
