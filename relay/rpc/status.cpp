#include "status.hpp"

namespace relay {

Status make_status(StatusCode code, std::string const& why) {
  Status status;
  status.set_code(code);
  status.set_why(why);
  return status;
}

Error::Error(Status const& status) : std::runtime_error(status.why()), stat(status) {}

Error::Error(StatusCode code, std::string const& why)
    : std::runtime_error(why), stat(make_status(code, why)) {}

int http_status(StatusCode code) {
  switch (code) {
    case StatusCode::OK: return 200;
    case StatusCode::CANCELLED: return 499;
    case StatusCode::UNKNOWN: return 500;
    case StatusCode::INVALID_ARGUMENT: return 400;
    case StatusCode::DEADLINE_EXCEEDED: return 504;
    case StatusCode::NOT_FOUND: return 404;
    case StatusCode::ALREADY_EXISTS: return 409;
    case StatusCode::PERMISSION_DENIED: return 403;
    case StatusCode::UNAUTHENTICATED: return 401;
    case StatusCode::RESOURCE_EXHAUSTED: return 429;
    case StatusCode::FAILED_PRECONDITION: return 400;
    case StatusCode::ABORTED: return 409;
    case StatusCode::OUT_OF_RANGE: return 400;
    case StatusCode::UNIMPLEMENTED: return 501;
    case StatusCode::INTERNAL_ERROR: return 500;
    case StatusCode::UNAVAILABLE: return 503;
    case StatusCode::DATA_LOSS: return 500;
    default: return 500;
  }
}

std::string http_status_text(int http_code) {
  switch (http_code) {
    case 200: return "OK";
    case 400: return "Bad Request";
    case 401: return "Unauthorized";
    case 403: return "Forbidden";
    case 404: return "Not Found";
    case 409: return "Conflict";
    case 429: return "Too Many Requests";
    case 499: return "Client Closed Request";
    case 500: return "Internal Server Error";
    case 501: return "Not Implemented";
    case 503: return "Service Unavailable";
    case 504: return "Gateway Timeout";
    default: return "Unknown";
  }
}

}  // namespace relay
