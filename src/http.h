#pragma once

#include <chrono>
#include <functional>
#include <optional>
#include <string>
#include <utility>
#include <vector>

namespace rehearse {

struct http_request {
  std::string method;  // "GET", "POST", "PUT", "DELETE"
  std::string url;
  std::vector<std::pair<std::string, std::string>> headers;
  std::optional<std::string> body;
};

struct http_response {
  long status{ 0 };
  std::string body;
  std::optional<std::chrono::milliseconds> retry_after;  // From a Retry-After header
};

// Performs one request. Non-2xx statuses are returned, not thrown; only
// failures to talk to the server at all throw.
using http_transport_t = std::function<http_response(http_request const &)>;

struct http_options {
  bool verify_ssl{ true };
  std::chrono::seconds timeout{ 60 };
};

// libcurl transport. Throws transport_error when the request cannot complete.
http_response http_perform(http_request const &request, http_options const &options);

http_transport_t http_make_transport(http_options options);

// Parse a Retry-After value given in seconds; HTTP dates are not supported.
std::optional<std::chrono::milliseconds> http_parse_retry_after(std::string const &value);

}  // namespace rehearse
