#pragma once

#include <cstddef>
#include <string>
#include <utility>
#include <vector>

namespace rgkb::net {

struct HttpRequest {
  std::string url;
  std::string body;
  std::vector<std::pair<std::string, std::string>> headers;
  long timeout_ms = 30000;
};

struct HttpResponse {
  long status = 0;
  std::string body;
};

// POST with a JSON body. Transport failures (DNS, connect, timeout) throw std::runtime_error;
// any HTTP status is returned to the caller.
HttpResponse PostJson(const HttpRequest& request);

// libcurl write callback appending to the std::string passed as userdata. Returns the number of
// bytes consumed, or 0 when the body cannot grow, which makes curl abort the transfer.
std::size_t AppendResponseBody(char* data, std::size_t size, std::size_t nmemb, void* userdata) noexcept;

}  // namespace rgkb::net
