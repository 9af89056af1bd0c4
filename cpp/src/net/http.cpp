#include "rgkb/net/http.hpp"

#include <curl/curl.h>

#include <exception>
#include <sstream>
#include <stdexcept>
#include <string>

namespace rgkb::net {
namespace {

class CurlGlobal {
 public:
  CurlGlobal() {
    const CURLcode code = curl_global_init(CURL_GLOBAL_DEFAULT);
    if (code != CURLE_OK) {
      throw std::runtime_error("curl_global_init failed");
    }
  }

  ~CurlGlobal() { curl_global_cleanup(); }

  CurlGlobal(const CurlGlobal&) = delete;
  CurlGlobal& operator=(const CurlGlobal&) = delete;
};

void EnsureCurlGlobal() {
  static const CurlGlobal global{};
  (void)global;
}

class EasyHandle {
 public:
  EasyHandle() : handle_(curl_easy_init()) {
    if (handle_ == nullptr) {
      throw std::runtime_error("curl_easy_init failed");
    }
  }

  ~EasyHandle() {
    if (headers_ != nullptr) {
      curl_slist_free_all(headers_);
    }
    curl_easy_cleanup(handle_);
  }

  EasyHandle(const EasyHandle&) = delete;
  EasyHandle& operator=(const EasyHandle&) = delete;

  CURL* get() const { return handle_; }

  void AppendHeader(const std::string& line) { headers_ = curl_slist_append(headers_, line.c_str()); }
  curl_slist* headers() const { return headers_; }

 private:
  CURL* handle_ = nullptr;
  curl_slist* headers_ = nullptr;
};

}  // namespace

std::size_t AppendResponseBody(char* data, std::size_t size, std::size_t nmemb, void* userdata) noexcept {
  const std::size_t total = size * nmemb;
  auto* buffer = static_cast<std::string*>(userdata);
  try {
    buffer->append(data, total);
  } catch (const std::exception&) {
    return 0;
  }
  return total;
}

HttpResponse PostJson(const HttpRequest& request) {
  EnsureCurlGlobal();
  EasyHandle handle;

  HttpResponse response{};
  curl_easy_setopt(handle.get(), CURLOPT_URL, request.url.c_str());
  curl_easy_setopt(handle.get(), CURLOPT_POST, 1L);
  curl_easy_setopt(handle.get(), CURLOPT_POSTFIELDS, request.body.c_str());
  curl_easy_setopt(handle.get(), CURLOPT_POSTFIELDSIZE, static_cast<long>(request.body.size()));
  curl_easy_setopt(handle.get(), CURLOPT_WRITEFUNCTION, AppendResponseBody);
  curl_easy_setopt(handle.get(), CURLOPT_WRITEDATA, &response.body);
  curl_easy_setopt(handle.get(), CURLOPT_NOSIGNAL, 1L);
  if (request.timeout_ms > 0) {
    curl_easy_setopt(handle.get(), CURLOPT_TIMEOUT_MS, request.timeout_ms);
    curl_easy_setopt(handle.get(), CURLOPT_CONNECTTIMEOUT_MS, request.timeout_ms);
  }

  handle.AppendHeader("Content-Type: application/json");
  for (const auto& [name, value] : request.headers) {
    handle.AppendHeader(name + ": " + value);
  }
  curl_easy_setopt(handle.get(), CURLOPT_HTTPHEADER, handle.headers());

  const CURLcode code = curl_easy_perform(handle.get());
  if (code != CURLE_OK) {
    std::ostringstream oss;
    oss << "[http] POST " << request.url << " failed: " << curl_easy_strerror(code);
    throw std::runtime_error(oss.str());
  }
  curl_easy_getinfo(handle.get(), CURLINFO_RESPONSE_CODE, &response.status);
  return response;
}

}  // namespace rgkb::net
