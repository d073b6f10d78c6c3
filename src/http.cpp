#include "http.h"

#include "errors.h"
#include "trace.h"
#include "tui.h"
#include "util.h"

#include <curl/curl.h>

#include <charconv>
#include <cstdint>
#include <memory>
#include <mutex>
#include <stdexcept>
#include <string>

namespace rehearse {

namespace {

constexpr char kUserAgent[]{ "rehearse/0.1" };

size_t curl_write_string(char *ptr, size_t size, size_t nmemb, void *userdata) {
  auto *body{ static_cast<std::string *>(userdata) };
  size_t const total{ size * nmemb };
  body->append(ptr, total);
  return total;
}

size_t curl_header(char *buffer, size_t size, size_t nitems, void *userdata) {
  auto *response{ static_cast<http_response *>(userdata) };
  size_t const total{ size * nitems };
  std::string_view const line{ buffer, total };
  auto const colon{ line.find(':') };
  if (colon != std::string_view::npos &&
      util_to_lower(util_trim(line.substr(0, colon))) == "retry-after") {
    response->retry_after = http_parse_retry_after(util_trim(line.substr(colon + 1)));
  }
  return total;
}

void libcurl_ensure_initialized() {
  static std::once_flag once;
  std::call_once(once, [] {
    CURLcode const code{ curl_global_init(CURL_GLOBAL_DEFAULT) };
    if (code != CURLE_OK) {
      throw std::runtime_error(std::string("curl_global_init failed: ") +
                               curl_easy_strerror(code));
    }
  });
}

}  // namespace

std::optional<std::chrono::milliseconds> http_parse_retry_after(std::string const &value) {
  long seconds{ 0 };
  auto const *const first{ value.data() };
  auto const *const last{ value.data() + value.size() };
  auto const [ptr, ec]{ std::from_chars(first, last, seconds) };
  if (ec != std::errc{} || ptr != last || seconds < 0) { return std::nullopt; }
  return std::chrono::milliseconds{ seconds * 1000 };
}

http_response http_perform(http_request const &request, http_options const &options) {
  libcurl_ensure_initialized();

  std::unique_ptr<CURL, decltype(&curl_easy_cleanup)> handle{ curl_easy_init(),
                                                              &curl_easy_cleanup };
  if (!handle) { throw transport_error("curl_easy_init failed"); }

  auto const setopt = [handle = handle.get()](auto option, auto value) {
    CURLcode const rc{ curl_easy_setopt(handle, option, value) };
    if (rc != CURLE_OK) {
      throw transport_error(std::string("curl_easy_setopt failed: ") + curl_easy_strerror(rc));
    }
  };

  std::unique_ptr<curl_slist, decltype(&curl_slist_free_all)> headers{ nullptr,
                                                                       &curl_slist_free_all };
  for (auto const &[name, value] : request.headers) {
    auto const line{ name + ": " + value };
    curl_slist *next{ curl_slist_append(headers.get(), line.c_str()) };
    if (!next) { throw transport_error("curl_slist_append failed"); }
    headers.release();
    headers.reset(next);
  }

  http_response response;

  setopt(CURLOPT_URL, request.url.c_str());
  setopt(CURLOPT_CUSTOMREQUEST, request.method.c_str());
  setopt(CURLOPT_NOSIGNAL, 1L);
  setopt(CURLOPT_USERAGENT, kUserAgent);
  setopt(CURLOPT_TIMEOUT, static_cast<long>(options.timeout.count()));
  setopt(CURLOPT_SSL_VERIFYPEER, options.verify_ssl ? 1L : 0L);
  setopt(CURLOPT_SSL_VERIFYHOST, options.verify_ssl ? 2L : 0L);
  setopt(CURLOPT_HTTPHEADER, headers.get());
  setopt(CURLOPT_WRITEFUNCTION, curl_write_string);
  setopt(CURLOPT_WRITEDATA, &response.body);
  setopt(CURLOPT_HEADERFUNCTION, curl_header);
  setopt(CURLOPT_HEADERDATA, &response);
  setopt(CURLOPT_NOPROGRESS, 1L);
  if (request.body) {
    setopt(CURLOPT_POSTFIELDS, request.body->c_str());
    setopt(CURLOPT_POSTFIELDSIZE, static_cast<long>(request.body->size()));
  }

  auto const start{ std::chrono::steady_clock::now() };
  CURLcode const perform_result{ curl_easy_perform(handle.get()) };
  if (perform_result != CURLE_OK) {
    throw transport_error(request.method + " " + request.url +
                          " failed: " + curl_easy_strerror(perform_result));
  }
  if (CURLcode const rc{ curl_easy_getinfo(handle.get(), CURLINFO_RESPONSE_CODE, &response.status) };
      rc != CURLE_OK) {
    throw transport_error(std::string("curl_easy_getinfo failed: ") + curl_easy_strerror(rc));
  }

  auto const elapsed{ std::chrono::duration_cast<std::chrono::milliseconds>(
      std::chrono::steady_clock::now() - start) };
  REHEARSE_TRACE_HTTP_REQUEST(request.method,
                              request.url,
                              static_cast<std::int64_t>(response.status),
                              static_cast<std::int64_t>(elapsed.count()));
  return response;
}

http_transport_t http_make_transport(http_options options) {
  return [options](http_request const &request) { return http_perform(request, options); };
}

}  // namespace rehearse
