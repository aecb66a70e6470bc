// Minimal blocking HTTP/1.0 GET over POSIX sockets
#pragma once
#include <chrono>
#include <cstddef>
#include <cstdint>
#include <string>
#include <string_view>
#include <utility>

namespace rmon::util {

struct HttpUrl {
  std::string host;
  uint16_t port{80};
  std::string path{"/"};
};

struct HttpResponse {
  int status{0};
  std::string body;
};

// Only plain http:// is supported. Returns false on a malformed URL.
[[nodiscard]] bool parse_http_url(std::string_view url, HttpUrl& out);

// Splits a raw response into status and body (chunked encoding is not
// expected from an HTTP/1.0 request). Returns false when malformed.
[[nodiscard]] bool parse_http_response(std::string_view raw, HttpResponse& out);

class HttpClient {
public:
  // /stat bodies are a few KiB; anything near this is not Rspamd
  static constexpr size_t DEFAULT_MAX_RESPONSE = 4 * 1024 * 1024;

  HttpClient(std::string user_agent, std::chrono::milliseconds timeout,
             size_t max_response = DEFAULT_MAX_RESPONSE)
      : user_agent_(std::move(user_agent)), timeout_(timeout), max_response_(max_response) {}

  // Any failure (resolve, connect, timeout, non-2xx, a response over
  // max_response bytes) returns false with 'err' set.
  [[nodiscard]] bool get(const std::string& url, HttpResponse& out, std::string& err) const;

private:
  std::string user_agent_;
  std::chrono::milliseconds timeout_;
  size_t max_response_;
};

} // namespace rmon::util
