#include "util/HttpClient.hpp"
#include <netdb.h>
#include <poll.h>
#include <sys/socket.h>
#include <sys/types.h>
#include <unistd.h>
#include <fcntl.h>
#include <cerrno>
#include <charconv>
#include <cstring>

using namespace std::chrono;

namespace rmon::util {

bool parse_http_url(std::string_view url, HttpUrl& out) {
  constexpr std::string_view scheme = "http://";
  if (!url.starts_with(scheme)) return false;
  url.remove_prefix(scheme.size());
  auto slash = url.find('/');
  std::string_view authority = url.substr(0, slash);
  out.path = (slash == std::string_view::npos) ? std::string("/") : std::string(url.substr(slash));
  if (authority.empty()) return false;
  std::string_view host = authority;
  std::string_view port_sv;
  if (authority.front() == '[') {
    // [::1] or [::1]:port
    auto close = authority.find(']');
    if (close == std::string_view::npos) return false;
    host = authority.substr(1, close - 1);
    auto rest = authority.substr(close + 1);
    if (!rest.empty()) {
      if (rest.front() != ':') return false;
      port_sv = rest.substr(1);
      if (port_sv.empty()) return false;
    }
  } else if (auto colon = authority.rfind(':'); colon != std::string_view::npos) {
    host = authority.substr(0, colon);
    port_sv = authority.substr(colon + 1);
    if (port_sv.empty()) return false;
  }
  out.port = 80;
  if (!port_sv.empty()) {
    unsigned port = 0;
    auto [ptr, ec] = std::from_chars(port_sv.data(), port_sv.data() + port_sv.size(), port);
    if (ec != std::errc{} || ptr != port_sv.data() + port_sv.size() || port == 0 || port > 65535) return false;
    out.port = static_cast<uint16_t>(port);
  }
  if (host.empty()) return false;
  out.host = std::string(host);
  return true;
}

bool parse_http_response(std::string_view raw, HttpResponse& out) {
  auto line_end = raw.find("\r\n");
  if (line_end == std::string_view::npos) return false;
  std::string_view status_line = raw.substr(0, line_end);
  if (!status_line.starts_with("HTTP/")) return false;
  auto sp = status_line.find(' ');
  if (sp == std::string_view::npos || sp + 4 > status_line.size()) return false;
  int code = 0;
  auto [ptr, ec] = std::from_chars(status_line.data() + sp + 1, status_line.data() + sp + 4, code);
  if (ec != std::errc{}) return false;
  auto hdr_end = raw.find("\r\n\r\n");
  if (hdr_end == std::string_view::npos) return false;
  out.status = code;
  out.body = std::string(raw.substr(hdr_end + 4));
  return true;
}

namespace {

// Closes the socket on every exit path.
class FdGuard {
public:
  explicit FdGuard(int fd) : fd_(fd) {}
  ~FdGuard() { if (fd_ >= 0) ::close(fd_); }
  FdGuard(const FdGuard&) = delete;
  FdGuard& operator=(const FdGuard&) = delete;
  int get() const { return fd_; }
private:
  int fd_;
};

int remaining_ms(steady_clock::time_point deadline) {
  auto left = duration_cast<milliseconds>(deadline - steady_clock::now()).count();
  return left > 0 ? static_cast<int>(left) : 0;
}

bool wait_fd(int fd, short events, steady_clock::time_point deadline) {
  for (;;) {
    struct pollfd pfd{.fd = fd, .events = events, .revents = 0};
    int rv = ::poll(&pfd, 1, remaining_ms(deadline));
    if (rv < 0 && errno == EINTR) continue;
    return rv > 0;
  }
}

} // namespace

bool HttpClient::get(const std::string& url, HttpResponse& out, std::string& err) const {
  HttpUrl u;
  if (!parse_http_url(url, u)) { err = "malformed url " + url; return false; }
  auto deadline = steady_clock::now() + timeout_;

  struct addrinfo hints{};
  hints.ai_family = AF_UNSPEC;
  hints.ai_socktype = SOCK_STREAM;
  struct addrinfo* res = nullptr;
  auto port_str = std::to_string(u.port);
  int gai = ::getaddrinfo(u.host.c_str(), port_str.c_str(), &hints, &res);
  if (gai != 0) { err = "cannot resolve " + u.host + ": " + ::gai_strerror(gai); return false; }

  int fd = -1;
  std::string last_err = "no addresses";
  for (auto* ai = res; ai; ai = ai->ai_next) {
    int s = ::socket(ai->ai_family, ai->ai_socktype | SOCK_CLOEXEC | SOCK_NONBLOCK, ai->ai_protocol);
    if (s < 0) { last_err = std::strerror(errno); continue; }
    if (::connect(s, ai->ai_addr, ai->ai_addrlen) == 0) { fd = s; break; }
    if (errno == EINPROGRESS && wait_fd(s, POLLOUT, deadline)) {
      int so_err = 0; socklen_t len = sizeof(so_err);
      if (::getsockopt(s, SOL_SOCKET, SO_ERROR, &so_err, &len) == 0 && so_err == 0) { fd = s; break; }
      last_err = std::strerror(so_err ? so_err : errno);
    } else {
      last_err = (errno == EINPROGRESS) ? "connect timed out" : std::strerror(errno);
    }
    ::close(s);
  }
  ::freeaddrinfo(res);
  if (fd < 0) { err = "cannot connect to " + u.host + ":" + port_str + ": " + last_err; return false; }
  FdGuard guard(fd);

  std::string req = "GET " + u.path + " HTTP/1.0\r\n"
                    "Host: " + u.host + "\r\n"
                    "User-Agent: " + user_agent_ + "\r\n"
                    "Accept: application/json\r\n"
                    "Connection: close\r\n\r\n";
  size_t sent = 0;
  while (sent < req.size()) {
    ssize_t n = ::send(fd, req.data() + sent, req.size() - sent, MSG_NOSIGNAL);
    if (n > 0) { sent += static_cast<size_t>(n); continue; }
    if (n < 0 && errno == EINTR) continue;
    if (n < 0 && (errno == EAGAIN || errno == EWOULDBLOCK) && wait_fd(fd, POLLOUT, deadline)) continue;
    err = (n < 0 && errno != EAGAIN && errno != EWOULDBLOCK) ? std::string("send failed: ") + std::strerror(errno)
                                                             : std::string("send timed out");
    return false;
  }

  std::string raw;
  char buf[8192];
  for (;;) {
    ssize_t n = ::recv(fd, buf, sizeof(buf), 0);
    if (n > 0) {
      raw.append(buf, static_cast<size_t>(n));
      if (raw.size() > max_response_) {
        err = "response too large from " + u.host + " (over " + std::to_string(max_response_) + " bytes)";
        return false;
      }
      continue;
    }
    if (n == 0) break;
    if (errno == EINTR) continue;
    if ((errno == EAGAIN || errno == EWOULDBLOCK) && wait_fd(fd, POLLIN, deadline)) continue;
    err = (errno == EAGAIN || errno == EWOULDBLOCK) ? std::string("read timed out")
                                                    : std::string("recv failed: ") + std::strerror(errno);
    return false;
  }

  if (!parse_http_response(raw, out)) { err = "malformed http response from " + u.host; return false; }
  if (out.status < 200 || out.status >= 300) {
    err = "http status " + std::to_string(out.status) + " from " + url;
    return false;
  }
  return true;
}

} // namespace rmon::util
