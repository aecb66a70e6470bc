#include "collectors/HttpStatSource.hpp"
#include <utility>

namespace rmon::collectors {

HttpStatSource::HttpStatSource(std::string url, std::string user_agent, std::chrono::milliseconds timeout)
    : url_(std::move(url)), client_(std::move(user_agent), timeout) {}

bool HttpStatSource::fetch(std::string& body, std::string& err) {
  rmon::util::HttpResponse resp;
  if (!client_.get(url_, resp, err)) return false;
  body = std::move(resp.body);
  return true;
}

} // namespace rmon::collectors
