#pragma once
#include <chrono>
#include <string>
#include "collectors/IStatSource.hpp"
#include "util/HttpClient.hpp"

namespace rmon::collectors {

class HttpStatSource : public IStatSource {
public:
  HttpStatSource(std::string url, std::string user_agent, std::chrono::milliseconds timeout);

  [[nodiscard]] bool fetch(std::string& body, std::string& err) override;
  [[nodiscard]] const char* name() const override { return url_.c_str(); }

private:
  std::string url_;
  rmon::util::HttpClient client_;
};

} // namespace rmon::collectors
