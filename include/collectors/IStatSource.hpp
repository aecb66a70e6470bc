#pragma once
#include <string>

namespace rmon::collectors {

// Where raw /stat bodies come from, so the poller can be driven without a
// live Rspamd.
class IStatSource {
public:
  virtual ~IStatSource() = default;

  // Fetch one response body. Return false with 'err' set on failure.
  [[nodiscard]] virtual bool fetch(std::string& body, std::string& err) = 0;

  // Human-friendly name for diagnostics
  [[nodiscard]] virtual const char* name() const = 0;
};

} // namespace rmon::collectors
