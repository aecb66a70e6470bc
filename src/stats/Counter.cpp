#include "stats/Counter.hpp"
#include <limits>
#include <utility>

namespace rmon::stats {

Counter::Counter(Kind kind, std::string label) : kind_(kind), label_(std::move(label)) {}

StatError Counter::update(double raw, uint64_t elapsed_ms, double& out) {
  auto prev = previous_;
  previous_ = raw;
  switch (kind_) {
    case Kind::Gauge:
      out = raw;
      return StatError::Ok;
    case Kind::Rate:
      if (elapsed_ms == 0) return StatError::DivisionByZero;
      if (!prev) {
        out = std::numeric_limits<double>::quiet_NaN();
        return StatError::Ok;
      }
      // no reset detection: a restarted upstream yields a negative rate
      out = (raw - *prev) / static_cast<double>(elapsed_ms);
      return StatError::Ok;
  }
  return StatError::Ok;
}

} // namespace rmon::stats
