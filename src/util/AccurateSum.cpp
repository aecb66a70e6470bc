#include "util/AccurateSum.hpp"
#include <cmath>

namespace rmon::util {

double accurate_sum(const std::vector<double>& values) {
  double s = 0.0, c = 0.0;
  for (double x : values) {
    double e;
    two_sum(s, x, s, e);
    c += e;
  }
  return s + c;
}

bool finite_mean(const std::vector<double>& values, double& out) {
  std::vector<double> kept;
  kept.reserve(values.size());
  for (double v : values) {
    if (std::isfinite(v)) kept.push_back(v);
  }
  if (kept.empty()) return false;
  out = accurate_sum(kept) / static_cast<double>(kept.size());
  return true;
}

} // namespace rmon::util
