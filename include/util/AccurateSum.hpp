// Compensated floating point summation
#pragma once
#include <vector>

namespace rmon::util {

// Error-free transformation: a + b == s + e exactly.
inline void two_sum(double a, double b, double& s, double& e) {
  s = a + b;
  double bp = s - a;
  e = (a - (s - bp)) + (b - bp);
}

// Sum2 (Ogita/Rump/Oishi): as accurate as naive summation carried out in
// twice the working precision.
[[nodiscard]] double accurate_sum(const std::vector<double>& values);

// Mean of the finite entries; NaN and +/-inf are dropped. Returns false when
// none remain.
[[nodiscard]] bool finite_mean(const std::vector<double>& values, double& out);

} // namespace rmon::util
