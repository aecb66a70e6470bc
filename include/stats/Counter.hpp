#pragma once
#include <cstdint>
#include <optional>
#include <string>
#include "stats/StatError.hpp"

namespace rmon::stats {

// Turns a raw absolute value into a derived one.
//  Rate:  (raw - previous) / elapsed_ms; NaN on the very first call.
//  Gauge: raw, unchanged.
class Counter {
public:
  enum class Kind : uint8_t { Rate, Gauge };

  Counter(Kind kind, std::string label);

  // Writes the derived value to 'out'. The previous raw value is advanced
  // even when the update fails.
  [[nodiscard]] StatError update(double raw, uint64_t elapsed_ms, double& out);

  [[nodiscard]] const std::string& label() const { return label_; }
  [[nodiscard]] Kind kind() const { return kind_; }
  [[nodiscard]] std::optional<double> previous() const { return previous_; }

private:
  Kind kind_;
  std::string label_;
  std::optional<double> previous_{};
};

} // namespace rmon::stats
