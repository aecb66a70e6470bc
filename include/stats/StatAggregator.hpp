#pragma once
#include <chrono>
#include <cstddef>
#include <string>
#include <string_view>
#include <vector>
#include "model/Stat.hpp"
#include "stats/Series.hpp"

namespace rmon::stats {

// A rate metric fed by the sum of one or more upstream action counts.
struct RateSpec {
  std::string key;
  std::string label;
  std::vector<std::string> sources;
};

struct AggregatorConfig {
  size_t window{80};
  // converts per-millisecond rates into per-second ones
  double scale{1000.0};
  std::vector<RateSpec> rates;
  std::string total_key{"total"};
  std::string total_label{"total msg/sec"};
  std::string scan_time_key{"avg_time"};
  std::string scan_time_label{"average_time sec"};
};

// spam/ham/junk rates over the standard Rspamd action names
[[nodiscard]] AggregatorConfig default_aggregator_config(size_t window = 80);

class StatAggregator {
public:
  explicit StatAggregator(const AggregatorConfig& cfg);

  // Fails with MissingField (no series touched) when actions are absent, or
  // with the first DivisionByZero encountered, leaving later series for this
  // cycle untouched.
  [[nodiscard]] StatError update(const rmon::model::StatSnapshot& snap, std::chrono::milliseconds elapsed);

  // rates in configured order, then total, then scan time gauge
  [[nodiscard]] const std::vector<Series>& series() const { return series_; }
  [[nodiscard]] const Series* find(std::string_view key) const;
  [[nodiscard]] size_t window() const { return window_; }

private:
  size_t window_;
  double scale_;
  std::vector<std::vector<std::string>> sources_; // parallel to the leading rate series
  std::vector<Series> series_;
  size_t total_idx_{};
  size_t scan_idx_{};
};

} // namespace rmon::stats
