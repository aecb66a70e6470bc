#pragma once
#include <chrono>
#include <cstddef>
#include <mutex>
#include <string>
#include <vector>
#include "model/Stat.hpp"
#include "stats/StatAggregator.hpp"

namespace rmon::app {

// Copy of one series taken under the lock, safe to format without it.
struct SeriesView {
  std::string key;
  std::string label;
  std::vector<double> history;
  size_t capacity{};
};

// The single aggregator instance shared by the poller, the renderer and the
// metrics exporter. Every access goes through one mutex.
class SharedStats {
public:
  explicit SharedStats(const rmon::stats::AggregatorConfig& cfg);
  SharedStats(const SharedStats&) = delete;
  SharedStats& operator=(const SharedStats&) = delete;

  [[nodiscard]] rmon::stats::StatError update(const rmon::model::StatSnapshot& snap,
                                              std::chrono::milliseconds elapsed);

  [[nodiscard]] std::vector<SeriesView> read() const;
  [[nodiscard]] rmon::model::UpstreamInfo upstream() const;
  [[nodiscard]] uint64_t updates() const;

private:
  mutable std::mutex mu_;
  rmon::stats::StatAggregator agg_;
  rmon::model::UpstreamInfo upstream_{};
  uint64_t updates_{0};
};

} // namespace rmon::app
