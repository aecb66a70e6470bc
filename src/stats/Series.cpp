#include "stats/Series.hpp"
#include <algorithm>
#include <cmath>
#include <utility>

namespace rmon::stats {

Series::Series(std::string key, Counter counter, size_t capacity)
    : key_(std::move(key)), counter_(std::move(counter)), capacity_(std::max<size_t>(1, capacity)) {}

StatError Series::update(double raw, std::chrono::milliseconds elapsed, double& out) {
  auto ms = elapsed.count() < 0 ? 0 : static_cast<uint64_t>(elapsed.count());
  auto err = counter_.update(raw, ms, out);
  if (err != StatError::Ok) return err;
  if (std::isnan(out)) return StatError::Ok;
  // expire one
  if (history_.size() >= capacity_) history_.pop_front();
  history_.push_back(out);
  return StatError::Ok;
}

SeriesSummary Series::summarize() const { return stats::summarize(history_.begin(), history_.end()); }

} // namespace rmon::stats
