#pragma once
#include <chrono>
#include <cstddef>
#include <deque>
#include <string>
#include "stats/Counter.hpp"

namespace rmon::stats {

struct SeriesSummary {
  size_t count{};
  double last{};
  double min{};
  double max{};
  double mean{};
};

// Rolling window of derived values fed by one Counter.
class Series {
public:
  Series(std::string key, Counter counter, size_t capacity);

  // NaN results (first rate sample) are returned but never stored.
  [[nodiscard]] StatError update(double raw, std::chrono::milliseconds elapsed, double& out);

  [[nodiscard]] const std::deque<double>& history() const { return history_; }
  [[nodiscard]] size_t capacity() const { return capacity_; }
  [[nodiscard]] const std::string& key() const { return key_; }
  [[nodiscard]] const std::string& label() const { return counter_.label(); }
  [[nodiscard]] const Counter& counter() const { return counter_; }

  [[nodiscard]] SeriesSummary summarize() const;

private:
  std::string key_;
  Counter counter_;
  size_t capacity_;
  std::deque<double> history_;
};

template <class It>
[[nodiscard]] SeriesSummary summarize(It first, It last) {
  SeriesSummary s{};
  if (first == last) return s;
  s.min = s.max = *first;
  double sum = 0.0;
  for (; first != last; ++first) {
    double v = *first;
    if (v < s.min) s.min = v;
    if (v > s.max) s.max = v;
    sum += v;
    s.last = v;
    ++s.count;
  }
  s.mean = sum / static_cast<double>(s.count);
  return s;
}

} // namespace rmon::stats
