#include "stats/StatAggregator.hpp"
#include "util/AccurateSum.hpp"

namespace rmon::stats {

AggregatorConfig default_aggregator_config(size_t window) {
  AggregatorConfig cfg{};
  cfg.window = window;
  cfg.rates = {
    {"spam", "spam msg/sec", {"reject"}},
    {"ham",  "ham msg/sec",  {"no action", "no_action"}},
    {"junk", "junk msg/sec", {"add header", "add_header", "rewrite subject", "rewrite_subject"}},
  };
  return cfg;
}

StatAggregator::StatAggregator(const AggregatorConfig& cfg)
    : window_(cfg.window == 0 ? 1 : cfg.window), scale_(cfg.scale) {
  series_.reserve(cfg.rates.size() + 2);
  for (const auto& r : cfg.rates) {
    series_.emplace_back(r.key, Counter(Counter::Kind::Rate, r.label), window_);
    sources_.push_back(r.sources);
  }
  total_idx_ = series_.size();
  series_.emplace_back(cfg.total_key, Counter(Counter::Kind::Rate, cfg.total_label), window_);
  scan_idx_ = series_.size();
  series_.emplace_back(cfg.scan_time_key, Counter(Counter::Kind::Gauge, cfg.scan_time_label), window_);
}

StatError StatAggregator::update(const rmon::model::StatSnapshot& snap, std::chrono::milliseconds elapsed) {
  if (!snap.actions) return StatError::MissingField;
  const auto& actions = *snap.actions;

  double total = 0.0;
  for (size_t i = 0; i < sources_.size(); ++i) {
    uint64_t count = 0;
    for (const auto& field : sources_[i]) {
      auto it = actions.find(field);
      if (it != actions.end()) count += it->second;
    }
    double raw = static_cast<double>(count) * scale_;
    double derived = 0.0;
    auto err = series_[i].update(raw, elapsed, derived);
    if (err != StatError::Ok) return err;
    total += raw;
  }

  double derived = 0.0;
  auto err = series_[total_idx_].update(total, elapsed, derived);
  if (err != StatError::Ok) return err;

  if (snap.scan_times) {
    double mean = 0.0;
    if (rmon::util::finite_mean(*snap.scan_times, mean)) {
      err = series_[scan_idx_].update(mean, elapsed, derived);
      if (err != StatError::Ok) return err;
    }
  }
  return StatError::Ok;
}

const Series* StatAggregator::find(std::string_view key) const {
  for (const auto& s : series_) {
    if (s.key() == key) return &s;
  }
  return nullptr;
}

} // namespace rmon::stats
