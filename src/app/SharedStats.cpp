#include "app/SharedStats.hpp"

namespace rmon::app {

SharedStats::SharedStats(const rmon::stats::AggregatorConfig& cfg) : agg_(cfg) {}

rmon::stats::StatError SharedStats::update(const rmon::model::StatSnapshot& snap,
                                           std::chrono::milliseconds elapsed) {
  std::lock_guard<std::mutex> lk(mu_);
  auto err = agg_.update(snap, elapsed);
  if (err == rmon::stats::StatError::Ok) {
    upstream_.version = snap.version;
    upstream_.uptime = snap.uptime;
    upstream_.scanned = snap.scanned;
    ++updates_;
  }
  return err;
}

std::vector<SeriesView> SharedStats::read() const {
  std::lock_guard<std::mutex> lk(mu_);
  std::vector<SeriesView> out;
  out.reserve(agg_.series().size());
  for (const auto& s : agg_.series()) {
    out.push_back(SeriesView{s.key(), s.label(),
                             std::vector<double>(s.history().begin(), s.history().end()),
                             s.capacity()});
  }
  return out;
}

rmon::model::UpstreamInfo SharedStats::upstream() const {
  std::lock_guard<std::mutex> lk(mu_);
  return upstream_;
}

uint64_t SharedStats::updates() const {
  std::lock_guard<std::mutex> lk(mu_);
  return updates_;
}

} // namespace rmon::app
