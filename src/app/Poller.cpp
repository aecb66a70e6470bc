#include "app/Poller.hpp"
#include "collectors/StatDecoder.hpp"
#include "util/Log.hpp"
#include <algorithm>

using namespace std::chrono;
using rmon::util::LogLevel;

namespace rmon::app {

Poller::Poller(SharedStats& stats, std::unique_ptr<rmon::collectors::IStatSource> source,
               milliseconds interval)
    : stats_(stats), source_(std::move(source)), base_interval_(interval),
      interval_ms_(interval.count()) {}

Poller::~Poller() { stop(); }

void Poller::start() {
  if (thread_.joinable()) return;
  thread_ = std::jthread([this](std::stop_token st){ run(st); });
}

void Poller::stop() {
  if (!thread_.joinable()) return;
  thread_.request_stop();
  thread_.join();
}

std::string Poller::last_error() const {
  std::lock_guard<std::mutex> lk(err_mu_);
  return last_error_;
}

void Poller::fail(const std::string& err) {
  int n = errors_.fetch_add(1, std::memory_order_acq_rel) + 1;
  interval_ms_.store(interval_ms_.load(std::memory_order_relaxed) * 2, std::memory_order_release);
  {
    std::lock_guard<std::mutex> lk(err_mu_);
    last_error_ = err;
  }
  rmon::util::log(LogLevel::Warn, "poller", "%s (%d/%d consecutive failures, next try in %lld ms)",
                  err.c_str(), n, MAX_CONSECUTIVE_ERRORS,
                  static_cast<long long>(interval_ms_.load(std::memory_order_relaxed)));
  if (n > MAX_CONSECUTIVE_ERRORS) {
    rmon::util::log(LogLevel::Error, "poller", "giving up on %s", source_->name());
    fatal_.store(true, std::memory_order_release);
  }
}

bool Poller::poll_once() { return poll_once(steady_clock::now()); }

bool Poller::poll_once(steady_clock::time_point now) {
  std::string body, err;
  if (!source_->fetch(body, err)) {
    fail("cannot get results from " + std::string(source_->name()) + ": " + err);
    return false;
  }
  rmon::model::StatSnapshot snap;
  if (!rmon::collectors::decode_stat(body, snap, err)) {
    fail(err + " from " + source_->name());
    return false;
  }
  // wall time since the last applied snapshot, failed cycles included
  auto elapsed = last_ok_ ? duration_cast<milliseconds>(now - *last_ok_) : base_interval_;
  auto res = stats_.update(snap, elapsed);
  if (res != rmon::stats::StatError::Ok) {
    fail(std::string("cannot update stats from ") + source_->name() + ": " + rmon::stats::describe(res));
    return false;
  }
  rmon::util::log(LogLevel::Debug, "poller", "cycle %llu applied (elapsed %lld ms)",
                  static_cast<unsigned long long>(cycles_.load(std::memory_order_relaxed) + 1),
                  static_cast<long long>(elapsed.count()));
  last_ok_ = now;
  errors_.store(0, std::memory_order_release);
  interval_ms_.store(base_interval_.count(), std::memory_order_release);
  cycles_.fetch_add(1, std::memory_order_acq_rel);
  return true;
}

void Poller::run(std::stop_token st) {
  rmon::util::log(LogLevel::Info, "poller", "polling %s every %lld ms", source_->name(),
                  static_cast<long long>(base_interval_.count()));
  while (!st.stop_requested() && !fatal()) {
    (void)poll_once();
    if (fatal()) break;
    // sleep in short slices so stop() stays responsive
    auto wake = steady_clock::now() + current_interval();
    while (!st.stop_requested()) {
      auto left = duration_cast<milliseconds>(wake - steady_clock::now());
      if (left <= 0ms) break;
      std::this_thread::sleep_for(std::min<milliseconds>(left, 100ms));
    }
  }
}

} // namespace rmon::app
