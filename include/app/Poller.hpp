#pragma once
#include <atomic>
#include <chrono>
#include <memory>
#include <mutex>
#include <optional>
#include <stop_token>
#include <string>
#include <thread>
#include "app/SharedStats.hpp"
#include "collectors/IStatSource.hpp"

namespace rmon::app {

// Background fetch -> decode -> aggregate loop.
//
// Each snapshot is reported with the steady-clock time since the last applied
// one (the base interval for the very first). A failed cycle (transport,
// decode or aggregation) doubles the retry delay; success resets it. More than
// MAX_CONSECUTIVE_ERRORS failures in a row stops the loop and marks the poller
// fatal.
class Poller {
public:
  static constexpr int MAX_CONSECUTIVE_ERRORS = 5;

  Poller(SharedStats& stats, std::unique_ptr<rmon::collectors::IStatSource> source,
         std::chrono::milliseconds interval);
  ~Poller();
  Poller(const Poller&) = delete;
  Poller& operator=(const Poller&) = delete;

  void start();
  void stop();

  // One cycle; true when the snapshot reached the aggregator. 'now' is the
  // steady-clock time the snapshot is taken to belong to.
  bool poll_once();
  bool poll_once(std::chrono::steady_clock::time_point now);

  [[nodiscard]] bool fatal() const { return fatal_.load(std::memory_order_acquire); }
  [[nodiscard]] uint64_t cycles() const { return cycles_.load(std::memory_order_acquire); }
  [[nodiscard]] int consecutive_errors() const { return errors_.load(std::memory_order_acquire); }
  [[nodiscard]] std::chrono::milliseconds current_interval() const {
    return std::chrono::milliseconds(interval_ms_.load(std::memory_order_acquire));
  }
  [[nodiscard]] std::string last_error() const;

private:
  void run(std::stop_token st);
  void fail(const std::string& err);

  SharedStats& stats_;
  std::unique_ptr<rmon::collectors::IStatSource> source_;
  const std::chrono::milliseconds base_interval_;
  std::atomic<int64_t> interval_ms_;
  std::optional<std::chrono::steady_clock::time_point> last_ok_{};
  std::atomic<uint64_t> cycles_{0};
  std::atomic<int> errors_{0};
  std::atomic<bool> fatal_{false};
  mutable std::mutex err_mu_;
  std::string last_error_;
  std::jthread thread_{};
};

} // namespace rmon::app
