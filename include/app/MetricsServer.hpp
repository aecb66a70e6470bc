#pragma once

#include <cstdint>
#include <stop_token>
#include <string_view>
#include <string>
#include <thread>
#include <vector>
#include "app/SharedStats.hpp"

namespace rmon::app {

// Serialize series views (and whatever upstream details are known) into
// Prometheus text exposition format (version 0.0.4).
[[nodiscard]] std::string stats_to_prometheus(const std::vector<SeriesView>& series,
                                              const rmon::model::UpstreamInfo& upstream = {});

// Answer a single HTTP request line: the full response (headers and body).
[[nodiscard]] std::string metrics_http_response(const SharedStats& stats, std::string_view request_line);

// Serves GET /metrics. Without io_uring support compiled in, start() only
// logs that the exporter is unavailable.
class MetricsServer {
public:
  MetricsServer(const SharedStats& stats, uint16_t port);
  ~MetricsServer();
  MetricsServer(const MetricsServer&) = delete;
  MetricsServer& operator=(const MetricsServer&) = delete;

  void start();
  void stop();

private:
  void run(std::stop_token st);
  void handle_client(int client_fd);

  const SharedStats& stats_;
  uint16_t port_;
  int listen_fd_{-1};
  int stop_eventfd_{-1};
  std::jthread thread_;
};

} // namespace rmon::app
