#include "minitest.hpp"
#include "app/MetricsServer.hpp"
#include <chrono>
#include <string>

using namespace std::chrono_literals;
using rmon::app::SeriesView;

static size_t count_lines_with(const std::string& text, const std::string& prefix) {
  size_t n = 0, pos = 0;
  while (pos < text.size()) {
    size_t end = text.find('\n', pos);
    if (end == std::string::npos) end = text.size();
    if (text.compare(pos, prefix.size(), prefix) == 0) ++n;
    pos = end + 1;
  }
  return n;
}

TEST(prometheus_serializer_summary_gauges) {
  std::vector<SeriesView> views{{"spam", "spam msg/sec", {1.0, 4.0, 2.5}, 80}};
  std::string out = rmon::app::stats_to_prometheus(views);
  ASSERT_TRUE(out.find("# TYPE rspamd_mon_last gauge") != std::string::npos);
  ASSERT_TRUE(out.find("rspamd_mon_last{series=\"spam\",label=\"spam msg/sec\"} 2.5\n") != std::string::npos);
  ASSERT_TRUE(out.find("rspamd_mon_avg{series=\"spam\",label=\"spam msg/sec\"} 2.5\n") != std::string::npos);
  ASSERT_TRUE(out.find("rspamd_mon_min{series=\"spam\",label=\"spam msg/sec\"} 1\n") != std::string::npos);
  ASSERT_TRUE(out.find("rspamd_mon_max{series=\"spam\",label=\"spam msg/sec\"} 4\n") != std::string::npos);
  ASSERT_TRUE(out.find("rspamd_mon_window_samples{series=\"spam\"} 3\n") != std::string::npos);
  ASSERT_TRUE(out.find("rspamd_mon_window_capacity{series=\"spam\"} 80\n") != std::string::npos);
}

TEST(prometheus_serializer_skips_empty_series_values) {
  std::vector<SeriesView> views{
    {"spam", "spam msg/sec", {}, 80},
    {"ham", "ham msg/sec", {3.0}, 80},
  };
  std::string out = rmon::app::stats_to_prometheus(views);
  ASSERT_EQ(count_lines_with(out, "rspamd_mon_last{"), 1u);
  ASSERT_TRUE(out.find("rspamd_mon_last{series=\"spam\"") == std::string::npos);
  // window gauges are always present
  ASSERT_EQ(count_lines_with(out, "rspamd_mon_window_samples{"), 2u);
  ASSERT_TRUE(out.find("rspamd_mon_window_samples{series=\"spam\"} 0\n") != std::string::npos);
}

TEST(prometheus_serializer_escapes_labels) {
  std::vector<SeriesView> views{{"x", "say \"hi\"\\", {1.0}, 1}};
  std::string out = rmon::app::stats_to_prometheus(views);
  ASSERT_TRUE(out.find("label=\"say \\\"hi\\\"\\\\\"") != std::string::npos);
}

TEST(prometheus_serializer_special_values) {
  std::vector<SeriesView> views{{"r", "r", {-2.0}, 4}};
  std::string out = rmon::app::stats_to_prometheus(views);
  ASSERT_TRUE(out.find("rspamd_mon_last{series=\"r\",label=\"r\"} -2\n") != std::string::npos);
}

TEST(prometheus_http_routes) {
  rmon::app::SharedStats stats(rmon::stats::default_aggregator_config(4));
  rmon::model::StatSnapshot snap{};
  snap.actions = std::unordered_map<std::string, uint64_t>{{"reject", 1}};
  ASSERT_TRUE(stats.update(snap, 1000ms) == rmon::stats::StatError::Ok);
  snap.actions = std::unordered_map<std::string, uint64_t>{{"reject", 3}};
  ASSERT_TRUE(stats.update(snap, 1000ms) == rmon::stats::StatError::Ok);

  std::string ok = rmon::app::metrics_http_response(stats, "GET /metrics HTTP/1.1");
  ASSERT_TRUE(ok.starts_with("HTTP/1.1 200 OK\r\n"));
  ASSERT_TRUE(ok.find("version=0.0.4") != std::string::npos);
  ASSERT_TRUE(ok.find("rspamd_mon_last{series=\"spam\",label=\"spam msg/sec\"} 2\n") != std::string::npos);

  auto body_at = ok.find("\r\n\r\n");
  ASSERT_TRUE(body_at != std::string::npos);
  std::string clen = "Content-Length: " + std::to_string(ok.size() - body_at - 4) + "\r\n";
  ASSERT_TRUE(ok.find(clen) != std::string::npos);

  std::string root = rmon::app::metrics_http_response(stats, "GET / HTTP/1.1");
  ASSERT_TRUE(root.starts_with("HTTP/1.1 200 OK\r\n"));
  ASSERT_TRUE(root.find("use /metrics") != std::string::npos);

  std::string nf = rmon::app::metrics_http_response(stats, "GET /stat HTTP/1.1");
  ASSERT_TRUE(nf.starts_with("HTTP/1.1 404 Not Found\r\n"));
  nf = rmon::app::metrics_http_response(stats, "POST /metrics HTTP/1.1");
  ASSERT_TRUE(nf.starts_with("HTTP/1.1 404"));
}

TEST(prometheus_serializer_upstream_details) {
  std::vector<SeriesView> views{{"spam", "spam msg/sec", {1.0}, 80}};
  std::string bare = rmon::app::stats_to_prometheus(views);
  ASSERT_TRUE(bare.find("rspamd_mon_upstream") == std::string::npos);

  rmon::model::UpstreamInfo up{};
  up.version = "3.8.4";
  up.uptime = 86400;
  up.scanned = 1200;
  std::string out = rmon::app::stats_to_prometheus(views, up);
  ASSERT_TRUE(out.find("rspamd_mon_upstream_info{version=\"3.8.4\"} 1\n") != std::string::npos);
  ASSERT_TRUE(out.find("rspamd_mon_upstream_uptime_seconds 86400\n") != std::string::npos);
  ASSERT_TRUE(out.find("# TYPE rspamd_mon_upstream_scanned_total counter") != std::string::npos);
  ASSERT_TRUE(out.find("rspamd_mon_upstream_scanned_total 1200\n") != std::string::npos);
}

TEST(prometheus_http_includes_upstream_from_last_snapshot) {
  rmon::app::SharedStats stats(rmon::stats::default_aggregator_config(4));
  rmon::model::StatSnapshot snap{};
  snap.actions = std::unordered_map<std::string, uint64_t>{{"reject", 1}};
  snap.version = "3.9.0";
  snap.scanned = 77;
  ASSERT_TRUE(stats.update(snap, 1000ms) == rmon::stats::StatError::Ok);
  auto up = stats.upstream();
  ASSERT_EQ(up.version, "3.9.0");
  ASSERT_EQ(*up.scanned, 77u);
  ASSERT_TRUE(!up.uptime.has_value());

  // a rejected snapshot leaves the last good details in place
  rmon::model::StatSnapshot bad{};
  bad.version = "other";
  ASSERT_TRUE(stats.update(bad, 1000ms) == rmon::stats::StatError::MissingField);
  ASSERT_EQ(stats.upstream().version, "3.9.0");

  std::string resp = rmon::app::metrics_http_response(stats, "GET /metrics HTTP/1.1");
  ASSERT_TRUE(resp.find("rspamd_mon_upstream_info{version=\"3.9.0\"} 1\n") != std::string::npos);
  ASSERT_TRUE(resp.find("rspamd_mon_upstream_scanned_total 77\n") != std::string::npos);
}
