#include "app/MetricsServer.hpp"
#include "stats/Series.hpp"
#include <charconv>
#include <cmath>

namespace {

void append_double(std::string& out, double v) {
  if (std::isnan(v)) { out += "NaN"; return; }
  if (std::isinf(v)) { out += v > 0 ? "+Inf" : "-Inf"; return; }
  char buf[32];
  auto [ptr, ec] = std::to_chars(buf, buf + sizeof(buf), v);
  if (ec == std::errc{}) {
    out.append(buf, ptr);
  } else {
    out += '0';
  }
}

void append_uint(std::string& out, uint64_t v) {
  char buf[24];
  auto [ptr, ec] = std::to_chars(buf, buf + sizeof(buf), v);
  out.append(buf, ptr);
}

void append_escaped(std::string& out, std::string_view sv) {
  for (char c : sv) {
    if (c == '\\') out += "\\\\";
    else if (c == '"') out += "\\\"";
    else if (c == '\n') out += "\\n";
    else out += c;
  }
}

void emit_header(std::string& out, const char* name, const char* help, const char* type) {
  out += "# HELP ";  out += name;  out += ' ';  out += help;  out += '\n';
  out += "# TYPE ";  out += name;  out += ' ';  out += type;  out += '\n';
}

// name{series="key",label="label"} value
void emit_series_d(std::string& out, const char* name, const rmon::app::SeriesView& s, double value) {
  out += name;  out += "{series=\"";  append_escaped(out, s.key);
  out += "\",label=\"";  append_escaped(out, s.label);
  out += "\"} ";  append_double(out, value);  out += '\n';
}

// name{series="key"} value
void emit_series_u(std::string& out, const char* name, const rmon::app::SeriesView& s, uint64_t value) {
  out += name;  out += "{series=\"";  append_escaped(out, s.key);
  out += "\"} ";  append_uint(out, value);  out += '\n';
}

} // anonymous namespace

namespace rmon::app {

std::string stats_to_prometheus(const std::vector<SeriesView>& series, const rmon::model::UpstreamInfo& upstream) {
  std::string out;
  out.reserve(256 + series.size() * 256);

  std::vector<rmon::stats::SeriesSummary> sums;
  sums.reserve(series.size());
  for (const auto& s : series) sums.push_back(rmon::stats::summarize(s.history.begin(), s.history.end()));

  struct Stat { const char* name; const char* help; double rmon::stats::SeriesSummary::* field; };
  static constexpr Stat stats[] = {
    {"rspamd_mon_last", "Most recent derived value of the series.", &rmon::stats::SeriesSummary::last},
    {"rspamd_mon_avg",  "Mean of the values in the window.",         &rmon::stats::SeriesSummary::mean},
    {"rspamd_mon_min",  "Minimum of the values in the window.",      &rmon::stats::SeriesSummary::min},
    {"rspamd_mon_max",  "Maximum of the values in the window.",      &rmon::stats::SeriesSummary::max},
  };
  for (const auto& st : stats) {
    emit_header(out, st.name, st.help, "gauge");
    for (size_t i = 0; i < series.size(); ++i) {
      if (sums[i].count == 0) continue;
      emit_series_d(out, st.name, series[i], sums[i].*st.field);
    }
  }

  emit_header(out, "rspamd_mon_window_samples", "Number of values currently held in the window.", "gauge");
  for (const auto& s : series) emit_series_u(out, "rspamd_mon_window_samples", s, s.history.size());

  emit_header(out, "rspamd_mon_window_capacity", "Configured window size.", "gauge");
  for (const auto& s : series) emit_series_u(out, "rspamd_mon_window_capacity", s, s.capacity);

  if (!upstream.version.empty()) {
    emit_header(out, "rspamd_mon_upstream_info", "Version reported by the polled Rspamd.", "gauge");
    out += "rspamd_mon_upstream_info{version=\"";  append_escaped(out, upstream.version);  out += "\"} 1\n";
  }
  if (upstream.uptime) {
    emit_header(out, "rspamd_mon_upstream_uptime_seconds", "Uptime reported by the polled Rspamd.", "gauge");
    out += "rspamd_mon_upstream_uptime_seconds ";  append_uint(out, *upstream.uptime);  out += '\n';
  }
  if (upstream.scanned) {
    emit_header(out, "rspamd_mon_upstream_scanned_total", "Messages scanned by the polled Rspamd.", "counter");
    out += "rspamd_mon_upstream_scanned_total ";  append_uint(out, *upstream.scanned);  out += '\n';
  }
  return out;
}

std::string metrics_http_response(const SharedStats& stats, std::string_view request_line) {
  std::string body;
  std::string status = "200 OK";
  std::string ctype = "text/plain";
  if (request_line.starts_with("GET /metrics")) {
    body = stats_to_prometheus(stats.read(), stats.upstream());
    ctype = "text/plain; version=0.0.4; charset=utf-8";
  } else if (request_line.starts_with("GET / ") || request_line == "GET /") {
    body = "rspamd-mon: use /metrics\n";
  } else {
    status = "404 Not Found";
    body = "404 Not Found\n";
  }
  std::string resp = "HTTP/1.1 " + status + "\r\n"
                     "Content-Type: " + ctype + "\r\n"
                     "Connection: close\r\n"
                     "Content-Length: ";
  append_uint(resp, body.size());
  resp += "\r\n\r\n";
  resp += body;
  return resp;
}

} // namespace rmon::app
