#include "app/Config.hpp"
#include "app/MetricsServer.hpp"
#include "app/Poller.hpp"
#include "app/SharedStats.hpp"
#include "collectors/HttpStatSource.hpp"
#include "ui/Renderer.hpp"
#include "ui/Terminal.hpp"
#include "util/Log.hpp"

#include <charconv>
#include <chrono>
#include <csignal>
#include <cstdio>
#include <cstdlib>
#include <cstring>
#include <memory>
#include <optional>
#include <string>
#include <string_view>
#include <thread>

using namespace std::chrono_literals;
using rmon::util::LogLevel;

static void print_usage(std::FILE* out) {
  std::fprintf(out,
    "Usage: rspamd-mon [--url URL] [--timeout SECONDS] [--chart-width N] [--chart-height N]\n"
    "                  [--metrics-port PORT] [--config PATH] [--iterations N] [-v|-vv|-vvv]\n"
    "  --url URL          Rspamd stat endpoint (default http://localhost:11334/stat)\n"
    "  --timeout SECONDS  polling interval (default 1.0)\n"
    "  --chart-width N    history window and chart width (default 80)\n"
    "  --chart-height N   chart height in rows (default 6)\n"
    "  --metrics-port P   serve Prometheus metrics on :P (0 disables)\n"
    "  --config PATH      TOML config (default $XDG_CONFIG_HOME/rspamd-mon/config.toml)\n"
    "  --iterations N     exit after N polling cycles\n"
    "  -v                 more logging, repeat for debug/trace\n");
}

static std::optional<int> parse_int(std::string_view s) {
  int v = 0;
  auto [p, ec] = std::from_chars(s.data(), s.data() + s.size(), v);
  if (ec != std::errc{} || p != s.data() + s.size()) return std::nullopt;
  return v;
}

static std::optional<double> parse_double(const char* s) {
  char* end = nullptr;
  double v = std::strtod(s, &end);
  if (end == s || *end != '\0') return std::nullopt;
  return v;
}

int main(int argc, char** argv) {
  rmon::app::CliOverrides cli;
  int iterations = 0; // 0 => run until Ctrl+C
  for (int i = 1; i < argc; ++i) {
    std::string_view a = argv[i];
    auto need = [&](const char* flag) -> const char* {
      if (i + 1 >= argc) {
        std::fprintf(stderr, "rspamd-mon: %s needs a value\n", flag);
        std::exit(2);
      }
      return argv[++i];
    };
    auto need_int = [&](const char* flag) -> int {
      const char* v = need(flag);
      auto n = parse_int(v);
      if (!n) {
        std::fprintf(stderr, "rspamd-mon: %s: not an integer: %s\n", flag, v);
        std::exit(2);
      }
      return *n;
    };
    if (a == "--url") cli.url = need("--url");
    else if (a == "--timeout") {
      const char* v = need("--timeout");
      cli.timeout_secs = parse_double(v);
      if (!cli.timeout_secs) {
        std::fprintf(stderr, "rspamd-mon: --timeout: not a number: %s\n", v);
        return 2;
      }
    }
    else if (a == "--chart-width") cli.chart_width = need_int("--chart-width");
    else if (a == "--chart-height") cli.chart_height = need_int("--chart-height");
    else if (a == "--metrics-port") cli.metrics_port = need_int("--metrics-port");
    else if (a == "--config") cli.config_path = need("--config");
    else if (a == "--iterations") iterations = need_int("--iterations");
    else if (a.size() >= 2 && a[0] == '-' && a.find_first_not_of('v', 1) == std::string_view::npos) {
      cli.verbose += static_cast<int>(a.size() - 1);
    }
    else if (a == "--verbose") cli.verbose++;
    else if (a == "-h" || a == "--help") { print_usage(stdout); return 0; }
    else {
      std::fprintf(stderr, "rspamd-mon: unknown argument: %s\n", argv[i]);
      print_usage(stderr);
      return 2;
    }
  }

  if (cli.verbose > 0) rmon::util::set_log_level(rmon::util::log_level_from_verbosity(cli.verbose));
  rmon::app::Config cfg = rmon::app::load_config(cli);
  rmon::util::set_log_level(cfg.log_level);
  rmon::util::log(LogLevel::Info, "main", "polling %s every %d ms, window %d",
                  cfg.poll.url.c_str(), cfg.poll.interval_ms, cfg.chart.width);

  rmon::app::SharedStats stats(rmon::app::aggregator_config(cfg));
  const auto interval = std::chrono::milliseconds(cfg.poll.interval_ms);
  auto source = std::make_unique<rmon::collectors::HttpStatSource>(cfg.poll.url, cfg.poll.user_agent, interval);
  rmon::app::Poller poller(stats, std::move(source), interval);

  std::unique_ptr<rmon::app::MetricsServer> metrics;
  if (cfg.metrics.port > 0) {
    metrics = std::make_unique<rmon::app::MetricsServer>(stats, static_cast<uint16_t>(cfg.metrics.port));
    metrics->start();
  }

  std::signal(SIGINT, rmon::ui::on_sigint);
  std::signal(SIGTERM, rmon::ui::on_sigint);
  rmon::ui::CursorGuard curs{};
  rmon::ui::AltScreenGuard alt{cfg.chart.alt_screen && rmon::ui::tty_stdout()};
  std::atexit(&rmon::ui::on_atexit_restore);

  poller.start();
  uint64_t rendered = 0;
  while (!rmon::ui::g_stop.load()) {
    if (poller.fatal()) break;
    uint64_t cycles = poller.cycles();
    // The first cycle only primes the rate counters
    if (cycles != rendered) {
      if (cycles >= 2) rmon::ui::render_screen(stats, cfg.chart.height);
      rendered = cycles;
    }
    if (iterations > 0 && cycles >= static_cast<uint64_t>(iterations)) break;
    std::this_thread::sleep_for(50ms);
  }
  poller.stop();
  if (metrics) metrics->stop();

  if (poller.fatal()) {
    rmon::util::log(LogLevel::Error, "main", "%d consecutive errors, last: %s",
                    poller.consecutive_errors(), poller.last_error().c_str());
    return 1;
  }
  return 0;
}
