#include "minitest.hpp"
#include "app/Config.hpp"
#include "util/TomlReader.hpp"
#include <cstdlib>
#include <string>

using rmon::app::CliOverrides;
using rmon::app::Config;
using rmon::app::resolve_config;
using rmon::util::LogLevel;

static void clear_env() {
  for (const char* n : {"RMON_URL", "RMON_INTERVAL_MS", "RMON_CHART_WIDTH", "RMON_CHART_HEIGHT",
                        "RMON_ALT_SCREEN", "RMON_METRICS_PORT", "RMON_LOG", "RMON_SOURCES_SPAM",
                        "RMON_SOURCES_HAM", "RMON_SOURCES_JUNK", "rmon_URL"}) {
    ::unsetenv(n);
  }
}

TEST(config_defaults) {
  clear_env();
  Config c = resolve_config(CliOverrides{}, nullptr);
  ASSERT_EQ(c.poll.url, "http://localhost:11334/stat");
  ASSERT_EQ(c.poll.interval_ms, 1000);
  ASSERT_EQ(c.chart.width, 80);
  ASSERT_EQ(c.chart.height, 6);
  ASSERT_EQ(c.metrics.port, 0);
  ASSERT_TRUE(c.log_level == LogLevel::Warn);
  ASSERT_EQ(c.spam_sources.size(), 1u);
  ASSERT_EQ(c.junk_sources.size(), 4u);
}

TEST(config_env_applies) {
  clear_env();
  ::setenv("RMON_URL", "http://10.0.0.1:11334/stat", 1);
  ::setenv("RMON_CHART_WIDTH", "40", 1);
  ::setenv("RMON_SOURCES_SPAM", "reject, soft reject", 1);
  ::setenv("RMON_LOG", "debug", 1);
  Config c = resolve_config(CliOverrides{}, nullptr);
  ASSERT_EQ(c.poll.url, "http://10.0.0.1:11334/stat");
  ASSERT_EQ(c.chart.width, 40);
  ASSERT_EQ(c.spam_sources.size(), 2u);
  ASSERT_EQ(c.spam_sources[1], "soft reject");
  ASSERT_TRUE(c.log_level == LogLevel::Debug);
  clear_env();
}

TEST(config_lowercase_env_prefix) {
  clear_env();
  ::setenv("rmon_URL", "http://lower/stat", 1);
  Config c = resolve_config(CliOverrides{}, nullptr);
  ASSERT_EQ(c.poll.url, "http://lower/stat");
  clear_env();
}

TEST(config_toml_beats_env) {
  clear_env();
  ::setenv("RMON_CHART_WIDTH", "40", 1);
  ::setenv("RMON_INTERVAL_MS", "3000", 1);
  rmon::util::TomlReader toml;
  toml.load_string("[chart]\nwidth = 60\n[sources]\nham = [\"clean\"]\n[metrics]\nport = 9100\n");
  Config c = resolve_config(CliOverrides{}, &toml);
  ASSERT_EQ(c.chart.width, 60);
  ASSERT_EQ(c.poll.interval_ms, 3000);
  ASSERT_EQ(c.metrics.port, 9100);
  ASSERT_EQ(c.ham_sources.size(), 1u);
  ASSERT_EQ(c.ham_sources[0], "clean");
  clear_env();
}

TEST(config_cli_beats_everything) {
  clear_env();
  ::setenv("RMON_URL", "http://env/stat", 1);
  rmon::util::TomlReader toml;
  toml.load_string("[poll]\nurl = \"http://toml/stat\"\ninterval_ms = 5000\n[chart]\nheight = 3\n");
  CliOverrides cli;
  cli.url = "http://cli/stat";
  cli.timeout_secs = 0.5;
  cli.chart_height = 10;
  cli.verbose = 2;
  Config c = resolve_config(cli, &toml);
  ASSERT_EQ(c.poll.url, "http://cli/stat");
  ASSERT_EQ(c.poll.interval_ms, 500);
  ASSERT_EQ(c.chart.height, 10);
  ASSERT_TRUE(c.log_level == LogLevel::Debug);
  clear_env();
}

TEST(config_invalid_values_fall_back) {
  clear_env();
  CliOverrides cli;
  cli.chart_width = 0;
  cli.timeout_secs = -1.0;
  cli.metrics_port = 70000;
  Config c = resolve_config(cli, nullptr);
  ASSERT_EQ(c.chart.width, 80);
  ASSERT_EQ(c.poll.interval_ms, 1000);
  ASSERT_EQ(c.metrics.port, 0);
}

TEST(config_huge_timeout_falls_back) {
  clear_env();
  CliOverrides cli;
  cli.timeout_secs = 1e10;
  ASSERT_EQ(resolve_config(cli, nullptr).poll.interval_ms, 1000);
  cli.timeout_secs = -1e10;
  ASSERT_EQ(resolve_config(cli, nullptr).poll.interval_ms, 1000);
  cli.timeout_secs = 2147483.0; // just under INT_MAX milliseconds
  ASSERT_EQ(resolve_config(cli, nullptr).poll.interval_ms, 2147483000);
}

TEST(config_aggregator_mapping) {
  clear_env();
  Config c = resolve_config(CliOverrides{}, nullptr);
  c.chart.width = 30;
  c.spam_sources = {"reject", "soft reject"};
  auto agg = rmon::app::aggregator_config(c);
  ASSERT_EQ(agg.window, 30u);
  ASSERT_EQ(agg.rates.size(), 3u);
  ASSERT_EQ(agg.rates[0].key, "spam");
  ASSERT_EQ(agg.rates[0].sources.size(), 2u);
  ASSERT_EQ(agg.rates[1].sources[0], "no action");
}

TEST(config_file_path_prefers_xdg) {
  ::setenv("XDG_CONFIG_HOME", "/tmp/rmon-xdg", 1);
  ASSERT_EQ(rmon::app::config_file_path(), "/tmp/rmon-xdg/rspamd-mon/config.toml");
  ::unsetenv("XDG_CONFIG_HOME");
  ::setenv("HOME", "/tmp/rmon-home", 1);
  ASSERT_EQ(rmon::app::config_file_path(), "/tmp/rmon-home/.config/rspamd-mon/config.toml");
}

TEST(config_log_level_parsing) {
  LogLevel lvl = LogLevel::Warn;
  ASSERT_TRUE(rmon::util::parse_log_level("trace", lvl));
  ASSERT_TRUE(lvl == LogLevel::Trace);
  ASSERT_TRUE(!rmon::util::parse_log_level("loud", lvl));
  ASSERT_TRUE(lvl == LogLevel::Trace);
  ASSERT_TRUE(rmon::util::log_level_from_verbosity(0) == LogLevel::Warn);
  ASSERT_TRUE(rmon::util::log_level_from_verbosity(1) == LogLevel::Info);
  ASSERT_TRUE(rmon::util::log_level_from_verbosity(5) == LogLevel::Trace);
}
