#pragma once

#include <cstdint>
#include <optional>
#include <string>
#include <vector>
#include "stats/StatAggregator.hpp"
#include "util/Log.hpp"

namespace rmon::util { class TomlReader; }

namespace rmon::app {

struct Config {
  struct Poll {
    std::string url{"http://localhost:11334/stat"};
    int interval_ms{1000};
    std::string user_agent{"rspamd-mon"};
  } poll;
  struct Chart {
    int width{80};  // also the history window
    int height{6};
    bool alt_screen{false};
  } chart;
  struct Metrics {
    int port{0}; // 0 disables the exporter
  } metrics;
  rmon::util::LogLevel log_level{rmon::util::LogLevel::Warn};
  std::vector<std::string> spam_sources{"reject"};
  std::vector<std::string> ham_sources{"no action", "no_action"};
  std::vector<std::string> junk_sources{"add header", "add_header", "rewrite subject", "rewrite_subject"};
};

// Values given on the command line; they win over every other source.
struct CliOverrides {
  std::optional<std::string> url;
  std::optional<double> timeout_secs;
  std::optional<int> chart_width;
  std::optional<int> chart_height;
  std::optional<int> metrics_port;
  std::optional<std::string> config_path;
  int verbose{0};
};

// Environment helpers (RMON_FOO, falling back to rmon_foo)
const char* getenv_compat(const char* name);
int getenv_int(const char* name, int defv);

// $XDG_CONFIG_HOME/rspamd-mon/config.toml or ~/.config/rspamd-mon/config.toml
[[nodiscard]] std::string config_file_path();

// Resolve command line -> TOML -> environment -> compiled default.
[[nodiscard]] Config resolve_config(const CliOverrides& cli, const rmon::util::TomlReader* toml);

// Load the TOML file named by the overrides (or the default path) and resolve.
[[nodiscard]] Config load_config(const CliOverrides& cli);

[[nodiscard]] rmon::stats::AggregatorConfig aggregator_config(const Config& c);

} // namespace rmon::app
