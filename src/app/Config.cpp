#include "app/Config.hpp"
#include "util/TomlReader.hpp"
#include <cmath>
#include <cstdlib>
#include <limits>
#include <string>

namespace rmon::app {

namespace {
constexpr const char* kComponent = "config";
}

const char* getenv_compat(const char* name) {
  const char* v = std::getenv(name);
  if (v && *v) return v;
  std::string alt;
  std::string n(name);
  if (n.rfind("RMON_", 0) == 0) {
    alt = std::string("rmon_") + n.substr(5);
  } else if (n.rfind("rmon_", 0) == 0) {
    alt = std::string("RMON_") + n.substr(5);
  }
  if (!alt.empty()) {
    v = std::getenv(alt.c_str());
    if (v && *v) return v;
  }
  return nullptr;
}

int getenv_int(const char* name, int defv) {
  const char* v = getenv_compat(name);
  if (!v || !*v) return defv;
  try { return std::stoi(v); } catch(...) { return defv; }
}

std::string config_file_path() {
  if (const char* xdg = std::getenv("XDG_CONFIG_HOME"); xdg && *xdg)
    return std::string(xdg) + "/rspamd-mon/config.toml";
  if (const char* home = std::getenv("HOME"); home && *home)
    return std::string(home) + "/.config/rspamd-mon/config.toml";
  return {};
}

static int resolve_int(const rmon::util::TomlReader* toml, const char* section, const char* key,
                       const char* env_name, int def) {
  if (toml && toml->has(section, key)) return toml->get_int(section, key, def);
  if (env_name) return getenv_int(env_name, def);
  return def;
}

static bool resolve_bool(const rmon::util::TomlReader* toml, const char* section, const char* key,
                         const char* env_name, bool def) {
  if (toml && toml->has(section, key)) return toml->get_bool(section, key, def);
  if (env_name) {
    const char* v = getenv_compat(env_name);
    if (!v) return def;
    return !(v[0]=='0' || v[0]=='f' || v[0]=='F' || v[0]=='n' || v[0]=='N');
  }
  return def;
}

static std::string resolve_string(const rmon::util::TomlReader* toml, const char* section, const char* key,
                                  const char* env_name, const std::string& def) {
  if (toml && toml->has(section, key)) return toml->get_string(section, key, def);
  if (env_name) {
    const char* v = getenv_compat(env_name);
    if (v && *v) return std::string(v);
  }
  return def;
}

static std::vector<std::string> resolve_list(const rmon::util::TomlReader* toml, const char* key,
                                             const char* env_name, const std::vector<std::string>& def) {
  if (toml && toml->has("sources", key)) {
    auto v = toml->get_list("sources", key);
    if (!v.empty()) return v;
  }
  if (env_name) {
    const char* v = getenv_compat(env_name);
    if (v && *v) {
      auto parts = rmon::util::TomlReader::split_list(v);
      if (!parts.empty()) return parts;
    }
  }
  return def;
}

Config resolve_config(const CliOverrides& cli, const rmon::util::TomlReader* toml) {
  Config c{};
  const Config defaults{};

  // --- [poll] ---
  c.poll.url         = resolve_string(toml, "poll", "url", "RMON_URL", defaults.poll.url);
  c.poll.interval_ms = resolve_int(toml, "poll", "interval_ms", "RMON_INTERVAL_MS", defaults.poll.interval_ms);
  c.poll.user_agent  = resolve_string(toml, "poll", "user_agent", nullptr, defaults.poll.user_agent);

  // --- [chart] ---
  c.chart.width      = resolve_int(toml, "chart", "width", "RMON_CHART_WIDTH", defaults.chart.width);
  c.chart.height     = resolve_int(toml, "chart", "height", "RMON_CHART_HEIGHT", defaults.chart.height);
  c.chart.alt_screen = resolve_bool(toml, "chart", "alt_screen", "RMON_ALT_SCREEN", defaults.chart.alt_screen);

  // --- [metrics] ---
  c.metrics.port = resolve_int(toml, "metrics", "port", "RMON_METRICS_PORT", defaults.metrics.port);

  // --- [log] ---
  std::string lvl = resolve_string(toml, "log", "level", "RMON_LOG", "");
  if (!lvl.empty() && !rmon::util::parse_log_level(lvl, c.log_level)) {
    rmon::util::log(rmon::util::LogLevel::Warn, kComponent, "unknown log level '%s', using warn", lvl.c_str());
  }

  // --- [sources] ---
  c.spam_sources = resolve_list(toml, "spam", "RMON_SOURCES_SPAM", defaults.spam_sources);
  c.ham_sources  = resolve_list(toml, "ham",  "RMON_SOURCES_HAM",  defaults.ham_sources);
  c.junk_sources = resolve_list(toml, "junk", "RMON_SOURCES_JUNK", defaults.junk_sources);

  // --- command line ---
  if (cli.url) c.poll.url = *cli.url;
  if (cli.timeout_secs) {
    double ms = *cli.timeout_secs * 1000.0;
    // out of int range is as invalid as a non-positive interval
    bool fits = std::isfinite(ms) && ms >= 0.0 && ms <= static_cast<double>(std::numeric_limits<int>::max());
    c.poll.interval_ms = fits ? static_cast<int>(std::lround(ms)) : 0;
  }
  if (cli.chart_width) c.chart.width = *cli.chart_width;
  if (cli.chart_height) c.chart.height = *cli.chart_height;
  if (cli.metrics_port) c.metrics.port = *cli.metrics_port;
  if (cli.verbose > 0) c.log_level = rmon::util::log_level_from_verbosity(cli.verbose);

  // --- validation ---
  if (c.poll.interval_ms <= 0) {
    rmon::util::log(rmon::util::LogLevel::Warn, kComponent, "poll interval must be positive, using %d ms",
                    defaults.poll.interval_ms);
    c.poll.interval_ms = defaults.poll.interval_ms;
  }
  if (c.chart.width <= 0) {
    rmon::util::log(rmon::util::LogLevel::Warn, kComponent, "chart width must be positive, using %d",
                    defaults.chart.width);
    c.chart.width = defaults.chart.width;
  }
  if (c.chart.height <= 0) c.chart.height = defaults.chart.height;
  if (c.metrics.port < 0 || c.metrics.port > 65535) {
    rmon::util::log(rmon::util::LogLevel::Warn, kComponent, "metrics port %d out of range, exporter disabled",
                    c.metrics.port);
    c.metrics.port = 0;
  }
  return c;
}

Config load_config(const CliOverrides& cli) {
  rmon::util::TomlReader toml;
  std::string path = cli.config_path ? *cli.config_path : config_file_path();
  bool have_toml = !path.empty() && toml.load(path);
  if (cli.config_path && !have_toml) {
    rmon::util::log(rmon::util::LogLevel::Warn, kComponent, "cannot read %s, using defaults", path.c_str());
  }
  return resolve_config(cli, have_toml ? &toml : nullptr);
}

rmon::stats::AggregatorConfig aggregator_config(const Config& c) {
  auto agg = rmon::stats::default_aggregator_config(static_cast<size_t>(c.chart.width));
  for (auto& r : agg.rates) {
    if (r.key == "spam") r.sources = c.spam_sources;
    else if (r.key == "ham") r.sources = c.ham_sources;
    else if (r.key == "junk") r.sources = c.junk_sources;
  }
  return agg;
}

} // namespace rmon::app
