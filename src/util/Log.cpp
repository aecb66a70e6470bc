#include "util/Log.hpp"
#include <atomic>
#include <chrono>
#include <cstdarg>
#include <cstdio>
#include <ctime>

namespace rmon::util {

static std::atomic<LogLevel> g_level{LogLevel::Warn};

void set_log_level(LogLevel lvl) { g_level.store(lvl, std::memory_order_relaxed); }

LogLevel log_level() { return g_level.load(std::memory_order_relaxed); }

LogLevel log_level_from_verbosity(int verbose) {
  if (verbose <= 0) return LogLevel::Warn;
  if (verbose == 1) return LogLevel::Info;
  if (verbose == 2) return LogLevel::Debug;
  return LogLevel::Trace;
}

bool parse_log_level(std::string_view s, LogLevel& out) {
  if (s == "error") { out = LogLevel::Error; return true; }
  if (s == "warn" || s == "warning") { out = LogLevel::Warn; return true; }
  if (s == "info") { out = LogLevel::Info; return true; }
  if (s == "debug") { out = LogLevel::Debug; return true; }
  if (s == "trace") { out = LogLevel::Trace; return true; }
  return false;
}

static const char* level_name(LogLevel lvl) {
  switch (lvl) {
    case LogLevel::Error: return "ERROR";
    case LogLevel::Warn:  return "WARN";
    case LogLevel::Info:  return "INFO";
    case LogLevel::Debug: return "DEBUG";
    case LogLevel::Trace: return "TRACE";
  }
  return "?";
}

void log(LogLevel lvl, const char* component, const char* fmt, ...) {
  if (static_cast<uint8_t>(lvl) > static_cast<uint8_t>(log_level())) return;

  auto now = std::chrono::system_clock::now();
  auto us = std::chrono::duration_cast<std::chrono::microseconds>(now.time_since_epoch()).count();
  std::time_t secs = static_cast<std::time_t>(us / 1000000);
  std::tm tm{};
  ::gmtime_r(&secs, &tm);
  char ts[40];
  std::snprintf(ts, sizeof(ts), "%04d-%02d-%02dT%02d:%02d:%02d.%06lldZ",
                tm.tm_year + 1900, tm.tm_mon + 1, tm.tm_mday, tm.tm_hour, tm.tm_min, tm.tm_sec,
                static_cast<long long>(us % 1000000));

  char msg[1024];
  va_list ap;
  va_start(ap, fmt);
  std::vsnprintf(msg, sizeof(msg), fmt, ap);
  va_end(ap);

  // single write per line so concurrent threads do not interleave
  std::fprintf(stderr, "[%s %-5s] rspamd-mon: %s: %s\n", ts, level_name(lvl), component, msg);
}

} // namespace rmon::util
