// Leveled stderr logging
#pragma once
#include <cstdint>
#include <string_view>

namespace rmon::util {

enum class LogLevel : uint8_t { Error, Warn, Info, Debug, Trace };

void set_log_level(LogLevel lvl);
[[nodiscard]] LogLevel log_level();

// -v count: 0 warn, 1 info, 2 debug, 3+ trace
[[nodiscard]] LogLevel log_level_from_verbosity(int verbose);
// "error", "warn", "info", "debug", "trace"; false if unrecognised
[[nodiscard]] bool parse_log_level(std::string_view s, LogLevel& out);

// printf-style; prefixed with a microsecond UTC timestamp, level and component
void log(LogLevel lvl, const char* component, const char* fmt, ...)
    __attribute__((format(printf, 3, 4)));

} // namespace rmon::util
