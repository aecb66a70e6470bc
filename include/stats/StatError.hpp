#pragma once
#include <cstdint>

namespace rmon::stats {

// Result of a counter, series or aggregator update.
enum class StatError : uint8_t {
  Ok,
  DivisionByZero, // rate update with a zero elapsed interval
  MissingField    // snapshot lacks the "actions" mapping
};

[[nodiscard]] inline const char* describe(StatError e) {
  switch (e) {
    case StatError::Ok:             return "ok";
    case StatError::DivisionByZero: return "division by zero";
    case StatError::MissingField:   return "missing field: actions";
  }
  return "unknown";
}

} // namespace rmon::stats
