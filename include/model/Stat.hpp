#pragma once
#include <cstdint>
#include <optional>
#include <string>
#include <unordered_map>
#include <vector>

namespace rmon::model {

// One decoded /stat response. Fields the upstream did not send stay empty.
struct StatSnapshot {
  // action name -> cumulative message count
  std::optional<std::unordered_map<std::string, uint64_t>> actions;
  // recent per-message scan times in seconds; non-numeric entries are NaN
  std::optional<std::vector<double>> scan_times;
  // informational
  std::string version;
  std::optional<uint64_t> uptime;  // seconds
  std::optional<uint64_t> scanned; // messages scanned since start
};

// Informational fields of the most recently applied snapshot
struct UpstreamInfo {
  std::string version;
  std::optional<uint64_t> uptime;
  std::optional<uint64_t> scanned;
};

} // namespace rmon::model
