#include "collectors/StatDecoder.hpp"
#include <nlohmann/json.hpp>
#include <limits>

using json = nlohmann::json;

namespace rmon::collectors {

bool decode_stat(std::string_view body, rmon::model::StatSnapshot& out, std::string& err) {
  out = rmon::model::StatSnapshot{};
  json doc = json::parse(body.begin(), body.end(), nullptr, /*allow_exceptions=*/false);
  if (doc.is_discarded()) { err = "malformed json"; return false; }
  if (!doc.is_object()) { err = "json root is not an object"; return false; }

  if (auto it = doc.find("actions"); it != doc.end() && it->is_object()) {
    auto& actions = out.actions.emplace();
    for (auto a = it->begin(); a != it->end(); ++a) {
      // negative, fractional or non-numeric counts count as zero
      actions[a.key()] = a.value().is_number_unsigned() ? a.value().get<uint64_t>() : 0;
    }
  }

  if (auto it = doc.find("scan_times"); it != doc.end() && it->is_array()) {
    auto& times = out.scan_times.emplace();
    times.reserve(it->size());
    for (const auto& v : *it) {
      times.push_back(v.is_number() ? v.get<double>() : std::numeric_limits<double>::quiet_NaN());
    }
  }

  if (auto it = doc.find("version"); it != doc.end() && it->is_string()) out.version = it->get<std::string>();
  if (auto it = doc.find("uptime"); it != doc.end() && it->is_number_unsigned()) out.uptime = it->get<uint64_t>();
  if (auto it = doc.find("scanned"); it != doc.end() && it->is_number_unsigned()) out.scanned = it->get<uint64_t>();
  return true;
}

} // namespace rmon::collectors
