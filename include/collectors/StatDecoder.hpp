#pragma once
#include <string>
#include <string_view>
#include "model/Stat.hpp"

namespace rmon::collectors {

// Decode an Rspamd /stat JSON body. Returns false (with 'err') only when the
// body is not a JSON object; missing fields are left empty for the
// aggregator to judge.
[[nodiscard]] bool decode_stat(std::string_view body, rmon::model::StatSnapshot& out, std::string& err);

} // namespace rmon::collectors
