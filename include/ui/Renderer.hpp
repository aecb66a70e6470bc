#pragma once

#include <string>
#include <vector>
#include "app/SharedStats.hpp"

namespace rmon::ui {

// "Rspamd <version> | uptime 1d 02:03:04 | scanned N", only the known parts;
// empty when nothing is known.
[[nodiscard]] std::string frame_header(const rmon::model::UpstreamInfo& upstream);

// Home the cursor, clear, print the header, then stack one chart per
// non-empty series.
[[nodiscard]] std::string compose_frame(const std::vector<rmon::app::SeriesView>& series, int height,
                                        bool unicode, bool color,
                                        const rmon::model::UpstreamInfo& upstream = {});

// Write a frame for the current stats to stdout.
void render_screen(const rmon::app::SharedStats& stats, int height);

} // namespace rmon::ui
