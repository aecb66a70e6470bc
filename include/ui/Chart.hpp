#pragma once

#include <string>
#include <vector>
#include "app/SharedStats.hpp"

namespace rmon::ui {

// Plot 'values' (one column each) as a line chart 'height' rows tall with a
// labelled y axis. Returns one string per terminal row, top row first. An
// empty input yields no rows.
[[nodiscard]] std::vector<std::string> plot_lines(const std::vector<double>& values, int height, bool unicode);

// "[Label: x] [LAST: x] [AVG: x] [MIN: x] [MAX: x]", two decimals each
[[nodiscard]] std::string chart_caption(const rmon::app::SeriesView& s, bool color);

// Plot plus caption for one series; empty when the series has no points.
[[nodiscard]] std::vector<std::string> render_chart(const rmon::app::SeriesView& s, int height,
                                                    bool unicode, bool color);

} // namespace rmon::ui
