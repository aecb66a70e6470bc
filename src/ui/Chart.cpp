#include "ui/Chart.hpp"
#include "ui/Terminal.hpp"
#include "stats/Series.hpp"
#include <algorithm>
#include <cmath>
#include <cstdio>

namespace rmon::ui {

namespace {

struct Glyphs {
  const char* axis;       // ┤
  const char* axis_mark;  // ┼
  const char* flat;       // ─
  const char* down_top;   // ╮
  const char* down_bot;   // ╰
  const char* up_bot;     // ╯
  const char* up_top;     // ╭
  const char* vert;       // │
};

constexpr Glyphs kUnicode{"┤", "┼", "─", "╮", "╰", "╯", "╭", "│"};
constexpr Glyphs kAscii{"|", "+", "-", "\\", "\\", "/", "/", "|"};

std::string fmt2(double v) {
  char buf[64];
  std::snprintf(buf, sizeof(buf), "%.2f", v);
  return buf;
}

} // namespace

std::vector<std::string> plot_lines(const std::vector<double>& values, int height, bool unicode) {
  std::vector<std::string> out;
  if (values.empty()) return out;
  const Glyphs& g = unicode ? kUnicode : kAscii;
  if (height < 1) height = 1;

  auto [mn_it, mx_it] = std::minmax_element(values.begin(), values.end());
  double mn = *mn_it, mx = *mx_it;
  double interval = mx - mn;
  double ratio = interval > 0.0 ? static_cast<double>(height) / interval : 1.0;
  long min2 = std::lround(mn * ratio);
  long max2 = std::lround(mx * ratio);
  int rows = static_cast<int>(std::max(0L, max2 - min2));

  // y axis labels, widest decides the gutter
  std::vector<std::string> labels(static_cast<size_t>(rows) + 1);
  size_t label_w = 0;
  for (int r = 0; r <= rows; ++r) {
    double v = rows > 0 ? mx - static_cast<double>(r) * interval / rows : mx;
    labels[static_cast<size_t>(r)] = fmt2(v);
    label_w = std::max(label_w, labels[static_cast<size_t>(r)].size());
  }

  const size_t width = values.size();
  std::vector<std::vector<const char*>> grid(static_cast<size_t>(rows) + 1,
                                             std::vector<const char*>(width + 1, " "));
  for (auto& row : grid) row[0] = g.axis;

  auto scaled = [&](double v) {
    return static_cast<int>(std::clamp<long>(std::lround(v * ratio) - min2, 0L, static_cast<long>(rows)));
  };

  int first = scaled(values[0]);
  grid[static_cast<size_t>(rows - first)][0] = g.axis_mark;
  if (width == 1) grid[static_cast<size_t>(rows - first)][1] = g.flat;

  for (size_t x = 0; x + 1 < width; ++x) {
    int y0 = scaled(values[x]);
    int y1 = scaled(values[x + 1]);
    size_t col = x + 1;
    if (y0 == y1) {
      grid[static_cast<size_t>(rows - y0)][col] = g.flat;
      continue;
    }
    if (y0 > y1) {
      grid[static_cast<size_t>(rows - y1)][col] = g.down_bot;
      grid[static_cast<size_t>(rows - y0)][col] = g.down_top;
    } else {
      grid[static_cast<size_t>(rows - y1)][col] = g.up_top;
      grid[static_cast<size_t>(rows - y0)][col] = g.up_bot;
    }
    for (int y = std::min(y0, y1) + 1; y < std::max(y0, y1); ++y)
      grid[static_cast<size_t>(rows - y)][col] = g.vert;
  }

  out.reserve(grid.size());
  for (size_t r = 0; r < grid.size(); ++r) {
    std::string line(label_w - labels[r].size(), ' ');
    line += labels[r];
    line += ' ';
    for (const char* cell : grid[r]) line += cell;
    // trailing blanks are noise on narrow terminals
    while (!line.empty() && line.back() == ' ') line.pop_back();
    out.push_back(std::move(line));
  }
  return out;
}

std::string chart_caption(const rmon::app::SeriesView& s, bool color) {
  auto sum = rmon::stats::summarize(s.history.begin(), s.history.end());
  auto paint = [&](const std::string& code, const std::string& text) {
    return color ? code + text + sgr_reset() : text;
  };
  std::string out = "[Label: " + paint(sgr_bold(), s.label) + "]";
  out += " [LAST: " + paint(sgr_fg_purple_underline(), fmt2(sum.last)) + "]";
  out += " [AVG: " + paint(sgr_fg_white_bold(), fmt2(sum.mean)) + "]";
  out += " [MIN: " + paint(sgr_fg_grn(), fmt2(sum.min)) + "]";
  out += " [MAX: " + paint(sgr_fg_red(), fmt2(sum.max)) + "]";
  return out;
}

std::vector<std::string> render_chart(const rmon::app::SeriesView& s, int height, bool unicode, bool color) {
  auto lines = plot_lines(s.history, height, unicode);
  if (lines.empty()) return lines;
  lines.push_back(std::string(4, ' ') + chart_caption(s, color));
  return lines;
}

} // namespace rmon::ui
