#include "ui/Renderer.hpp"
#include "ui/Chart.hpp"
#include "ui/Terminal.hpp"
#include <cstdio>
#include <unistd.h>

namespace rmon::ui {

std::string frame_header(const rmon::model::UpstreamInfo& upstream) {
  std::string out;
  auto part = [&](const std::string& s) {
    if (!out.empty()) out += " | ";
    out += s;
  };
  if (!upstream.version.empty()) part("Rspamd " + upstream.version);
  if (upstream.uptime) {
    uint64_t t = *upstream.uptime;
    char buf[64];
    std::snprintf(buf, sizeof(buf), "uptime %llud %02u:%02u:%02u",
                  static_cast<unsigned long long>(t / 86400), static_cast<unsigned>(t % 86400 / 3600),
                  static_cast<unsigned>(t % 3600 / 60), static_cast<unsigned>(t % 60));
    part(buf);
  }
  if (upstream.scanned) part("scanned " + std::to_string(*upstream.scanned));
  return out;
}

std::string compose_frame(const std::vector<rmon::app::SeriesView>& series, int height,
                          bool unicode, bool color, const rmon::model::UpstreamInfo& upstream) {
  std::string frame;
  if (color) frame += "\x1B[2J\x1B[H";
  if (auto header = frame_header(upstream); !header.empty()) {
    frame += color ? sgr_bold() + header + sgr_reset() : header;
    frame += "\n\n";
  }
  bool first = true;
  for (const auto& s : series) {
    auto lines = render_chart(s, height, unicode, color);
    if (lines.empty()) continue;
    if (!first) frame += '\n';
    first = false;
    for (const auto& l : lines) { frame += l; frame += '\n'; }
  }
  return frame;
}

void render_screen(const rmon::app::SharedStats& stats, int height) {
  // read() copies under the stats lock; formatting happens without it
  auto views = stats.read();
  auto frame = compose_frame(views, height, use_unicode(), tty_stdout(), stats.upstream());
  best_effort_write(STDOUT_FILENO, frame.data(), frame.size());
}

} // namespace rmon::ui
