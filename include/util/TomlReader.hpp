#pragma once

#include <cctype>
#include <cstdlib>
#include <fstream>
#include <iterator>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

namespace rmon::util {

// Reader for the flat TOML subset used by the config file: [sections],
// key = value pairs, quoted strings, integers, floats, booleans and
// single-line string arrays. Trailing '#' comments outside quotes are dropped.
class TomlReader {
public:
  bool load(const std::string& path) {
    std::ifstream in(path);
    if (!in.is_open()) return false;
    std::string text((std::istreambuf_iterator<char>(in)), std::istreambuf_iterator<char>());
    load_string(text);
    return true;
  }

  void load_string(std::string_view text) {
    sections_.clear();
    std::string current;
    size_t pos = 0;
    while (pos <= text.size()) {
      size_t end = text.find('\n', pos);
      if (end == std::string_view::npos) end = text.size();
      auto sv = trim(strip_comment(text.substr(pos, end - pos)));
      pos = end + 1;
      if (sv.empty()) continue;
      if (sv.front() == '[' && sv.back() == ']') {
        current = std::string(trim(sv.substr(1, sv.size() - 2)));
        ensure_section(current);
        continue;
      }
      auto eq = sv.find('=');
      if (eq == std::string_view::npos) continue;
      std::string key(trim(sv.substr(0, eq)));
      if (key.empty()) continue;
      ensure_section(current).set(key, std::string(trim(sv.substr(eq + 1))));
    }
  }

  [[nodiscard]] bool has(std::string_view section, std::string_view key) const {
    return raw(section, key) != nullptr;
  }

  [[nodiscard]] std::string get_string(std::string_view section, std::string_view key,
                                       const std::string& def = "") const {
    const auto* v = raw(section, key);
    if (!v) return def;
    return unquote(*v);
  }

  [[nodiscard]] int get_int(std::string_view section, std::string_view key, int def = 0) const {
    const auto* v = raw(section, key);
    if (!v || v->empty()) return def;
    try { return std::stoi(*v); } catch (...) { return def; }
  }

  [[nodiscard]] double get_double(std::string_view section, std::string_view key, double def = 0.0) const {
    const auto* v = raw(section, key);
    if (!v || v->empty()) return def;
    try { return std::stod(*v); } catch (...) { return def; }
  }

  [[nodiscard]] bool get_bool(std::string_view section, std::string_view key, bool def = false) const {
    const auto* v = raw(section, key);
    if (!v) return def;
    if (*v == "true" || *v == "True" || *v == "TRUE" || *v == "1") return true;
    if (*v == "false" || *v == "False" || *v == "FALSE" || *v == "0") return false;
    return def;
  }

  // ["a", "b"] or a single comma-separated string "a, b"
  [[nodiscard]] std::vector<std::string> get_list(std::string_view section, std::string_view key) const {
    std::vector<std::string> out;
    const auto* v = raw(section, key);
    if (!v) return out;
    std::string_view body = *v;
    bool array = body.size() >= 2 && body.front() == '[' && body.back() == ']';
    if (array) body = body.substr(1, body.size() - 2);
    else {
      std::string s = unquote(*v);
      return split_list(s);
    }
    // array elements: quoted strings may contain commas
    std::string cur; bool in_q = false;
    for (char c : body) {
      if (c == '"') { in_q = !in_q; continue; }
      if (c == ',' && !in_q) {
        auto t = trim(cur);
        if (!t.empty()) out.emplace_back(t);
        cur.clear();
        continue;
      }
      cur.push_back(c);
    }
    auto t = trim(cur);
    if (!t.empty()) out.emplace_back(t);
    return out;
  }

  static std::vector<std::string> split_list(std::string_view s) {
    std::vector<std::string> out;
    size_t start = 0;
    while (start <= s.size()) {
      size_t comma = s.find(',', start);
      if (comma == std::string_view::npos) comma = s.size();
      auto t = trim(s.substr(start, comma - start));
      if (!t.empty()) out.emplace_back(t);
      start = comma + 1;
    }
    return out;
  }

private:
  struct Section {
    std::vector<std::pair<std::string, std::string>> entries;

    [[nodiscard]] const std::string* find(std::string_view key) const {
      for (const auto& [k, v] : entries)
        if (k == key) return &v;
      return nullptr;
    }

    void set(const std::string& key, std::string val) {
      for (auto& [k, v] : entries) {
        if (k == key) { v = std::move(val); return; }
      }
      entries.emplace_back(key, std::move(val));
    }
  };

  std::vector<std::pair<std::string, Section>> sections_;

  Section& ensure_section(const std::string& name) {
    for (auto& [n, s] : sections_)
      if (n == name) return s;
    sections_.emplace_back(name, Section{});
    return sections_.back().second;
  }

  [[nodiscard]] const std::string* raw(std::string_view section, std::string_view key) const {
    for (const auto& [n, s] : sections_)
      if (n == section) return s.find(key);
    return nullptr;
  }

  static std::string unquote(const std::string& v) {
    if (v.size() >= 2 && v.front() == '"' && v.back() == '"') return v.substr(1, v.size() - 2);
    return v;
  }

  static std::string_view strip_comment(std::string_view sv) {
    bool in_q = false;
    for (size_t i = 0; i < sv.size(); ++i) {
      if (sv[i] == '"') in_q = !in_q;
      else if (sv[i] == '#' && !in_q) return sv.substr(0, i);
    }
    return sv;
  }

  static std::string_view trim(std::string_view sv) {
    while (!sv.empty() && std::isspace(static_cast<unsigned char>(sv.front()))) sv.remove_prefix(1);
    while (!sv.empty() && std::isspace(static_cast<unsigned char>(sv.back()))) sv.remove_suffix(1);
    return sv;
  }
};

} // namespace rmon::util
