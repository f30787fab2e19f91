#pragma once
#include <algorithm>
#include <cctype>
#include <cstdint>
#include <optional>
#include <string>
#include <vector>

namespace tsim::csv {

inline std::string trim(std::string s) {
  auto not_space = [](unsigned char c){ return !std::isspace(c); };
  s.erase(s.begin(), std::find_if(s.begin(), s.end(), not_space));
  s.erase(std::find_if(s.rbegin(), s.rend(), not_space).base(), s.end());
  return s;
}

// No quoting; fields never contain commas.
inline std::vector<std::string> split_line(const std::string& line) {
  std::vector<std::string> cols;
  std::string cur;
  for (char c : line) {
    if (c == ',') { cols.push_back(trim(cur)); cur.clear(); }
    else { cur.push_back(c); }
  }
  cols.push_back(trim(cur));
  return cols;
}

inline std::optional<std::int64_t> to_int(const std::string& s) {
  if (s.empty()) return std::nullopt;
  try {
    size_t idx = 0;
    const long long v = std::stoll(s, &idx);
    if (idx != s.size()) return std::nullopt;
    return static_cast<std::int64_t>(v);
  } catch (const std::exception&) {
    return std::nullopt;
  }
}

// Plain decimal digits only; no sign, no spaces.
inline std::optional<std::uint64_t> to_uint(const std::string& s) {
  if (s.empty() || s.size() > 20) return std::nullopt;
  for (char c : s) {
    if (c < '0' || c > '9') return std::nullopt;
  }
  try {
    size_t idx = 0;
    const unsigned long long v = std::stoull(s, &idx);
    if (idx != s.size()) return std::nullopt;
    return static_cast<std::uint64_t>(v);
  } catch (const std::exception&) {
    return std::nullopt;
  }
}

inline bool skippable(const std::string& trimmed) {
  return trimmed.empty() || trimmed[0] == '#';
}

} // namespace tsim::csv
