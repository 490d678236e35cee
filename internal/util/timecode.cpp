#include "timecode.hpp"

#include <cctype>
#include <cstdio>
#include <cstdlib>
#include <string>
#include <vector>

namespace mediaforge::util {

namespace {

std::optional<double> ParseField(const std::string& field, bool allow_fraction) {
  if (field.empty()) {
    return std::nullopt;
  }

  bool seen_dot = false;
  for (char c : field) {
    if (c == '.') {
      if (!allow_fraction || seen_dot) return std::nullopt;
      seen_dot = true;
      continue;
    }
    if (!std::isdigit(static_cast<unsigned char>(c))) return std::nullopt;
  }
  if (field == ".") {
    return std::nullopt;
  }
  return std::strtod(field.c_str(), nullptr);
}

} // namespace

std::optional<double> ParseTimecode(std::string_view text) {
  // trim surrounding whitespace
  while (!text.empty() && std::isspace(static_cast<unsigned char>(text.front()))) text.remove_prefix(1);
  while (!text.empty() && std::isspace(static_cast<unsigned char>(text.back()))) text.remove_suffix(1);
  if (text.empty()) {
    return std::nullopt;
  }

  std::vector<std::string> parts;
  std::string              current;
  for (char c : text) {
    if (c == ':') {
      parts.push_back(current);
      current.clear();
    } else {
      current.push_back(c);
    }
  }
  parts.push_back(current);

  if (parts.size() > 3) {
    return std::nullopt;
  }

  double total = 0.0;
  for (size_t i = 0; i < parts.size(); ++i) {
    const bool last  = i + 1 == parts.size();
    auto       value = ParseField(parts[i], last);
    if (!value) {
      return std::nullopt;
    }
    // every field after the leading one is bounded by 60
    if (i > 0 && *value >= 60.0) {
      return std::nullopt;
    }
    total = total * 60.0 + *value;
  }
  return total;
}

std::string FormatSeconds(double seconds) {
  if (seconds < 0.0) seconds = 0.0;
  char buf[32];
  std::snprintf(buf, sizeof(buf), "%.3f", seconds);
  return buf;
}

} // namespace mediaforge::util
