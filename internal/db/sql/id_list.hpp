#pragma once

#include <string>
#include <vector>

namespace ridedispatch::db::sql {

// Codec for the notified_driver_ids / excluded_driver_ids columns: ids joined
// by ',' in order, with '\' and ',' inside an id escaped by a leading '\'.
// Driver ids are never empty, so "" is the empty list.

inline std::string JoinIds(const std::vector<std::string>& ids) {
  std::string out;
  for (size_t i = 0; i < ids.size(); ++i) {
    if (i) out += ',';
    for (char c : ids[i]) {
      if (c == ',' || c == '\\') out += '\\';
      out += c;
    }
  }
  return out;
}

inline std::vector<std::string> SplitIds(const std::string& joined) {
  std::vector<std::string> out;
  if (joined.empty()) return out;

  std::string current;
  for (size_t i = 0; i < joined.size(); ++i) {
    const char c = joined[i];
    if (c == '\\' && i + 1 < joined.size()) {
      current += joined[++i];
    } else if (c == ',') {
      out.push_back(std::move(current));
      current.clear();
    } else {
      current += c;
    }
  }
  out.push_back(std::move(current));
  return out;
}

} // namespace ridedispatch::db::sql
