// Utility helpers for hex validation and small string chores
#include "sprig/util.hpp"

#include "sprig/consts.hpp"

#include <algorithm>
#include <cctype>

namespace sprig {

bool looks_hex40(std::string_view str) {
  return str.size() == consts::kOidHexLen && looks_hex_prefix(str);
}

bool looks_hex_prefix(std::string_view str) {
  if (str.empty() || str.size() > consts::kOidHexLen) {
    return false;
  }
  return std::ranges::all_of(str,
                             [](char c) { return std::isxdigit(static_cast<unsigned char>(c)); });
}

namespace strutil {

void rstrip_newlines(std::string &s) {
  while (!s.empty()) {
    char c = s.back();
    if (c == '\n' || c == '\r') {
      s.pop_back();
    } else {
      break;
    }
  }
}

std::string trim(std::string_view sv) {
  auto is_blank = [](char c) { return c == ' ' || c == '\t' || c == '\r' || c == '\n'; };
  while (!sv.empty() && is_blank(sv.front()))
    sv.remove_prefix(1);
  while (!sv.empty() && is_blank(sv.back()))
    sv.remove_suffix(1);
  return std::string(sv);
}

std::string first_line(std::string_view text) {
  const auto nl = text.find('\n');
  return std::string(nl == std::string_view::npos ? text : text.substr(0, nl));
}

} // namespace strutil

} // namespace sprig
