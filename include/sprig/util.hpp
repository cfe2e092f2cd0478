#pragma once
#include <string>
#include <string_view>

namespace sprig {

// Validate 40-char lowercase/uppercase hex
auto looks_hex40(std::string_view str) -> bool;

// Non-empty string of hex digits, at most 40 long
auto looks_hex_prefix(std::string_view str) -> bool;

// String helpers
namespace strutil {
  // Strip trailing CR/LF characters in place
  void rstrip_newlines(std::string& str);

  // Copy of `sv` without leading/trailing spaces, tabs and CR/LF
  std::string trim(std::string_view sv);

  // First line of a message (without the newline)
  std::string first_line(std::string_view text);
}

}
