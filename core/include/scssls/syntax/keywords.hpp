// scssls/syntax/keywords.hpp - Keyword tables and case-insensitive matching
#pragma once

#include <array>
#include <cctype>
#include <string_view>

namespace scssls::syntax
{

/// ASCII case-insensitive comparison (CSS keywords are case-insensitive).
[[nodiscard]] inline bool equals_ignore_case(std::string_view a, std::string_view b) noexcept
{
  if (a.size() != b.size()) {
    return false;
  }
  for (size_t i = 0; i < a.size(); ++i) {
    if (
      std::tolower(static_cast<unsigned char>(a[i])) !=
      std::tolower(static_cast<unsigned char>(b[i]))) {
      return false;
    }
  }
  return true;
}

[[nodiscard]] inline bool starts_with_ignore_case(std::string_view s, std::string_view prefix) noexcept
{
  return s.size() >= prefix.size() && equals_ignore_case(s.substr(0, prefix.size()), prefix);
}

inline constexpr std::array<std::string_view, 5> k_keyframes_keywords = {
  "@keyframes", "@-webkit-keyframes", "@-ms-keyframes", "@-moz-keyframes", "@-o-keyframes",
};

/// Directives that produce a Debug node.
inline constexpr std::array<std::string_view, 3> k_debug_keywords = {
  "@debug",
  "@warn",
  "@error",
};

/// Words that act as binary operators in dialect expressions.
inline constexpr std::array<std::string_view, 2> k_word_operators = {"and", "or"};

}  // namespace scssls::syntax
