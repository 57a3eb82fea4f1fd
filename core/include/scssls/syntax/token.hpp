// scssls/syntax/token.hpp - Token kinds and token records
#pragma once

#include <cstdint>
#include <initializer_list>
#include <string_view>

#include "scssls/basic/source_manager.hpp"

namespace scssls::syntax
{

enum class TokenKind : uint8_t {
  Eof,

  Ident,
  AtKeyword,      // @media, @include, @-webkit-keyframes
  String,         // token.text includes the quotes
  BadString,      // unterminated string
  Hash,           // #name
  Num,            // 12, 1.5, .5, 1e3
  Percentage,     // 50%
  Dimension,      // 10px, 2em
  Uri,            // url(plain/path.png), whole function
  Cdo,            // <!--
  Cdc,            // -->

  Colon,
  SemiColon,
  CurlyL,
  CurlyR,
  ParenthesisL,
  ParenthesisR,
  BracketL,
  BracketR,
  Comma,

  Includes,           // ~=
  Dashmatch,          // |=
  SubstringOperator,  // *=
  PrefixOperator,     // ^=
  SuffixOperator,     // $=
  Exclamation,        // !
  Delim,              // any other single character

  // Dialect additions
  VariableName,           // $name
  InterpolationFunction,  // #{
  Ellipsis,               // ...
  EqualsOperator,         // ==
  NotEqualsOperator,      // !=
  GreaterEqualsOperator,  // >=
  SmallerEqualsOperator,  // <=
};

struct Token
{
  TokenKind kind = TokenKind::Eof;
  SourceRange range;
  std::string_view text;  // exact source slice
  bool preceded_by_trivia = false;

  [[nodiscard]] uint32_t begin() const noexcept { return range.begin(); }
  [[nodiscard]] uint32_t end() const noexcept { return range.end(); }
};

[[nodiscard]] constexpr std::string_view to_string(TokenKind k) noexcept
{
  switch (k) {
    case TokenKind::Eof:
      return "<eof>";
    case TokenKind::Ident:
      return "identifier";
    case TokenKind::AtKeyword:
      return "at-keyword";
    case TokenKind::String:
      return "string";
    case TokenKind::BadString:
      return "bad-string";
    case TokenKind::Hash:
      return "hash";
    case TokenKind::Num:
      return "number";
    case TokenKind::Percentage:
      return "percentage";
    case TokenKind::Dimension:
      return "dimension";
    case TokenKind::Uri:
      return "url";
    case TokenKind::Cdo:
      return "<!--";
    case TokenKind::Cdc:
      return "-->";
    case TokenKind::Colon:
      return ":";
    case TokenKind::SemiColon:
      return ";";
    case TokenKind::CurlyL:
      return "{";
    case TokenKind::CurlyR:
      return "}";
    case TokenKind::ParenthesisL:
      return "(";
    case TokenKind::ParenthesisR:
      return ")";
    case TokenKind::BracketL:
      return "[";
    case TokenKind::BracketR:
      return "]";
    case TokenKind::Comma:
      return ",";
    case TokenKind::Includes:
      return "~=";
    case TokenKind::Dashmatch:
      return "|=";
    case TokenKind::SubstringOperator:
      return "*=";
    case TokenKind::PrefixOperator:
      return "^=";
    case TokenKind::SuffixOperator:
      return "$=";
    case TokenKind::Exclamation:
      return "!";
    case TokenKind::Delim:
      return "delim";
    case TokenKind::VariableName:
      return "variable";
    case TokenKind::InterpolationFunction:
      return "#{";
    case TokenKind::Ellipsis:
      return "...";
    case TokenKind::EqualsOperator:
      return "==";
    case TokenKind::NotEqualsOperator:
      return "!=";
    case TokenKind::GreaterEqualsOperator:
      return ">=";
    case TokenKind::SmallerEqualsOperator:
      return "<=";
  }
  return "<unknown>";
}

/**
 * Small set of token kinds, used for recovery synchronization.
 */
class TokenSet
{
public:
  constexpr TokenSet() noexcept = default;
  constexpr TokenSet(std::initializer_list<TokenKind> kinds) noexcept
  {
    for (const TokenKind k : kinds) {
      bits_ |= bit(k);
    }
  }

  [[nodiscard]] constexpr bool contains(TokenKind k) const noexcept { return (bits_ & bit(k)) != 0; }
  [[nodiscard]] constexpr bool empty() const noexcept { return bits_ == 0; }

private:
  static constexpr uint64_t bit(TokenKind k) noexcept
  {
    return uint64_t{1} << static_cast<unsigned>(k);
  }

  uint64_t bits_ = 0;
};

}  // namespace scssls::syntax
