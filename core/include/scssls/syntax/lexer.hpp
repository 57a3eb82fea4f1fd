// scssls/syntax/lexer.hpp - Scanner for the style-sheet dialect
#pragma once

#include <cstdint>
#include <string_view>
#include <vector>

#include "scssls/syntax/token.hpp"

namespace scssls::syntax
{

/**
 * Converts source text into tokens.
 *
 * Whitespace and comments (block and line) are trivia: they produce no
 * token but set `preceded_by_trivia` on the next one. The result always
 * ends with exactly one Eof token. Lexing never fails; malformed input
 * degrades to BadString or Delim tokens.
 */
class Lexer
{
public:
  Lexer(FileId file_id, std::string_view src) : file_id_(file_id), src_(src) {}

  [[nodiscard]] std::vector<Token> lex_all();

private:
  [[nodiscard]] Token next_token();

  [[nodiscard]] bool eof() const noexcept { return pos_ >= src_.size(); }
  [[nodiscard]] char peek(size_t lookahead = 0) const noexcept
  {
    const size_t i = pos_ + lookahead;
    return (i < src_.size()) ? src_[i] : '\0';
  }
  [[nodiscard]] bool starts_with(std::string_view s) const noexcept;

  void advance(size_t n = 1) noexcept { pos_ += n; }

  /// Skip whitespace and comments; returns true if anything was skipped.
  bool skip_trivia();

  [[nodiscard]] bool at_ident_start(size_t lookahead = 0) const noexcept;
  [[nodiscard]] bool at_name_char(size_t lookahead = 0) const noexcept;
  [[nodiscard]] bool at_escape(size_t lookahead = 0) const noexcept;
  void consume_name();

  [[nodiscard]] Token lex_ident_like();
  [[nodiscard]] Token lex_number();
  [[nodiscard]] Token lex_string();
  [[nodiscard]] bool try_lex_uri(Token & out);

  [[nodiscard]] Token make_token(TokenKind kind, size_t start) const noexcept;

  FileId file_id_;
  std::string_view src_;
  size_t pos_ = 0;
};

}  // namespace scssls::syntax
