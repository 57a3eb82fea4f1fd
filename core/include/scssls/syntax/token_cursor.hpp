// scssls/syntax/token_cursor.hpp - Positioned read/peek/consume over a token buffer
#pragma once

#include <cstddef>
#include <gsl/span>
#include <string_view>

#include "scssls/syntax/token.hpp"

namespace scssls::syntax
{

/**
 * Cursor over a fully materialized token stream.
 *
 * The stream normally ends with an Eof token. Past the last token (or for an
 * empty stream) the cursor reports a synthetic Eof placed at the end of the
 * last token. Consuming at Eof is a no-op, so lookahead never runs off the end. Marks are plain indices: restoring is
 * O(1) and marks nest freely.
 */
class TokenCursor
{
public:
  using Mark = size_t;

  explicit TokenCursor(gsl::span<const Token> tokens) noexcept;

  /// Current (not yet consumed) token.
  [[nodiscard]] const Token & token() const noexcept
  {
    return index_ < tokens_.size() ? tokens_[index_] : eof_;
  }

  /// Last consumed token, nullptr at the start of the stream.
  [[nodiscard]] const Token * prev_token() const noexcept
  {
    return index_ > 0 && index_ <= tokens_.size() ? &tokens_[index_ - 1] : nullptr;
  }

  [[nodiscard]] size_t index() const noexcept { return index_; }
  [[nodiscard]] bool at_eof() const noexcept { return token().kind == TokenKind::Eof; }

  // ===========================================================================
  // Lookahead
  // ===========================================================================

  [[nodiscard]] bool peek(TokenKind kind) const noexcept { return token().kind == kind; }

  /// Current token has `kind` and its text equals `text` (ASCII case-insensitive).
  [[nodiscard]] bool peek_text(TokenKind kind, std::string_view text) const noexcept;

  /// Current token has `kind` and its text starts with `prefix` (case-insensitive).
  [[nodiscard]] bool peek_prefix(TokenKind kind, std::string_view prefix) const noexcept;

  [[nodiscard]] bool peek_delim(char c) const noexcept;
  [[nodiscard]] bool peek_ident(std::string_view text) const noexcept
  {
    return peek_text(TokenKind::Ident, text);
  }
  [[nodiscard]] bool peek_keyword(std::string_view text) const noexcept
  {
    return peek_text(TokenKind::AtKeyword, text);
  }

  /// True when trivia separates the current token from the previous one.
  [[nodiscard]] bool has_whitespace() const noexcept
  {
    return index_ > 0 && token().preceded_by_trivia;
  }

  // ===========================================================================
  // Consumption
  // ===========================================================================

  /// Advance one token and return the consumed one (Eof is never passed).
  const Token & consume() noexcept;

  bool accept(TokenKind kind) noexcept;
  bool accept_text(TokenKind kind, std::string_view text) noexcept;
  bool accept_delim(char c) noexcept;
  bool accept_ident(std::string_view text) noexcept { return accept_text(TokenKind::Ident, text); }
  bool accept_keyword(std::string_view text) noexcept
  {
    return accept_text(TokenKind::AtKeyword, text);
  }

  // ===========================================================================
  // Backtracking
  // ===========================================================================

  [[nodiscard]] Mark mark() const noexcept { return index_; }
  void restore(Mark m) noexcept { index_ = m; }

private:
  gsl::span<const Token> tokens_;
  Token eof_;
  size_t index_ = 0;
};

}  // namespace scssls::syntax
