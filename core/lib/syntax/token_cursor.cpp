// scssls/syntax/token_cursor.cpp - Token cursor implementation
#include "scssls/syntax/token_cursor.hpp"

#include "scssls/syntax/keywords.hpp"

namespace scssls::syntax
{

TokenCursor::TokenCursor(gsl::span<const Token> tokens) noexcept : tokens_(tokens)
{
  if (!tokens_.empty()) {
    const Token & last = tokens_[tokens_.size() - 1];
    eof_.range = SourceRange(last.range.file_id(), last.end(), last.end());
  }
}

bool TokenCursor::peek_text(TokenKind kind, std::string_view text) const noexcept
{
  return token().kind == kind && equals_ignore_case(token().text, text);
}

bool TokenCursor::peek_prefix(TokenKind kind, std::string_view prefix) const noexcept
{
  return token().kind == kind && starts_with_ignore_case(token().text, prefix);
}

bool TokenCursor::peek_delim(char c) const noexcept
{
  const Token & t = token();
  return t.kind == TokenKind::Delim && t.text.size() == 1 && t.text[0] == c;
}

const Token & TokenCursor::consume() noexcept
{
  const Token & t = token();
  if (t.kind != TokenKind::Eof) {
    ++index_;
  }
  return t;
}

bool TokenCursor::accept(TokenKind kind) noexcept
{
  if (!peek(kind)) {
    return false;
  }
  consume();
  return true;
}

bool TokenCursor::accept_text(TokenKind kind, std::string_view text) noexcept
{
  if (!peek_text(kind, text)) {
    return false;
  }
  consume();
  return true;
}

bool TokenCursor::accept_delim(char c) noexcept
{
  if (!peek_delim(c)) {
    return false;
  }
  consume();
  return true;
}

}  // namespace scssls::syntax
