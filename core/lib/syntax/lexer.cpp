// scssls/syntax/lexer.cpp - Scanner implementation
#include "scssls/syntax/lexer.hpp"

#include <cctype>

#include "scssls/syntax/keywords.hpp"

namespace scssls::syntax
{
namespace
{

bool is_name_start(unsigned char c) { return (std::isalpha(c) != 0) || c == '_' || c >= 0x80; }
bool is_name_continue(unsigned char c)
{
  return is_name_start(c) || (std::isdigit(c) != 0) || c == '-';
}
bool is_digit(char c) { return std::isdigit(static_cast<unsigned char>(c)) != 0; }
bool is_hex_digit(char c) { return std::isxdigit(static_cast<unsigned char>(c)) != 0; }
bool is_whitespace(char c) { return c == ' ' || c == '\t' || c == '\n' || c == '\r' || c == '\f'; }

}  // namespace

bool Lexer::starts_with(std::string_view s) const noexcept
{
  return src_.size() >= pos_ + s.size() && src_.substr(pos_, s.size()) == s;
}

std::vector<Token> Lexer::lex_all()
{
  std::vector<Token> out;
  out.reserve(src_.size() / 3 + 1);

  if (starts_with("\xEF\xBB\xBF")) {
    advance(3);
  }

  while (true) {
    const bool trivia = skip_trivia();
    if (eof()) {
      Token t = make_token(TokenKind::Eof, pos_);
      t.preceded_by_trivia = trivia;
      out.push_back(t);
      break;
    }
    Token t = next_token();
    t.preceded_by_trivia = trivia;
    out.push_back(t);
  }
  return out;
}

bool Lexer::skip_trivia()
{
  const size_t start = pos_;
  while (!eof()) {
    if (is_whitespace(peek())) {
      advance(1);
      continue;
    }
    if (starts_with("/*")) {
      advance(2);
      while (!eof() && !starts_with("*/")) {
        advance(1);
      }
      if (!eof()) {
        advance(2);
      }
      continue;
    }
    if (starts_with("//")) {
      while (!eof() && peek() != '\n') {
        advance(1);
      }
      continue;
    }
    break;
  }
  return pos_ != start;
}

bool Lexer::at_escape(size_t lookahead) const noexcept
{
  return peek(lookahead) == '\\' && pos_ + lookahead + 1 < src_.size() &&
         peek(lookahead + 1) != '\n';
}

bool Lexer::at_name_char(size_t lookahead) const noexcept
{
  if (pos_ + lookahead >= src_.size()) {
    return false;
  }
  return is_name_continue(static_cast<unsigned char>(peek(lookahead))) || at_escape(lookahead);
}

bool Lexer::at_ident_start(size_t lookahead) const noexcept
{
  if (pos_ + lookahead >= src_.size()) {
    return false;
  }
  const char c = peek(lookahead);
  if (c == '-') {
    const char n = peek(lookahead + 1);
    return n == '-' || (pos_ + lookahead + 1 < src_.size() &&
                        is_name_start(static_cast<unsigned char>(n))) ||
           at_escape(lookahead + 1);
  }
  return is_name_start(static_cast<unsigned char>(c)) || at_escape(lookahead);
}

void Lexer::consume_name()
{
  while (at_name_char()) {
    if (peek() != '\\') {
      advance(1);
      continue;
    }
    // Escape: up to six hex digits and one optional whitespace, or any single character
    advance(1);
    if (is_hex_digit(peek())) {
      for (int i = 0; i < 6 && !eof() && is_hex_digit(peek()); ++i) {
        advance(1);
      }
      if (!eof() && is_whitespace(peek())) {
        advance(1);
      }
    } else {
      advance(1);
    }
  }
}

Token Lexer::make_token(TokenKind kind, size_t start) const noexcept
{
  Token t;
  t.kind = kind;
  t.range = SourceRange(file_id_, static_cast<uint32_t>(start), static_cast<uint32_t>(pos_));
  t.text = src_.substr(start, pos_ - start);
  return t;
}

Token Lexer::next_token()
{
  const size_t start = pos_;
  const char c = peek();

  if (is_digit(c) || (c == '.' && is_digit(peek(1)))) {
    return lex_number();
  }
  if (starts_with("-->")) {
    advance(3);
    return make_token(TokenKind::Cdc, start);
  }
  if (at_ident_start()) {
    return lex_ident_like();
  }

  switch (c) {
    case '$':
      if (at_ident_start(1)) {
        advance(1);
        consume_name();
        return make_token(TokenKind::VariableName, start);
      }
      if (peek(1) == '=') {
        advance(2);
        return make_token(TokenKind::SuffixOperator, start);
      }
      break;
    case '@':
      if (at_ident_start(1)) {
        advance(1);
        consume_name();
        return make_token(TokenKind::AtKeyword, start);
      }
      break;
    case '#':
      if (peek(1) == '{') {
        advance(2);
        return make_token(TokenKind::InterpolationFunction, start);
      }
      if (at_name_char(1)) {
        advance(1);
        consume_name();
        return make_token(TokenKind::Hash, start);
      }
      break;
    case '"':
    case '\'':
      return lex_string();
    case '<':
      if (starts_with("<!--")) {
        advance(4);
        return make_token(TokenKind::Cdo, start);
      }
      if (peek(1) == '=') {
        advance(2);
        return make_token(TokenKind::SmallerEqualsOperator, start);
      }
      break;
    case '>':
      if (peek(1) == '=') {
        advance(2);
        return make_token(TokenKind::GreaterEqualsOperator, start);
      }
      break;
    case '=':
      if (peek(1) == '=') {
        advance(2);
        return make_token(TokenKind::EqualsOperator, start);
      }
      break;
    case '!':
      if (peek(1) == '=') {
        advance(2);
        return make_token(TokenKind::NotEqualsOperator, start);
      }
      advance(1);
      return make_token(TokenKind::Exclamation, start);
    case '.':
      if (starts_with("...")) {
        advance(3);
        return make_token(TokenKind::Ellipsis, start);
      }
      break;
    case '~':
      if (peek(1) == '=') {
        advance(2);
        return make_token(TokenKind::Includes, start);
      }
      break;
    case '|':
      if (peek(1) == '=') {
        advance(2);
        return make_token(TokenKind::Dashmatch, start);
      }
      break;
    case '^':
      if (peek(1) == '=') {
        advance(2);
        return make_token(TokenKind::PrefixOperator, start);
      }
      break;
    case '*':
      if (peek(1) == '=') {
        advance(2);
        return make_token(TokenKind::SubstringOperator, start);
      }
      break;
    case ':':
      advance(1);
      return make_token(TokenKind::Colon, start);
    case ';':
      advance(1);
      return make_token(TokenKind::SemiColon, start);
    case '{':
      advance(1);
      return make_token(TokenKind::CurlyL, start);
    case '}':
      advance(1);
      return make_token(TokenKind::CurlyR, start);
    case '(':
      advance(1);
      return make_token(TokenKind::ParenthesisL, start);
    case ')':
      advance(1);
      return make_token(TokenKind::ParenthesisR, start);
    case '[':
      advance(1);
      return make_token(TokenKind::BracketL, start);
    case ']':
      advance(1);
      return make_token(TokenKind::BracketR, start);
    case ',':
      advance(1);
      return make_token(TokenKind::Comma, start);
    default:
      break;
  }

  advance(1);
  return make_token(TokenKind::Delim, start);
}

Token Lexer::lex_ident_like()
{
  const size_t start = pos_;
  consume_name();

  const std::string_view name = src_.substr(start, pos_ - start);
  if (peek() == '(' && equals_ignore_case(name, "url")) {
    Token uri;
    if (try_lex_uri(uri)) {
      uri.range = SourceRange(file_id_, static_cast<uint32_t>(start), static_cast<uint32_t>(pos_));
      uri.text = src_.substr(start, pos_ - start);
      return uri;
    }
  }
  return make_token(TokenKind::Ident, start);
}

bool Lexer::try_lex_uri(Token & out)
{
  // Only unquoted, plain content becomes a single Uri token. Anything with
  // quotes, interpolation or variables is left to the parser.
  const size_t saved = pos_;
  advance(1);  // (
  while (!eof() && is_whitespace(peek())) {
    advance(1);
  }

  while (!eof()) {
    const char c = peek();
    if (c == ')') {
      advance(1);
      out.kind = TokenKind::Uri;
      return true;
    }
    if (c == '"' || c == '\'' || c == '(' || c == '$' || starts_with("#{")) {
      break;
    }
    if (is_whitespace(c)) {
      while (!eof() && is_whitespace(peek())) {
        advance(1);
      }
      if (peek() == ')') {
        continue;
      }
      break;
    }
    if (c == '\\' && pos_ + 1 < src_.size()) {
      advance(2);
      continue;
    }
    advance(1);
  }

  pos_ = saved;
  return false;
}

Token Lexer::lex_number()
{
  const size_t start = pos_;

  while (is_digit(peek())) {
    advance(1);
  }
  if (peek() == '.' && is_digit(peek(1))) {
    advance(1);
    while (is_digit(peek())) {
      advance(1);
    }
  }
  if ((peek() == 'e' || peek() == 'E')) {
    if (is_digit(peek(1))) {
      advance(1);
      while (is_digit(peek())) {
        advance(1);
      }
    } else if ((peek(1) == '+' || peek(1) == '-') && is_digit(peek(2))) {
      advance(2);
      while (is_digit(peek())) {
        advance(1);
      }
    }
  }

  if (peek() == '%') {
    advance(1);
    return make_token(TokenKind::Percentage, start);
  }
  if (at_ident_start()) {
    consume_name();
    return make_token(TokenKind::Dimension, start);
  }
  return make_token(TokenKind::Num, start);
}

Token Lexer::lex_string()
{
  const size_t start = pos_;
  const char quote = peek();
  advance(1);

  while (!eof()) {
    const char c = peek();
    if (c == quote) {
      advance(1);
      return make_token(TokenKind::String, start);
    }
    if (c == '\n' || c == '\r' || c == '\f') {
      return make_token(TokenKind::BadString, start);
    }
    if (c == '\\') {
      // Escaped character or line continuation
      advance(pos_ + 1 < src_.size() ? 2 : 1);
      continue;
    }
    advance(1);
  }
  return make_token(TokenKind::BadString, start);
}

}  // namespace scssls::syntax
