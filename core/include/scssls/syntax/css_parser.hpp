// scssls/syntax/css_parser.hpp - Error-tolerant recursive-descent parser for plain CSS
//
// Productions are virtual so a dialect parser can try its own alternatives
// first and fall back to the base production on no-match.
//
// Conventions shared by every production:
// - A production returns the node it built, or nullptr for "no match".
// - Returning nullptr never leaves the cursor advanced; speculative paths
//   take a mark and restore it before giving up.
// - Once committed, a production reports problems through finish() or
//   mark_error() and still returns its (erroneous) node.
//
#pragma once

#include <cstddef>
#include <gsl/span>

#include "scssls/cst/cst_context.hpp"
#include "scssls/cst/node.hpp"
#include "scssls/syntax/token.hpp"
#include "scssls/syntax/token_cursor.hpp"

namespace scssls::syntax
{

class CssParser
{
public:
  using Node = cst::Node;

  /**
   * @param ctx     arena receiving every node
   * @param tokens  token stream ending with Eof (as produced by Lexer)
   */
  CssParser(cst::CstContext & ctx, gsl::span<const Token> tokens);
  virtual ~CssParser() = default;

  CssParser(const CssParser &) = delete;
  CssParser & operator=(const CssParser &) = delete;
  CssParser(CssParser &&) = delete;
  CssParser & operator=(CssParser &&) = delete;

  /// Parse the whole stream. Never returns nullptr.
  [[nodiscard]] cst::Stylesheet * parse_stylesheet();

  [[nodiscard]] const TokenCursor & cursor() const noexcept { return cursor_; }

  // ===========================================================================
  // Statements
  // ===========================================================================

  virtual Node * parse_stylesheet_statement(bool is_nested = false);
  virtual Node * parse_stylesheet_at_statement(bool is_nested = false);
  virtual Node * parse_rule_set_declaration_at_statement();
  virtual Node * parse_rule_set_declaration();
  virtual Node * parse_import();

  Node * parse_ruleset(bool is_nested = false);
  Node * try_parse_ruleset(bool is_nested);
  Node * parse_unknown_at_rule();

  [[nodiscard]] bool needs_semicolon_after(const Node * node) const noexcept;

  // ===========================================================================
  // Selectors
  // ===========================================================================

  Node * parse_selector(bool is_nested);
  Node * parse_combinator();
  Node * parse_simple_selector();
  virtual Node * parse_simple_selector_body();
  virtual Node * parse_element_name();
  virtual Node * parse_nesting_selector();
  Node * parse_hash();
  Node * parse_class();
  Node * parse_attribute();
  Node * parse_pseudo();
  virtual Node * try_parse_pseudo_identifier();

  // ===========================================================================
  // Declarations
  // ===========================================================================

  Node * parse_declaration(TokenSet stop = {});
  Node * try_parse_declaration(TokenSet stop = {});
  Node * try_parse_custom_property_declaration(TokenSet stop = {});
  Node * parse_custom_property_value(TokenSet stop = {});
  Node * parse_property();
  virtual Node * parse_property_identifier();
  /// `!important`; restores the cursor when the `!` is not followed by it.
  Node * parse_prio();

  // ===========================================================================
  // Expressions
  // ===========================================================================

  Node * parse_expr(bool stop_on_comma = false);
  Node * parse_binary_expr(Node * preparsed_left = nullptr, Node * preparsed_op = nullptr);
  Node * parse_term();
  virtual Node * parse_term_expression();
  virtual Node * parse_operator();
  virtual Node * parse_unary_operator();
  virtual Node * parse_operation();
  Node * parse_function();
  virtual Node * parse_function_identifier();
  virtual Node * parse_function_argument();
  Node * parse_uri_literal();
  virtual Node * parse_url_argument();
  virtual Node * parse_ident(cst::ReferenceKind reference = cst::ReferenceKind::Unknown);
  Node * parse_string_literal();
  Node * parse_numeric();
  Node * parse_hex_color();
  Node * parse_ratio();

  // ===========================================================================
  // At-rules
  // ===========================================================================

  Node * parse_media(bool is_nested = false);
  Node * parse_media_query_list();
  Node * parse_media_query();
  virtual Node * parse_media_condition();
  Node * parse_media_feature();
  virtual Node * parse_media_feature_name();
  virtual bool parse_media_feature_range_operator();
  Node * parse_media_feature_value();
  Node * parse_font_face();
  Node * parse_keyframe();
  virtual Node * parse_keyframe_selector();
  Node * try_parse_keyframe_selector();
  Node * parse_supports(bool is_nested = false);
  virtual Node * parse_supports_condition();
  Node * parse_supports_condition_in_parens();
  Node * parse_layer(bool is_nested = false);
  Node * parse_layer_name_list();
  Node * parse_layer_name();
  Node * parse_property_at_rule();

protected:
  /// Saved parser position; also rolls back error de-duplication state.
  struct Mark
  {
    TokenCursor::Mark cursor;
    size_t last_error_token;
  };

  static constexpr size_t k_no_error_token = static_cast<size_t>(-1);

  // ===========================================================================
  // Cursor helpers
  // ===========================================================================

  [[nodiscard]] const Token & token() const noexcept { return cursor_.token(); }
  [[nodiscard]] bool peek(TokenKind kind) const noexcept { return cursor_.peek(kind); }
  [[nodiscard]] bool peek_delim(char c) const noexcept { return cursor_.peek_delim(c); }
  [[nodiscard]] bool peek_ident(std::string_view text) const noexcept
  {
    return cursor_.peek_ident(text);
  }
  [[nodiscard]] bool peek_keyword(std::string_view text) const noexcept
  {
    return cursor_.peek_keyword(text);
  }
  [[nodiscard]] bool has_whitespace() const noexcept { return cursor_.has_whitespace(); }
  bool accept(TokenKind kind) noexcept { return cursor_.accept(kind); }
  bool accept_delim(char c) noexcept { return cursor_.accept_delim(c); }
  bool accept_ident(std::string_view text) noexcept { return cursor_.accept_ident(text); }
  bool accept_keyword(std::string_view text) noexcept { return cursor_.accept_keyword(text); }
  const Token & consume() noexcept { return cursor_.consume(); }

  [[nodiscard]] Mark mark() const noexcept { return {cursor_.mark(), last_error_token_}; }
  void restore(const Mark & m) noexcept
  {
    cursor_.restore(m.cursor);
    last_error_token_ = m.last_error_token;
  }

  /// Value part of a declaration, after the colon.
  virtual Node * complete_declaration(cst::Declaration * node);

  /// Optional `layer(...)`, `supports(...)` and media list after an import target.
  Node * complete_import(Node * node);

  // ===========================================================================
  // Node lifecycle
  // ===========================================================================

  /// Zero-length range at the current token.
  [[nodiscard]] SourceRange anchor() const noexcept;

  template <typename T>
  T * create()
  {
    return ctx_.create<T>(anchor());
  }

  Node * create_node(cst::NodeKind kind) { return ctx_.create<Node>(kind, anchor()); }

  /// Close the node's range at the end of the last consumed token.
  template <typename T>
  T * finish(T * node) noexcept
  {
    close_range(node);
    return node;
  }

  /// Attach `error` at the current token, resynchronize, then close the range.
  template <typename T>
  T * finish(T * node, cst::ParseError error, TokenSet resync = {}, TokenSet stop = {})
  {
    mark_error(node, error, resync, stop);
    close_range(node);
    return node;
  }

  /**
   * Attach `error` at the current token (once per token), then skip tokens
   * until one in `resync` (consumed), one in `stop` (not consumed) or Eof.
   */
  void mark_error(Node * node, cst::ParseError error, TokenSet resync = {}, TokenSet stop = {});

  /// Append `child` to the list in `list`, creating and attaching the list on first use.
  bool append_to(Node * owner, Node *& list, Node * child);

  /// Ordered alternation: first non-null result wins, later alternatives are not run.
  template <typename... Alternatives>
  static Node * first_match(Alternatives &&... alternatives)
  {
    Node * result = nullptr;
    (void)(((result = alternatives()) != nullptr) || ...);
    return result;
  }

  /// `{ statement* }` body of a BodyDeclaration.
  template <typename T, typename ParseStatement>
  T * parse_body(T * node, ParseStatement && parse_statement)
  {
    if (!node->set_declarations(parse_declarations(parse_statement))) {
      return finish(node, cst::ParseError::LeftCurlyExpected, {TokenKind::CurlyR, TokenKind::SemiColon});
    }
    return finish(node);
  }

  template <typename ParseStatement>
  Node * parse_declarations(ParseStatement && parse_statement)
  {
    if (!peek(TokenKind::CurlyL)) {
      return nullptr;
    }
    Node * node = create_node(cst::NodeKind::Declarations);
    consume();

    Node * decl = parse_statement();
    while (node->add_child(decl)) {
      if (peek(TokenKind::CurlyR)) {
        break;
      }
      if (needs_semicolon_after(decl) && !accept(TokenKind::SemiColon)) {
        return finish(
          node, cst::ParseError::SemiColonExpected, {TokenKind::SemiColon, TokenKind::CurlyR});
      }
      record_semicolon(decl);
      while (accept(TokenKind::SemiColon)) {
        // empty statements
      }
      decl = parse_statement();
    }
    if (!accept(TokenKind::CurlyR)) {
      return finish(
        node, cst::ParseError::RightCurlyExpected, {TokenKind::CurlyR, TokenKind::SemiColon});
    }
    return finish(node);
  }

  cst::CstContext & ctx_;
  TokenCursor cursor_;
  size_t last_error_token_ = k_no_error_token;

private:
  void close_range(Node * node) noexcept;
  void record_semicolon(Node * decl) noexcept;
  Node * parse_media_declaration(bool is_nested);
  Node * parse_supports_declaration(bool is_nested);
  Node * parse_layer_declaration(bool is_nested);
  Node * parse_unknown_at_rule_rest(Node * node);
  Node * parse_pseudo_selector_list();
};

}  // namespace scssls::syntax
