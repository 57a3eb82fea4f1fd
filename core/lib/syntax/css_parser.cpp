// scssls/syntax/css_parser.cpp - Base style-sheet grammar
#include "scssls/syntax/css_parser.hpp"

#include <algorithm>
#include <cctype>

#include "scssls/syntax/keywords.hpp"

namespace scssls::syntax
{

using cst::Node;
using cst::NodeKind;
using cst::ParseError;
using cst::ReferenceKind;

namespace
{

bool is_hex_color(std::string_view text)
{
  if (text.size() < 2 || text[0] != '#') {
    return false;
  }
  const size_t digits = text.size() - 1;
  if (digits != 3 && digits != 4 && digits != 6 && digits != 8) {
    return false;
  }
  return std::all_of(text.begin() + 1, text.end(), [](char c) {
    return std::isxdigit(static_cast<unsigned char>(c)) != 0;
  });
}

bool is_keyframes_keyword(std::string_view text)
{
  return std::any_of(
    k_keyframes_keywords.begin(), k_keyframes_keywords.end(),
    [&](std::string_view k) { return equals_ignore_case(text, k); });
}

}  // namespace

CssParser::CssParser(cst::CstContext & ctx, gsl::span<const Token> tokens)
: ctx_(ctx), cursor_(tokens)
{
}

// ============================================================================
// Node lifecycle
// ============================================================================

SourceRange CssParser::anchor() const noexcept
{
  const Token & t = token();
  return {t.range.file_id(), t.begin(), t.begin()};
}

void CssParser::close_range(Node * node) noexcept
{
  const uint32_t begin = node->range_.begin();
  const Token * prev = cursor_.prev_token();
  const uint32_t prev_end = prev != nullptr ? prev->end() : begin;
  node->range_ = SourceRange(node->range_.file_id(), begin, std::max(begin, prev_end));
}

void CssParser::mark_error(Node * node, ParseError error, TokenSet resync, TokenSet stop)
{
  cst::ParseIssue * issue = nullptr;
  if (cursor_.index() != last_error_token_) {
    issue = ctx_.create_issue(error, token().range);
    node->add_issue(issue);
    last_error_token_ = cursor_.index();
  }
  if (resync.empty() && stop.empty()) {
    return;
  }

  const Token & first = token();
  const Token * last_skipped = nullptr;
  while (true) {
    if (resync.contains(token().kind)) {
      consume();
      break;
    }
    if (stop.contains(token().kind) || cursor_.at_eof()) {
      break;
    }
    last_skipped = &consume();
  }

  if (issue != nullptr && last_skipped != nullptr) {
    issue->skipped = SourceRange(first.range.file_id(), first.begin(), last_skipped->end());
  }
}

bool CssParser::append_to(Node * owner, Node *& list, Node * child)
{
  if (child == nullptr) {
    return false;
  }
  if (list == nullptr) {
    list = ctx_.create<Node>(NodeKind::NodeList, SourceRange{});
    owner->add_child(list);
  }
  return list->add_child(child);
}

void CssParser::record_semicolon(Node * decl) noexcept
{
  const Token * prev = cursor_.prev_token();
  if (prev == nullptr || prev->kind != TokenKind::SemiColon) {
    return;
  }
  if (auto * declaration = dyn_cast<cst::Declaration>(decl)) {
    declaration->semicolon_position = prev->begin();
  } else if (auto * variable = dyn_cast<cst::VariableDeclaration>(decl)) {
    variable->semicolon_position = prev->begin();
  }
}

// ============================================================================
// Statements
// ============================================================================

cst::Stylesheet * CssParser::parse_stylesheet()
{
  auto * node = create<cst::Stylesheet>();

  bool in_recovery = false;
  do {
    bool has_match = false;
    do {
      has_match = false;
      if (Node * statement = parse_stylesheet_statement()) {
        node->add_child(statement);
        has_match = true;
        in_recovery = false;
        if (
          !peek(TokenKind::Eof) && needs_semicolon_after(statement) &&
          !accept(TokenKind::SemiColon)) {
          mark_error(node, ParseError::SemiColonExpected);
        }
      }
      while (accept(TokenKind::SemiColon) || accept(TokenKind::Cdo) || accept(TokenKind::Cdc)) {
        has_match = true;
        in_recovery = false;
      }
    } while (has_match);

    if (peek(TokenKind::Eof)) {
      break;
    }
    if (!in_recovery) {
      mark_error(
        node, peek(TokenKind::AtKeyword) ? ParseError::UnknownAtRule
                                         : ParseError::RuleOrSelectorExpected);
      in_recovery = true;
    }
    consume();
  } while (!peek(TokenKind::Eof));

  return finish(node);
}

Node * CssParser::parse_stylesheet_statement(bool is_nested)
{
  if (peek(TokenKind::AtKeyword)) {
    return parse_stylesheet_at_statement(is_nested);
  }
  return parse_ruleset(is_nested);
}

Node * CssParser::parse_stylesheet_at_statement(bool is_nested)
{
  return first_match(
    [&] { return parse_import(); }, [&] { return parse_media(is_nested); },
    [&] { return parse_font_face(); }, [&] { return parse_keyframe(); },
    [&] { return parse_supports(is_nested); }, [&] { return parse_layer(is_nested); },
    [&] { return parse_property_at_rule(); }, [&] { return parse_unknown_at_rule(); });
}

Node * CssParser::parse_rule_set_declaration_at_statement()
{
  return first_match(
    [&] { return parse_media(true); }, [&] { return parse_supports(true); },
    [&] { return parse_layer(true); }, [&] { return parse_unknown_at_rule(); });
}

Node * CssParser::parse_rule_set_declaration()
{
  if (peek(TokenKind::AtKeyword)) {
    return parse_rule_set_declaration_at_statement();
  }
  if (!peek(TokenKind::Ident)) {
    return parse_ruleset(true);
  }
  return first_match([&] { return try_parse_ruleset(true); }, [&] { return parse_declaration(); });
}

bool CssParser::needs_semicolon_after(const Node * node) const noexcept
{
  switch (node->kind) {
    case NodeKind::ExtendsReference:
    case NodeKind::MixinContentReference:
    case NodeKind::ReturnStatement:
    case NodeKind::MediaQuery:
    case NodeKind::Debug:
    case NodeKind::Import:
    case NodeKind::VariableDeclaration:
      return true;
    case NodeKind::MixinReference:
      return cast<cst::MixinReference>(node)->content == nullptr;
    case NodeKind::Declaration:
      return cast<cst::Declaration>(node)->nested_properties == nullptr;
    default:
      // Blocks (rulesets, at-rules with bodies, control flow) and statements
      // that consume their own terminator.
      return false;
  }
}

Node * CssParser::parse_ruleset(bool is_nested)
{
  auto * node = create<cst::Ruleset>();
  if (!append_to(node, node->selectors, parse_selector(is_nested))) {
    return nullptr;
  }
  while (accept(TokenKind::Comma)) {
    if (!append_to(node, node->selectors, parse_selector(is_nested))) {
      return finish(node, ParseError::SelectorExpected);
    }
  }
  return parse_body(node, [this] { return parse_rule_set_declaration(); });
}

Node * CssParser::try_parse_ruleset(bool is_nested)
{
  const Mark m = mark();
  if (parse_selector(is_nested) != nullptr) {
    while (accept(TokenKind::Comma) && parse_selector(is_nested) != nullptr) {
    }
    if (peek(TokenKind::CurlyL)) {
      restore(m);
      return parse_ruleset(is_nested);
    }
  }
  restore(m);
  return nullptr;
}

Node * CssParser::parse_import()
{
  if (!peek_keyword("@import")) {
    return nullptr;
  }
  Node * node = create_node(NodeKind::Import);
  consume();

  if (!node->add_child(parse_uri_literal()) && !node->add_child(parse_string_literal())) {
    return finish(node, ParseError::UriOrStringExpected);
  }
  return complete_import(node);
}

Node * CssParser::complete_import(Node * node)
{
  if (accept_ident("layer")) {
    if (accept(TokenKind::ParenthesisL)) {
      if (!node->add_child(parse_layer_name())) {
        return finish(node, ParseError::IdentifierExpected, {TokenKind::SemiColon});
      }
      if (!accept(TokenKind::ParenthesisR)) {
        return finish(node, ParseError::RightParenthesisExpected, {TokenKind::ParenthesisR});
      }
    }
  }
  if (accept_ident("supports")) {
    if (accept(TokenKind::ParenthesisL)) {
      node->add_child(first_match(
        [&] { return try_parse_declaration(); }, [&] { return parse_supports_condition(); }));
      if (!accept(TokenKind::ParenthesisR)) {
        return finish(node, ParseError::RightParenthesisExpected, {TokenKind::ParenthesisR});
      }
    }
  }
  if (!peek(TokenKind::SemiColon) && !peek(TokenKind::Eof)) {
    node->add_child(parse_media_query_list());
  }
  return finish(node);
}

Node * CssParser::parse_unknown_at_rule()
{
  if (!peek(TokenKind::AtKeyword)) {
    return nullptr;
  }
  Node * node = create_node(NodeKind::UnknownAtRule);
  Node * name = create_node(NodeKind::Generic);
  consume();
  node->add_child(finish(name));
  return parse_unknown_at_rule_rest(node);
}

Node * CssParser::parse_unknown_at_rule_rest(Node * node)
{
  int curly_l_count = 0;
  int curly_depth = 0;
  int parens_depth = 0;
  int brackets_depth = 0;

  while (true) {
    switch (token().kind) {
      case TokenKind::SemiColon:
        if (curly_depth == 0 && parens_depth == 0 && brackets_depth == 0) {
          return finish(node);
        }
        break;
      case TokenKind::Eof:
        if (curly_depth > 0) {
          return finish(node, ParseError::RightCurlyExpected);
        }
        if (brackets_depth > 0) {
          return finish(node, ParseError::RightSquareBracketExpected);
        }
        if (parens_depth > 0) {
          return finish(node, ParseError::RightParenthesisExpected);
        }
        return finish(node);
      case TokenKind::CurlyL:
        ++curly_l_count;
        ++curly_depth;
        break;
      case TokenKind::CurlyR:
        --curly_depth;
        if (curly_l_count > 0 && curly_depth == 0) {
          consume();
          if (brackets_depth > 0) {
            return finish(node, ParseError::RightSquareBracketExpected);
          }
          if (parens_depth > 0) {
            return finish(node, ParseError::RightParenthesisExpected);
          }
          return finish(node);
        }
        if (curly_depth < 0) {
          // `}` of the enclosing block
          if (parens_depth == 0 && brackets_depth == 0) {
            return finish(node);
          }
          return finish(node, ParseError::LeftCurlyExpected);
        }
        break;
      case TokenKind::ParenthesisL:
        ++parens_depth;
        break;
      case TokenKind::ParenthesisR:
        --parens_depth;
        if (parens_depth < 0) {
          return finish(node, ParseError::LeftParenthesisExpected);
        }
        break;
      case TokenKind::BracketL:
        ++brackets_depth;
        break;
      case TokenKind::BracketR:
        --brackets_depth;
        if (brackets_depth < 0) {
          return finish(node, ParseError::LeftSquareBracketExpected);
        }
        break;
      default:
        break;
    }
    consume();
  }
}

// ============================================================================
// Selectors
// ============================================================================

Node * CssParser::parse_selector(bool is_nested)
{
  Node * node = create_node(NodeKind::Selector);

  bool has_content = false;
  if (is_nested) {
    // nested selectors can start with a combinator
    has_content = node->add_child(parse_combinator());
  }
  while (node->add_child(parse_simple_selector())) {
    has_content = true;
    node->add_child(parse_combinator());
  }
  return has_content ? finish(node) : nullptr;
}

Node * CssParser::parse_combinator()
{
  NodeKind kind = NodeKind::Generic;
  int token_count = 1;

  if (peek_delim('>')) {
    const Mark m = mark();
    consume();
    const bool shadow_piercing =
      !has_whitespace() && accept_delim('>') && !has_whitespace() && accept_delim('>');
    restore(m);
    kind = shadow_piercing ? NodeKind::SelectorCombinatorShadowPiercing
                           : NodeKind::SelectorCombinatorParent;
    token_count = shadow_piercing ? 3 : 1;
  } else if (peek_delim('+')) {
    kind = NodeKind::SelectorCombinatorSibling;
  } else if (peek_delim('~')) {
    kind = NodeKind::SelectorCombinatorAllSiblings;
  } else if (peek_delim('/')) {
    // /deep/
    const Mark m = mark();
    consume();
    const bool deep =
      !has_whitespace() && accept_ident("deep") && !has_whitespace() && accept_delim('/');
    restore(m);
    if (!deep) {
      return nullptr;
    }
    kind = NodeKind::SelectorCombinatorShadowPiercing;
    token_count = 3;
  } else {
    return nullptr;
  }

  Node * node = create_node(kind);
  for (int i = 0; i < token_count; ++i) {
    consume();
  }
  return finish(node);
}

Node * CssParser::parse_simple_selector()
{
  Node * node = create_node(NodeKind::SimpleSelector);

  int count = 0;
  if (node->add_child(first_match(
        [&] { return parse_element_name(); }, [&] { return parse_nesting_selector(); }))) {
    ++count;
  }
  while ((count == 0 || !has_whitespace()) && node->add_child(parse_simple_selector_body())) {
    ++count;
  }
  return count > 0 ? finish(node) : nullptr;
}

Node * CssParser::parse_simple_selector_body()
{
  return first_match(
    [&] { return parse_pseudo(); }, [&] { return parse_hash(); }, [&] { return parse_class(); },
    [&] { return parse_attribute(); });
}

Node * CssParser::parse_element_name()
{
  const Mark m = mark();
  Node * node = create_node(NodeKind::ElementNameSelector);
  if (!node->add_child(parse_ident(ReferenceKind::Selector)) && !accept_delim('*')) {
    restore(m);
    return nullptr;
  }
  return finish(node);
}

Node * CssParser::parse_nesting_selector()
{
  if (!peek_delim('&')) {
    return nullptr;
  }
  Node * node = create_node(NodeKind::SelectorCombinator);
  consume();
  return finish(node);
}

Node * CssParser::parse_hash()
{
  if (!peek(TokenKind::Hash) && !peek_delim('#')) {
    return nullptr;
  }
  Node * node = create_node(NodeKind::IdentifierSelector);
  if (accept_delim('#')) {
    if (has_whitespace() || !node->add_child(parse_ident(ReferenceKind::Selector))) {
      return finish(node, ParseError::IdentifierExpected);
    }
  } else {
    consume();
  }
  return finish(node);
}

Node * CssParser::parse_class()
{
  if (!peek_delim('.')) {
    return nullptr;
  }
  Node * node = create_node(NodeKind::ClassSelector);
  consume();
  if (has_whitespace() || !node->add_child(parse_ident(ReferenceKind::Selector))) {
    return finish(node, ParseError::IdentifierExpected);
  }
  return finish(node);
}

Node * CssParser::parse_attribute()
{
  if (!peek(TokenKind::BracketL)) {
    return nullptr;
  }
  Node * node = create_node(NodeKind::AttributeSelector);
  consume();

  if (!node->add_child(parse_ident())) {
    return finish(node, ParseError::IdentifierExpected);
  }
  if (node->add_child(parse_operator())) {
    node->add_child(parse_binary_expr());
    accept_ident("i");  // case-insensitive matching
    accept_ident("s");  // case-sensitive matching
  }
  if (!accept(TokenKind::BracketR)) {
    return finish(node, ParseError::RightSquareBracketExpected);
  }
  return finish(node);
}

Node * CssParser::parse_pseudo()
{
  Node * node = try_parse_pseudo_identifier();
  if (node == nullptr) {
    return nullptr;
  }
  if (!has_whitespace() && accept(TokenKind::ParenthesisL)) {
    if (!node->add_child(parse_pseudo_selector_list())) {
      // <an+b> microsyntax, optionally followed by `of <selector-list>`
      while (!peek_ident("of") &&
             (node->add_child(parse_term()) || node->add_child(parse_operator()))) {
      }
      if (accept_ident("of") && !node->add_child(parse_pseudo_selector_list())) {
        return finish(node, ParseError::SelectorExpected);
      }
    }
    if (!accept(TokenKind::ParenthesisR)) {
      return finish(node, ParseError::RightParenthesisExpected);
    }
  }
  return finish(node);
}

Node * CssParser::parse_pseudo_selector_list()
{
  const Mark m = mark();
  Node * selectors = create_node(NodeKind::Generic);
  if (selectors->add_child(parse_selector(true))) {
    while (accept(TokenKind::Comma) && selectors->add_child(parse_selector(true))) {
    }
    if (peek(TokenKind::ParenthesisR)) {
      return finish(selectors);
    }
  }
  restore(m);
  return nullptr;
}

Node * CssParser::try_parse_pseudo_identifier()
{
  if (!peek(TokenKind::Colon)) {
    return nullptr;
  }
  const Mark m = mark();
  Node * node = create_node(NodeKind::PseudoSelector);
  consume();
  if (has_whitespace()) {
    restore(m);
    return nullptr;
  }
  accept(TokenKind::Colon);  // ::pseudo-element
  if (has_whitespace() || !node->add_child(parse_ident())) {
    return finish(node, ParseError::IdentifierExpected);
  }
  return node;
}

// ============================================================================
// Declarations
// ============================================================================

Node * CssParser::parse_declaration(TokenSet stop)
{
  if (Node * custom_property = try_parse_custom_property_declaration(stop)) {
    return custom_property;
  }

  auto * node = create<cst::Declaration>();
  if (!node->set_property(parse_property())) {
    return nullptr;
  }
  if (!accept(TokenKind::Colon)) {
    return finish(
      node, ParseError::ColonExpected, {TokenKind::Colon},
      stop.empty() ? TokenSet{TokenKind::SemiColon} : stop);
  }
  node->colon_position = cursor_.prev_token()->begin();
  return complete_declaration(node);
}

Node * CssParser::complete_declaration(cst::Declaration * node)
{
  if (!node->set_value(parse_expr())) {
    return finish(node, ParseError::PropertyValueExpected);
  }
  node->add_child(parse_prio());
  if (peek(TokenKind::SemiColon)) {
    node->semicolon_position = token().begin();
  }
  return finish(node);
}

Node * CssParser::try_parse_declaration(TokenSet stop)
{
  const Mark m = mark();
  if (parse_property() != nullptr && accept(TokenKind::Colon)) {
    restore(m);
    return parse_declaration(stop);
  }
  restore(m);
  return nullptr;
}

Node * CssParser::try_parse_custom_property_declaration(TokenSet stop)
{
  if (!cursor_.peek_prefix(TokenKind::Ident, "--")) {
    return nullptr;
  }
  auto * node = create<cst::Declaration>();
  if (!node->set_property(parse_property())) {
    return nullptr;
  }
  if (!accept(TokenKind::Colon)) {
    return finish(node, ParseError::ColonExpected, {TokenKind::Colon});
  }
  node->colon_position = cursor_.prev_token()->begin();

  // Well-formed expressions keep their structure; anything else is kept raw.
  const Mark m = mark();
  Node * expression = parse_expr();
  if (expression != nullptr && !expression->is_erroneous(true)) {
    Node * prio = parse_prio();
    if (
      stop.contains(token().kind) || peek(TokenKind::SemiColon) || peek(TokenKind::CurlyR) ||
      peek(TokenKind::Eof)) {
      node->set_value(expression);
      node->add_child(prio);
      if (peek(TokenKind::SemiColon)) {
        node->semicolon_position = token().begin();
      }
      return finish(node);
    }
  }
  restore(m);

  Node * raw = parse_custom_property_value(stop);
  node->set_value(raw);
  node->add_child(parse_prio());
  if (raw->length() == 0 && !raw->has_issues()) {
    return finish(node, ParseError::PropertyValueExpected);
  }
  if (peek(TokenKind::SemiColon)) {
    node->semicolon_position = token().begin();
  }
  return finish(node);
}

Node * CssParser::parse_custom_property_value(TokenSet stop)
{
  Node * node = create_node(NodeKind::CustomPropertyValue);
  const TokenSet stop_tokens = stop.empty() ? TokenSet{TokenKind::CurlyR} : stop;

  int curly_depth = 0;
  int parens_depth = 0;
  int brackets_depth = 0;
  const auto top_level = [&] { return curly_depth == 0 && parens_depth == 0 && brackets_depth == 0; };

  while (true) {
    switch (token().kind) {
      case TokenKind::SemiColon:
      case TokenKind::Exclamation:
        if (top_level()) {
          return finish(node);
        }
        break;
      case TokenKind::CurlyL:
        ++curly_depth;
        break;
      case TokenKind::CurlyR:
        --curly_depth;
        if (curly_depth < 0) {
          if (stop_tokens.contains(TokenKind::CurlyR) && parens_depth == 0 && brackets_depth == 0) {
            return finish(node);
          }
          return finish(node, ParseError::LeftCurlyExpected);
        }
        break;
      case TokenKind::ParenthesisL:
        ++parens_depth;
        break;
      case TokenKind::ParenthesisR:
        --parens_depth;
        if (parens_depth < 0) {
          if (
            stop_tokens.contains(TokenKind::ParenthesisR) && curly_depth == 0 &&
            brackets_depth == 0) {
            return finish(node);
          }
          return finish(node, ParseError::LeftParenthesisExpected);
        }
        break;
      case TokenKind::BracketL:
        ++brackets_depth;
        break;
      case TokenKind::BracketR:
        --brackets_depth;
        if (brackets_depth < 0) {
          return finish(node, ParseError::LeftSquareBracketExpected);
        }
        break;
      case TokenKind::BadString:
        return finish(node);
      case TokenKind::Eof:
        if (brackets_depth > 0) {
          return finish(node, ParseError::RightSquareBracketExpected);
        }
        if (parens_depth > 0) {
          return finish(node, ParseError::RightParenthesisExpected);
        }
        if (curly_depth > 0) {
          return finish(node, ParseError::RightCurlyExpected);
        }
        return finish(node);
      default:
        break;
    }
    consume();
  }
}

Node * CssParser::parse_property()
{
  auto * node = create<cst::Property>();
  const Mark m = mark();
  if (accept_delim('*') || accept_delim('_')) {
    // IE star hack: `*zoom: 1`
    if (has_whitespace()) {
      restore(m);
      return nullptr;
    }
  }
  if (node->set_identifier(parse_property_identifier())) {
    return finish(node);
  }
  restore(m);
  return nullptr;
}

Node * CssParser::parse_property_identifier() { return parse_ident(ReferenceKind::Property); }

Node * CssParser::parse_prio()
{
  if (!peek(TokenKind::Exclamation)) {
    return nullptr;
  }
  const Mark m = mark();
  Node * node = create_node(NodeKind::Prio);
  consume();
  if (accept_ident("important")) {
    return finish(node);
  }
  restore(m);
  return nullptr;
}

// ============================================================================
// Expressions
// ============================================================================

Node * CssParser::parse_expr(bool stop_on_comma)
{
  Node * node = create_node(NodeKind::Expression);
  if (!node->add_child(parse_binary_expr())) {
    return nullptr;
  }
  while (true) {
    if (peek(TokenKind::Comma)) {
      if (stop_on_comma) {
        return finish(node);
      }
      consume();
    }
    if (!node->add_child(parse_binary_expr())) {
      break;
    }
  }
  return finish(node);
}

Node * CssParser::parse_binary_expr(Node * preparsed_left, Node * preparsed_op)
{
  auto * node = create<cst::BinaryExpression>();
  if (!node->set_left(preparsed_left != nullptr ? preparsed_left : parse_term())) {
    return nullptr;
  }
  if (!node->set_operator(preparsed_op != nullptr ? preparsed_op : parse_operator())) {
    return finish(node);
  }
  if (!node->set_right(parse_term())) {
    return finish(node, ParseError::TermExpected);
  }

  // left-associative chaining: a + b - c
  finish(node);
  if (Node * op = parse_operator()) {
    return finish(parse_binary_expr(node, op));
  }
  return finish(node);
}

Node * CssParser::parse_term()
{
  auto * node = create<cst::Term>();
  const Mark m = mark();
  node->set_operator(parse_unary_operator());
  if (node->set_expression(parse_term_expression())) {
    return finish(node);
  }
  restore(m);
  return nullptr;
}

Node * CssParser::parse_term_expression()
{
  return first_match(
    [&] { return parse_uri_literal(); }, [&] { return parse_function(); },
    [&] { return parse_ident(); }, [&] { return parse_string_literal(); },
    [&] { return parse_numeric(); }, [&] { return parse_hex_color(); },
    [&] { return parse_operation(); });
}

Node * CssParser::parse_operator()
{
  if (
    peek_delim('/') || peek_delim('*') || peek_delim('+') || peek_delim('-') ||
    peek(TokenKind::Dashmatch) || peek(TokenKind::Includes) ||
    peek(TokenKind::SubstringOperator) || peek(TokenKind::PrefixOperator) ||
    peek(TokenKind::SuffixOperator) || peek_delim('=')) {
    Node * node = create_node(NodeKind::Operator);
    consume();
    return finish(node);
  }
  return nullptr;
}

Node * CssParser::parse_unary_operator()
{
  if (!peek_delim('+') && !peek_delim('-')) {
    return nullptr;
  }
  Node * node = create_node(NodeKind::Operator);
  consume();
  return finish(node);
}

Node * CssParser::parse_operation()
{
  if (!peek(TokenKind::ParenthesisL)) {
    return nullptr;
  }
  Node * node = create_node(NodeKind::Generic);
  consume();
  node->add_child(parse_expr());
  if (!accept(TokenKind::ParenthesisR)) {
    return finish(node, ParseError::RightParenthesisExpected);
  }
  return finish(node);
}

Node * CssParser::parse_function()
{
  const Mark m = mark();
  auto * node = create<cst::Function>();
  if (!node->set_identifier(parse_function_identifier())) {
    return nullptr;
  }
  if (has_whitespace() || !accept(TokenKind::ParenthesisL)) {
    restore(m);
    return nullptr;
  }

  if (append_to(node, node->arguments, parse_function_argument())) {
    while (accept(TokenKind::Comma)) {
      if (peek(TokenKind::ParenthesisR)) {
        break;
      }
      if (!append_to(node, node->arguments, parse_function_argument())) {
        mark_error(node, ParseError::ExpressionExpected);
      }
    }
  }
  if (!accept(TokenKind::ParenthesisR)) {
    return finish(node, ParseError::RightParenthesisExpected);
  }
  return finish(node);
}

Node * CssParser::parse_function_identifier()
{
  if (!peek(TokenKind::Ident)) {
    return nullptr;
  }
  auto * node = create<cst::Identifier>();
  node->reference = ReferenceKind::Function;
  consume();
  return finish(node);
}

Node * CssParser::parse_function_argument()
{
  auto * node = create<cst::FunctionArgument>();
  if (node->set_value(parse_expr(true))) {
    return finish(node);
  }
  return nullptr;
}

Node * CssParser::parse_uri_literal()
{
  if (peek(TokenKind::Uri)) {
    Node * node = create_node(NodeKind::UriLiteral);
    consume();
    return finish(node);
  }
  if (!peek_ident("url") && !peek_ident("url-prefix")) {
    return nullptr;
  }
  const Mark m = mark();
  Node * node = create_node(NodeKind::UriLiteral);
  consume();
  if (has_whitespace() || !peek(TokenKind::ParenthesisL)) {
    restore(m);
    return nullptr;
  }
  consume();
  node->add_child(parse_url_argument());  // optional
  if (!accept(TokenKind::ParenthesisR)) {
    return finish(node, ParseError::RightParenthesisExpected);
  }
  return finish(node);
}

Node * CssParser::parse_url_argument() { return parse_string_literal(); }

Node * CssParser::parse_ident(ReferenceKind reference)
{
  if (!peek(TokenKind::Ident)) {
    return nullptr;
  }
  auto * node = create<cst::Identifier>();
  node->reference = reference;
  node->is_custom_property = cursor_.peek_prefix(TokenKind::Ident, "--");
  consume();
  return finish(node);
}

Node * CssParser::parse_string_literal()
{
  if (!peek(TokenKind::String) && !peek(TokenKind::BadString)) {
    return nullptr;
  }
  Node * node = create_node(NodeKind::StringLiteral);
  consume();
  return finish(node);
}

Node * CssParser::parse_numeric()
{
  if (!peek(TokenKind::Num) && !peek(TokenKind::Percentage) && !peek(TokenKind::Dimension)) {
    return nullptr;
  }
  Node * node = create_node(NodeKind::NumericValue);
  consume();
  return finish(node);
}

Node * CssParser::parse_hex_color()
{
  if (!peek(TokenKind::Hash) || !is_hex_color(token().text)) {
    return nullptr;
  }
  Node * node = create_node(NodeKind::HexColorValue);
  consume();
  return finish(node);
}

Node * CssParser::parse_ratio()
{
  const Mark m = mark();
  Node * node = create_node(NodeKind::RatioValue);
  if (!node->add_child(parse_numeric())) {
    return nullptr;
  }
  if (!accept_delim('/')) {
    restore(m);
    return nullptr;
  }
  if (!node->add_child(parse_numeric())) {
    return finish(node, ParseError::NumberExpected);
  }
  return finish(node);
}

// ============================================================================
// @media
// ============================================================================

Node * CssParser::parse_media(bool is_nested)
{
  if (!peek_keyword("@media")) {
    return nullptr;
  }
  auto * node = create<cst::Media>();
  consume();
  if (!node->add_child(parse_media_query_list())) {
    return finish(node, ParseError::MediaQueryExpected);
  }
  return parse_body(node, [this, is_nested] { return parse_media_declaration(is_nested); });
}

Node * CssParser::parse_media_declaration(bool is_nested)
{
  if (is_nested) {
    return first_match(
      [&] { return try_parse_ruleset(true); }, [&] { return try_parse_declaration(); },
      [&] { return parse_stylesheet_statement(true); });
  }
  return parse_stylesheet_statement(false);
}

Node * CssParser::parse_media_query_list()
{
  Node * node = create_node(NodeKind::MediaQueryList);
  if (!node->add_child(parse_media_query())) {
    return finish(node, ParseError::MediaQueryExpected);
  }
  while (accept(TokenKind::Comma)) {
    if (!node->add_child(parse_media_query())) {
      return finish(node, ParseError::MediaQueryExpected);
    }
  }
  return finish(node);
}

Node * CssParser::parse_media_query()
{
  // [not | only]? <media-type> [and <media-condition>]? | <media-condition>
  Node * node = create_node(NodeKind::MediaQuery);
  const Mark m = mark();
  accept_ident("not");
  if (peek(TokenKind::ParenthesisL)) {
    // `not` belongs to the media condition
    restore(m);
    return parse_media_condition();
  }
  accept_ident("only");
  if (!node->add_child(parse_ident())) {
    restore(m);
    return nullptr;
  }
  if (accept_ident("and")) {
    node->add_child(parse_media_condition());
  }
  return finish(node);
}

Node * CssParser::parse_media_condition()
{
  Node * node = create_node(NodeKind::MediaCondition);
  accept_ident("not");
  bool parse_expression = true;
  while (parse_expression) {
    if (!accept(TokenKind::ParenthesisL)) {
      return finish(node, ParseError::LeftParenthesisExpected, {}, {TokenKind::CurlyL});
    }
    if (peek(TokenKind::ParenthesisL) || peek_ident("not")) {
      node->add_child(parse_media_condition());
    } else {
      node->add_child(parse_media_feature());
    }
    if (!accept(TokenKind::ParenthesisR)) {
      return finish(node, ParseError::RightParenthesisExpected, {}, {TokenKind::CurlyL});
    }
    parse_expression = accept_ident("and") || accept_ident("or");
  }
  return finish(node);
}

Node * CssParser::parse_media_feature()
{
  const TokenSet resync_stop{TokenKind::ParenthesisR};
  Node * node = create_node(NodeKind::MediaFeature);

  // <mf-plain> | <mf-boolean> | <mf-range>
  if (node->add_child(parse_media_feature_name())) {
    if (accept(TokenKind::Colon)) {
      if (!node->add_child(parse_media_feature_value())) {
        return finish(node, ParseError::TermExpected, {}, resync_stop);
      }
    } else if (parse_media_feature_range_operator()) {
      if (!node->add_child(parse_media_feature_value())) {
        return finish(node, ParseError::TermExpected, {}, resync_stop);
      }
      if (parse_media_feature_range_operator()) {
        if (!node->add_child(parse_media_feature_value())) {
          return finish(node, ParseError::TermExpected, {}, resync_stop);
        }
      }
    }
  } else if (node->add_child(parse_media_feature_value())) {
    if (!parse_media_feature_range_operator()) {
      return finish(node, ParseError::OperatorExpected, {}, resync_stop);
    }
    if (!node->add_child(parse_media_feature_name())) {
      return finish(node, ParseError::IdentifierExpected, {}, resync_stop);
    }
    if (parse_media_feature_range_operator()) {
      if (!node->add_child(parse_media_feature_value())) {
        return finish(node, ParseError::TermExpected, {}, resync_stop);
      }
    }
  } else {
    return finish(node, ParseError::IdentifierExpected, {}, resync_stop);
  }
  return finish(node);
}

bool CssParser::parse_media_feature_range_operator()
{
  if (accept_delim('<') || accept_delim('>')) {
    if (!has_whitespace()) {
      accept_delim('=');
    }
    return true;
  }
  return accept_delim('=');
}

Node * CssParser::parse_media_feature_name() { return parse_ident(); }

Node * CssParser::parse_media_feature_value()
{
  return first_match([&] { return parse_ratio(); }, [&] { return parse_term_expression(); });
}

// ============================================================================
// @font-face, @keyframes
// ============================================================================

Node * CssParser::parse_font_face()
{
  if (!peek_keyword("@font-face")) {
    return nullptr;
  }
  auto * node = create<cst::FontFace>();
  consume();
  return parse_body(node, [this] { return parse_rule_set_declaration(); });
}

Node * CssParser::parse_keyframe()
{
  if (!peek(TokenKind::AtKeyword) || !is_keyframes_keyword(token().text)) {
    return nullptr;
  }
  auto * node = create<cst::Keyframe>();
  Node * keyword = create_node(NodeKind::Generic);
  consume();
  node->set_keyword(finish(keyword));

  if (!node->set_identifier(parse_ident(ReferenceKind::Keyframe))) {
    return finish(node, ParseError::IdentifierExpected, {TokenKind::CurlyR});
  }
  return parse_body(node, [this] { return parse_keyframe_selector(); });
}

Node * CssParser::parse_keyframe_selector()
{
  auto * node = create<cst::KeyframeSelector>();

  const auto accept_stop = [&] {
    bool has_content = node->add_child(parse_ident());
    has_content = accept(TokenKind::Percentage) || has_content;
    return has_content;
  };

  if (!accept_stop()) {
    return nullptr;
  }
  while (accept(TokenKind::Comma)) {
    if (!accept_stop()) {
      return finish(node, ParseError::PercentageExpected);
    }
  }
  return parse_body(node, [this] { return parse_rule_set_declaration(); });
}

Node * CssParser::try_parse_keyframe_selector()
{
  auto * node = create<cst::KeyframeSelector>();
  const Mark m = mark();

  const auto accept_stop = [&] {
    bool has_content = node->add_child(parse_ident());
    has_content = accept(TokenKind::Percentage) || has_content;
    return has_content;
  };

  if (!accept_stop()) {
    return nullptr;
  }
  while (accept(TokenKind::Comma)) {
    if (!accept_stop()) {
      restore(m);
      return nullptr;
    }
  }
  if (!peek(TokenKind::CurlyL)) {
    restore(m);
    return nullptr;
  }
  return parse_body(node, [this] { return parse_rule_set_declaration(); });
}

// ============================================================================
// @supports
// ============================================================================

Node * CssParser::parse_supports(bool is_nested)
{
  if (!peek_keyword("@supports")) {
    return nullptr;
  }
  auto * node = create<cst::Supports>();
  consume();
  node->add_child(parse_supports_condition());
  return parse_body(node, [this, is_nested] { return parse_supports_declaration(is_nested); });
}

Node * CssParser::parse_supports_declaration(bool is_nested)
{
  if (is_nested) {
    return first_match(
      [&] { return try_parse_ruleset(true); }, [&] { return try_parse_declaration(); },
      [&] { return parse_stylesheet_statement(true); });
  }
  return parse_stylesheet_statement(false);
}

Node * CssParser::parse_supports_condition()
{
  // not <in-parens> | <in-parens> [and <in-parens>]* | <in-parens> [or <in-parens>]*
  Node * node = create_node(NodeKind::SupportsCondition);
  if (accept_ident("not")) {
    node->add_child(parse_supports_condition_in_parens());
  } else {
    node->add_child(parse_supports_condition_in_parens());
    if (peek_ident("and") || peek_ident("or")) {
      const std::string_view op = peek_ident("and") ? "and" : "or";
      while (accept_ident(op)) {
        node->add_child(parse_supports_condition_in_parens());
      }
    }
  }
  return finish(node);
}

Node * CssParser::parse_supports_condition_in_parens()
{
  Node * node = create_node(NodeKind::SupportsCondition);
  if (accept(TokenKind::ParenthesisL)) {
    if (!node->add_child(try_parse_declaration({TokenKind::ParenthesisR}))) {
      if (!node->add_child(parse_supports_condition())) {
        return finish(node, ParseError::ConditionExpected);
      }
    }
    if (!accept(TokenKind::ParenthesisR)) {
      return finish(node, ParseError::RightParenthesisExpected, {TokenKind::ParenthesisR});
    }
    return finish(node);
  }
  if (peek(TokenKind::Ident)) {
    // general enclosed: selector(...), font-tech(...)
    const Mark m = mark();
    consume();
    if (!has_whitespace() && accept(TokenKind::ParenthesisL)) {
      int open_parens = 1;
      while (!cursor_.at_eof() && open_parens != 0) {
        if (peek(TokenKind::ParenthesisL)) {
          ++open_parens;
        } else if (peek(TokenKind::ParenthesisR)) {
          --open_parens;
        }
        consume();
      }
      return finish(node);
    }
    restore(m);
  }
  return finish(node, ParseError::LeftParenthesisExpected, {}, {TokenKind::ParenthesisL});
}

// ============================================================================
// @layer, @property
// ============================================================================

Node * CssParser::parse_layer(bool is_nested)
{
  // @layer name { ... } | @layer a, b, c; | @layer { ... }
  if (!peek_keyword("@layer")) {
    return nullptr;
  }
  auto * node = create<cst::Layer>();
  consume();

  Node * names = parse_layer_name_list();
  node->set_names(names);
  if ((names == nullptr || names->child_count() == 1) && peek(TokenKind::CurlyL)) {
    return parse_body(node, [this, is_nested] { return parse_layer_declaration(is_nested); });
  }
  if (!accept(TokenKind::SemiColon)) {
    return finish(node, ParseError::SemiColonExpected);
  }
  return finish(node);
}

Node * CssParser::parse_layer_declaration(bool is_nested)
{
  if (is_nested) {
    return first_match(
      [&] { return try_parse_ruleset(true); }, [&] { return try_parse_declaration(); },
      [&] { return parse_stylesheet_statement(true); });
  }
  return parse_stylesheet_statement(false);
}

Node * CssParser::parse_layer_name_list()
{
  Node * node = create_node(NodeKind::LayerNameList);
  if (!node->add_child(parse_layer_name())) {
    return nullptr;
  }
  while (accept(TokenKind::Comma)) {
    if (!node->add_child(parse_layer_name())) {
      return finish(node, ParseError::IdentifierExpected);
    }
  }
  return finish(node);
}

Node * CssParser::parse_layer_name()
{
  // <ident> ['.' <ident>]*
  Node * node = create_node(NodeKind::LayerName);
  if (!node->add_child(parse_ident())) {
    return nullptr;
  }
  while (!has_whitespace() && accept_delim('.')) {
    if (has_whitespace() || !node->add_child(parse_ident())) {
      return finish(node, ParseError::IdentifierExpected);
    }
  }
  return finish(node);
}

Node * CssParser::parse_property_at_rule()
{
  // @property --name { <declaration-list> }
  if (!peek_keyword("@property")) {
    return nullptr;
  }
  auto * node = create<cst::PropertyAtRule>();
  consume();
  if (
    !cursor_.peek_prefix(TokenKind::Ident, "--") ||
    !node->set_name(parse_ident(ReferenceKind::Property))) {
    return finish(node, ParseError::IdentifierExpected);
  }
  return parse_body(node, [this] { return parse_declaration(); });
}

}  // namespace scssls::syntax
