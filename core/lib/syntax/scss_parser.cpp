// scssls/syntax/scss_parser.cpp - Dialect productions layered over CssParser
#include "scssls/syntax/scss_parser.hpp"

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

bool is_word_start(const Token & t) noexcept
{
  if (t.kind == TokenKind::Eof || t.text.empty()) {
    return false;
  }
  const auto c = static_cast<unsigned char>(t.text.front());
  return std::isalnum(c) != 0 || c == '_' || c == '-';
}

}  // namespace

// ============================================================================
// Statements
// ============================================================================

Node * ScssParser::parse_stylesheet_statement(bool is_nested)
{
  if (peek(TokenKind::AtKeyword)) {
    return first_match(
      [&] { return parse_warn_and_debug(); }, [&] { return parse_control_statement(); },
      [&] { return parse_mixin_declaration(); }, [&] { return parse_mixin_content(); },
      [&] { return parse_mixin_reference(); }, [&] { return parse_function_declaration(); },
      [&] { return parse_forward(); }, [&] { return parse_use(); },
      [&] { return parse_ruleset(is_nested); },  // @at-root
      [&] { return CssParser::parse_stylesheet_at_statement(is_nested); });
  }
  return first_match(
    [&] { return parse_ruleset(true); }, [&] { return parse_variable_declaration(); });
}

Node * ScssParser::parse_rule_set_declaration()
{
  if (peek(TokenKind::AtKeyword)) {
    return first_match(
      [&] { return parse_keyframe(); }, [&] { return parse_import(); },
      [&] { return parse_media(true); }, [&] { return parse_font_face(); },
      [&] { return parse_warn_and_debug(); }, [&] { return parse_control_statement(); },
      [&] { return parse_function_declaration(); }, [&] { return parse_extends(); },
      [&] { return parse_mixin_reference(); }, [&] { return parse_mixin_content(); },
      [&] { return parse_mixin_declaration(); }, [&] { return parse_ruleset(true); },
      [&] { return parse_supports(true); }, [&] { return parse_layer(true); },
      [&] { return parse_property_at_rule(); },
      [&] { return parse_rule_set_declaration_at_statement(); });
  }
  // A plain declaration goes last so that invalid input still ends up in a
  // declaration carrying the error.
  return first_match(
    [&] { return parse_variable_declaration(); }, [&] { return try_parse_ruleset(true); },
    [&] { return parse_declaration(); });
}

Node * ScssParser::parse_import()
{
  if (!peek_keyword("@import")) {
    return nullptr;
  }
  Node * node = create_node(NodeKind::Import);
  consume();

  if (!node->add_child(parse_uri_literal()) && !node->add_child(parse_string_literal())) {
    return finish(node, ParseError::UriOrStringExpected);
  }
  while (accept(TokenKind::Comma)) {
    if (!node->add_child(parse_uri_literal()) && !node->add_child(parse_string_literal())) {
      return finish(node, ParseError::UriOrStringExpected);
    }
  }
  return complete_import(node);
}

Node * ScssParser::parse_variable_declaration(TokenSet panic)
{
  if (!peek(TokenKind::VariableName)) {
    return nullptr;
  }
  auto * node = create<cst::VariableDeclaration>();
  node->set_variable(parse_variable());

  if (!accept(TokenKind::Colon)) {
    return finish(node, ParseError::ColonExpected);
  }
  node->colon_position = cursor_.prev_token()->begin();

  if (!node->set_value(parse_expr())) {
    return finish(node, ParseError::VariableValueExpected, {}, panic);
  }

  while (peek(TokenKind::Exclamation)) {
    if (node->add_child(parse_prio())) {
      continue;
    }
    consume();
    if (accept_ident("default")) {
      node->is_default = true;
    } else if (accept_ident("global")) {
      node->is_global = true;
    } else {
      return finish(node, ParseError::UnknownKeyword);
    }
  }

  if (peek(TokenKind::SemiColon)) {
    node->semicolon_position = token().begin();
  }
  return finish(node);
}

Node * ScssParser::complete_declaration(cst::Declaration * node)
{
  bool has_value = false;
  if (node->set_value(parse_expr())) {
    has_value = true;
    node->add_child(parse_prio());
  }
  if (peek(TokenKind::CurlyL)) {
    // font: 12px { family: serif; }
    node->set_nested_properties(parse_nested_properties());
  } else if (!has_value) {
    return finish(node, ParseError::PropertyValueExpected);
  }
  if (peek(TokenKind::SemiColon)) {
    node->semicolon_position = token().begin();
  }
  return finish(node);
}

Node * ScssParser::parse_nested_properties()
{
  auto * node = create<cst::NestedProperties>();
  return parse_body(node, [this] { return parse_declaration(); });
}

Node * ScssParser::parse_extends()
{
  if (!peek_keyword("@extend")) {
    return nullptr;
  }
  auto * node = create<cst::ExtendsReference>();
  consume();

  if (!append_to(node, node->selectors, parse_simple_selector())) {
    return finish(node, ParseError::SelectorExpected);
  }
  while (accept(TokenKind::Comma)) {
    append_to(node, node->selectors, parse_simple_selector());
  }
  if (accept(TokenKind::Exclamation)) {
    if (!accept_ident("optional")) {
      return finish(node, ParseError::UnknownKeyword);
    }
    node->is_optional = true;
  }
  return finish(node);
}

Node * ScssParser::parse_warn_and_debug()
{
  if (!peek(TokenKind::AtKeyword)) {
    return nullptr;
  }
  const bool is_debug = std::any_of(
    k_debug_keywords.begin(), k_debug_keywords.end(),
    [&](std::string_view k) { return equals_ignore_case(token().text, k); });
  if (!is_debug) {
    return nullptr;
  }
  Node * node = create_node(NodeKind::Debug);
  consume();
  node->add_child(parse_expr());  // optional
  return finish(node);
}

Node * ScssParser::parse_return_statement()
{
  if (!peek_keyword("@return")) {
    return nullptr;
  }
  Node * node = create_node(NodeKind::ReturnStatement);
  consume();
  if (!node->add_child(parse_expr())) {
    return finish(node, ParseError::ExpressionExpected);
  }
  return finish(node);
}

// ============================================================================
// Control flow
// ============================================================================

Node * ScssParser::parse_control_statement(StatementParser parse_statement)
{
  if (!peek(TokenKind::AtKeyword)) {
    return nullptr;
  }
  return first_match(
    [&] { return parse_if_statement(parse_statement); },
    [&] { return parse_for_statement(parse_statement); },
    [&] { return parse_each_statement(parse_statement); },
    [&] { return parse_while_statement(parse_statement); });
}

Node * ScssParser::parse_if_statement(StatementParser parse_statement)
{
  if (!peek_keyword("@if")) {
    return nullptr;
  }
  return parse_if_statement_rest(parse_statement);
}

Node * ScssParser::parse_if_statement_rest(StatementParser parse_statement)
{
  auto * node = create<cst::IfStatement>();
  consume();  // `@if`, or `if` after `@else`

  if (!node->set_condition(parse_expr(true))) {
    return finish(node, ParseError::ExpressionExpected);
  }
  const auto body = [this, parse_statement] { return (this->*parse_statement)(); };
  if (!node->set_declarations(parse_declarations(body))) {
    return finish(node, ParseError::LeftCurlyExpected, {TokenKind::CurlyR, TokenKind::SemiColon});
  }

  if (accept_keyword("@else")) {
    if (peek_ident("if")) {
      node->set_else_clause(parse_if_statement_rest(parse_statement));
    } else if (peek(TokenKind::CurlyL)) {
      auto * else_clause = create<cst::ElseClause>();
      node->set_else_clause(parse_body(else_clause, body));
    } else {
      return finish(node, ParseError::LeftCurlyExpected);
    }
  }
  return finish(node);
}

Node * ScssParser::parse_for_statement(StatementParser parse_statement)
{
  if (!peek_keyword("@for")) {
    return nullptr;
  }
  auto * node = create<cst::ForStatement>();
  consume();

  if (!node->set_variable(parse_variable())) {
    return finish(node, ParseError::VariableNameExpected, {TokenKind::CurlyR});
  }
  if (!accept_ident("from")) {
    return finish(node, ParseError::FromExpected, {TokenKind::CurlyR});
  }
  if (!node->set_from(parse_binary_expr())) {
    return finish(node, ParseError::ExpressionExpected, {TokenKind::CurlyR});
  }
  if (accept_ident("through")) {
    node->is_inclusive = true;
  } else if (!accept_ident("to")) {
    return finish(node, ParseError::ThroughOrToExpected, {TokenKind::CurlyR});
  }
  if (!node->set_to(parse_binary_expr())) {
    return finish(node, ParseError::ExpressionExpected, {TokenKind::CurlyR});
  }
  return parse_body(node, [this, parse_statement] { return (this->*parse_statement)(); });
}

Node * ScssParser::parse_each_statement(StatementParser parse_statement)
{
  if (!peek_keyword("@each")) {
    return nullptr;
  }
  auto * node = create<cst::EachStatement>();
  consume();

  if (!append_to(node, node->variables, parse_variable())) {
    return finish(node, ParseError::VariableNameExpected, {TokenKind::CurlyR});
  }
  while (accept(TokenKind::Comma)) {
    if (!append_to(node, node->variables, parse_variable())) {
      return finish(node, ParseError::VariableNameExpected, {TokenKind::CurlyR});
    }
  }
  if (!accept_ident("in")) {
    return finish(node, ParseError::InExpected, {TokenKind::CurlyR});
  }
  if (!node->set_expression(parse_expr())) {
    return finish(node, ParseError::ExpressionExpected, {TokenKind::CurlyR});
  }
  return parse_body(node, [this, parse_statement] { return (this->*parse_statement)(); });
}

Node * ScssParser::parse_while_statement(StatementParser parse_statement)
{
  if (!peek_keyword("@while")) {
    return nullptr;
  }
  auto * node = create<cst::WhileStatement>();
  consume();

  if (!node->set_condition(parse_binary_expr())) {
    return finish(node, ParseError::ExpressionExpected, {TokenKind::CurlyR});
  }
  return parse_body(node, [this, parse_statement] { return (this->*parse_statement)(); });
}

Node * ScssParser::parse_function_body_declaration()
{
  return first_match(
    [&] { return parse_variable_declaration(); }, [&] { return parse_return_statement(); },
    [&] { return parse_warn_and_debug(); },
    [&] { return parse_control_statement(&ScssParser::parse_function_body_declaration); });
}

// ============================================================================
// Mixins and functions
// ============================================================================

void ScssParser::parse_parameter_list(Node * owner, Node *& list)
{
  if (!append_to(owner, list, parse_parameter_declaration())) {
    return;
  }
  while (accept(TokenKind::Comma)) {
    if (peek(TokenKind::ParenthesisR)) {
      break;  // trailing comma
    }
    if (!append_to(owner, list, parse_parameter_declaration())) {
      mark_error(owner, ParseError::VariableNameExpected);
      return;
    }
  }
}

void ScssParser::parse_argument_list(Node * owner, Node *& list)
{
  if (!append_to(owner, list, parse_function_argument())) {
    return;
  }
  while (accept(TokenKind::Comma)) {
    if (peek(TokenKind::ParenthesisR)) {
      break;  // trailing comma
    }
    if (!append_to(owner, list, parse_function_argument())) {
      mark_error(owner, ParseError::ExpressionExpected);
      return;
    }
  }
}

Node * ScssParser::parse_mixin_declaration()
{
  if (!peek_keyword("@mixin")) {
    return nullptr;
  }
  auto * node = create<cst::MixinDeclaration>();
  consume();

  if (!node->set_identifier(parse_ident(ReferenceKind::Mixin))) {
    return finish(node, ParseError::IdentifierExpected, {TokenKind::CurlyR});
  }
  if (accept(TokenKind::ParenthesisL)) {
    parse_parameter_list(node, node->parameters);
    if (!accept(TokenKind::ParenthesisR)) {
      // Keep the body: skip the rest of the parameter list only.
      mark_error(node, ParseError::RightParenthesisExpected, {}, {TokenKind::CurlyL, TokenKind::CurlyR});
    }
  }
  return parse_body(node, [this] { return parse_rule_set_declaration(); });
}

Node * ScssParser::parse_function_declaration()
{
  if (!peek_keyword("@function")) {
    return nullptr;
  }
  auto * node = create<cst::FunctionDeclaration>();
  consume();

  if (!node->set_identifier(parse_ident(ReferenceKind::Function))) {
    return finish(node, ParseError::IdentifierExpected, {TokenKind::CurlyR});
  }
  if (!accept(TokenKind::ParenthesisL)) {
    return finish(node, ParseError::LeftParenthesisExpected, {TokenKind::CurlyR});
  }
  parse_parameter_list(node, node->parameters);
  if (!accept(TokenKind::ParenthesisR)) {
    mark_error(node, ParseError::RightParenthesisExpected, {}, {TokenKind::CurlyL, TokenKind::CurlyR});
  }
  return parse_body(node, [this] { return parse_function_body_declaration(); });
}

Node * ScssParser::parse_parameter_declaration()
{
  auto * node = create<cst::FunctionParameter>();
  if (!node->set_identifier(parse_variable())) {
    return nullptr;
  }
  if (accept(TokenKind::Ellipsis)) {
    node->is_variadic = true;
  }
  if (accept(TokenKind::Colon)) {
    if (!node->set_default_value(parse_expr(true))) {
      return finish(
        node, ParseError::VariableValueExpected, {},
        {TokenKind::Comma, TokenKind::ParenthesisR});
    }
  }
  return finish(node);
}

Node * ScssParser::parse_mixin_content()
{
  if (!peek_keyword("@content")) {
    return nullptr;
  }
  auto * node = create<cst::MixinContentReference>();
  consume();

  if (accept(TokenKind::ParenthesisL)) {
    parse_argument_list(node, node->arguments);
    if (!accept(TokenKind::ParenthesisR)) {
      return finish(node, ParseError::RightParenthesisExpected);
    }
  }
  return finish(node);
}

Node * ScssParser::parse_mixin_reference()
{
  if (!peek_keyword("@include")) {
    return nullptr;
  }
  auto * node = create<cst::MixinReference>();
  consume();

  Node * first = parse_ident(ReferenceKind::Mixin);
  if (!node->set_identifier(first)) {
    return finish(node, ParseError::IdentifierExpected, {TokenKind::CurlyR});
  }

  // module.mixin
  if (!has_whitespace() && accept_delim('.') && !has_whitespace()) {
    const SourceRange module_range(
      first->get_range().file_id(), first->offset(), cursor_.prev_token()->end());
    Node * second = parse_ident(ReferenceKind::Mixin);
    if (second == nullptr) {
      return finish(node, ParseError::IdentifierExpected, {TokenKind::CurlyR});
    }
    cast<cst::Identifier>(first)->reference = ReferenceKind::Module;
    auto * module_node = ctx_.create<cst::ModuleMember>(module_range);
    module_node->set_identifier(first);
    node->add_child(module_node);
    node->set_identifier(second);
  }

  if (accept(TokenKind::ParenthesisL)) {
    parse_argument_list(node, node->arguments);
    if (!accept(TokenKind::ParenthesisR)) {
      return finish(node, ParseError::RightParenthesisExpected);
    }
  }

  if (peek_ident("using") || peek(TokenKind::CurlyL)) {
    node->set_content(parse_mixin_content_declaration());
  }
  return finish(node);
}

Node * ScssParser::parse_mixin_content_declaration()
{
  auto * node = create<cst::MixinContentDeclaration>();

  if (accept_ident("using")) {
    if (!accept(TokenKind::ParenthesisL)) {
      return finish(node, ParseError::LeftParenthesisExpected, {}, {TokenKind::CurlyL});
    }
    parse_parameter_list(node, node->parameters);
    if (!accept(TokenKind::ParenthesisR)) {
      return finish(node, ParseError::RightParenthesisExpected, {}, {TokenKind::CurlyL});
    }
  }

  if (peek(TokenKind::CurlyL)) {
    return parse_body(node, [this] { return parse_mixin_reference_body_statement(); });
  }
  return finish(node);
}

Node * ScssParser::parse_mixin_reference_body_statement()
{
  return first_match(
    [&] { return try_parse_keyframe_selector(); }, [&] { return parse_rule_set_declaration(); });
}

Node * ScssParser::parse_function_argument()
{
  // [$name ':'] expression | $name '...'
  auto * node = create<cst::FunctionArgument>();

  const Mark m = mark();
  if (Node * argument = parse_variable()) {
    if (accept(TokenKind::Colon)) {
      node->set_identifier(argument);
    } else if (accept(TokenKind::Ellipsis)) {
      node->set_value(argument);
      return finish(node);
    } else {
      restore(m);
    }
  }

  if (node->set_value(parse_expr(true))) {
    accept(TokenKind::Ellipsis);
    node->add_child(parse_prio());
    return finish(node);
  }
  if (node->set_value(parse_prio())) {
    return finish(node);
  }
  if (node->identifier != nullptr) {
    return finish(node, ParseError::ExpressionExpected);
  }
  return nullptr;
}

// ============================================================================
// Lexical units and expressions
// ============================================================================

Node * ScssParser::parse_variable()
{
  if (!peek(TokenKind::VariableName)) {
    return nullptr;
  }
  Node * node = create_node(NodeKind::Variable);
  consume();
  return finish(node);
}

Node * ScssParser::parse_interpolation()
{
  if (!peek(TokenKind::InterpolationFunction)) {
    return nullptr;
  }
  Node * node = create_node(NodeKind::Interpolation);
  consume();

  if (!node->add_child(parse_expr()) && !node->add_child(parse_nesting_selector())) {
    mark_error(node, ParseError::ExpressionExpected);
  }
  if (!accept(TokenKind::CurlyR)) {
    return finish(node, ParseError::RightCurlyExpected);
  }
  return finish(node);
}

Node * ScssParser::parse_module_member()
{
  const Mark m = mark();
  auto * node = create<cst::ModuleMember>();

  if (!node->set_identifier(parse_ident(ReferenceKind::Module))) {
    return nullptr;
  }
  if (has_whitespace() || !accept_delim('.') || has_whitespace()) {
    restore(m);
    return nullptr;
  }
  if (!node->add_child(first_match(
        [&] { return parse_variable(); }, [&] { return parse_function(); }))) {
    return finish(node, ParseError::IdentifierOrVariableExpected);
  }
  return finish(node);
}

Node * ScssParser::parse_ident(ReferenceKind reference)
{
  if (!peek(TokenKind::Ident) && !peek(TokenKind::InterpolationFunction) && !peek_delim('-')) {
    return nullptr;
  }
  auto * node = create<cst::Identifier>();
  node->reference = reference;
  node->is_custom_property = cursor_.peek_prefix(TokenKind::Ident, "--");

  // `-#{...}` / `--#{...}`: the hyphens only belong to the identifier when
  // an interpolation follows without whitespace.
  const auto hyphen_interpolation = [this]() -> Node * {
    const Mark m = mark();
    if (accept_delim('-')) {
      if (!has_whitespace()) {
        accept_delim('-');
      }
      if (has_whitespace()) {
        restore(m);
        return nullptr;
      }
    }
    Node * interpolation = parse_interpolation();
    if (interpolation == nullptr) {
      restore(m);
    }
    return interpolation;
  };
  const auto word_continuation = [this] {
    if (!is_word_start(token())) {
      return false;
    }
    consume();
    return true;
  };

  bool has_content = false;
  while (accept(TokenKind::Ident) || node->add_child(hyphen_interpolation()) ||
         (has_content && word_continuation())) {
    has_content = true;
    if (has_whitespace()) {
      break;
    }
  }
  return has_content ? finish(node) : nullptr;
}

Node * ScssParser::parse_term_expression()
{
  return first_match(
    [&] { return parse_module_member(); }, [&] { return parse_variable(); },
    [&] { return parse_nesting_selector(); }, [&] { return CssParser::parse_term_expression(); });
}

Node * ScssParser::parse_operator()
{
  if (
    peek(TokenKind::EqualsOperator) || peek(TokenKind::NotEqualsOperator) ||
    peek(TokenKind::GreaterEqualsOperator) || peek(TokenKind::SmallerEqualsOperator) ||
    peek_delim('>') || peek_delim('<') || peek_ident("and") || peek_ident("or") ||
    peek_delim('%')) {
    Node * node = create_node(NodeKind::Operator);
    consume();
    return finish(node);
  }
  return CssParser::parse_operator();
}

Node * ScssParser::parse_unary_operator()
{
  if (peek_ident("not")) {
    Node * node = create_node(NodeKind::Operator);
    consume();
    return finish(node);
  }
  return CssParser::parse_unary_operator();
}

Node * ScssParser::parse_operation()
{
  // (a, b) or (key: value, ...)
  if (!peek(TokenKind::ParenthesisL)) {
    return nullptr;
  }
  Node * node = create_node(NodeKind::Generic);
  consume();

  while (node->add_child(parse_list_element())) {
    accept(TokenKind::Comma);  // optional
  }
  if (!accept(TokenKind::ParenthesisR)) {
    return finish(node, ParseError::RightParenthesisExpected);
  }
  return finish(node);
}

Node * ScssParser::parse_list_element()
{
  auto * node = create<cst::ListEntry>();
  Node * child = parse_binary_expr();
  if (child == nullptr) {
    return nullptr;
  }
  if (accept(TokenKind::Colon)) {
    node->set_key(child);
    if (!node->set_value(parse_binary_expr())) {
      return finish(node, ParseError::ExpressionExpected);
    }
  } else {
    node->set_value(child);
  }
  return finish(node);
}

Node * ScssParser::parse_url_argument()
{
  const Mark m = mark();
  Node * node = CssParser::parse_url_argument();
  if (node != nullptr && peek(TokenKind::ParenthesisR)) {
    return node;
  }
  restore(m);

  // url($base + "/img.png")
  Node * expression = create_node(NodeKind::Generic);
  expression->add_child(parse_binary_expr());
  return finish(expression);
}

// ============================================================================
// Selectors
// ============================================================================

Node * ScssParser::parse_simple_selector_body()
{
  return first_match(
    [&] { return parse_selector_placeholder(); },
    [&] { return CssParser::parse_simple_selector_body(); });
}

Node * ScssParser::parse_element_name()
{
  const Mark m = mark();
  Node * node = CssParser::parse_element_name();
  if (node != nullptr && !has_whitespace() && peek(TokenKind::ParenthesisL)) {
    // a function call, not a selector
    restore(m);
    return nullptr;
  }
  return node;
}

Node * ScssParser::parse_nesting_selector()
{
  if (!peek_delim('&')) {
    return nullptr;
  }
  Node * node = create_node(NodeKind::SelectorCombinator);
  consume();

  // &-foo, &__bar, &-1, &&
  while (!has_whitespace() &&
         (accept_delim('-') || accept(TokenKind::Num) || accept(TokenKind::Dimension) ||
          node->add_child(parse_ident()) || accept_delim('&'))) {
  }
  return finish(node);
}

Node * ScssParser::parse_selector_placeholder()
{
  if (peek_delim('%')) {
    Node * node = create_node(NodeKind::SelectorPlaceholder);
    consume();
    node->add_child(parse_ident());
    return finish(node);
  }
  if (peek_keyword("@at-root")) {
    Node * node = create_node(NodeKind::SelectorPlaceholder);
    consume();
    if (accept(TokenKind::ParenthesisL)) {
      if (!accept_ident("with") && !accept_ident("without")) {
        return finish(node, ParseError::IdentifierExpected);
      }
      if (!accept(TokenKind::Colon)) {
        return finish(node, ParseError::ColonExpected);
      }
      if (!node->add_child(parse_ident())) {
        return finish(node, ParseError::IdentifierExpected);
      }
      if (!accept(TokenKind::ParenthesisR)) {
        return finish(node, ParseError::RightParenthesisExpected, {TokenKind::CurlyR});
      }
    }
    return finish(node);
  }
  return nullptr;
}

Node * ScssParser::try_parse_pseudo_identifier()
{
  return first_match(
    [&] { return parse_interpolation(); },
    [&] { return CssParser::try_parse_pseudo_identifier(); });
}

// ============================================================================
// At-rule extensions
// ============================================================================

Node * ScssParser::parse_media_condition()
{
  return first_match(
    [&] { return parse_interpolation(); }, [&] { return CssParser::parse_media_condition(); });
}

Node * ScssParser::parse_media_feature_name()
{
  // function before ident
  return first_match(
    [&] { return parse_module_member(); }, [&] { return parse_function(); },
    [&] { return parse_ident(); }, [&] { return parse_variable(); });
}

bool ScssParser::parse_media_feature_range_operator()
{
  return accept(TokenKind::SmallerEqualsOperator) || accept(TokenKind::GreaterEqualsOperator) ||
         CssParser::parse_media_feature_range_operator();
}

Node * ScssParser::parse_keyframe_selector()
{
  return first_match(
    [&] { return try_parse_keyframe_selector(); },
    [&] { return parse_control_statement(&ScssParser::parse_keyframe_selector); },
    [&] { return parse_warn_and_debug(); }, [&] { return parse_mixin_reference(); },
    [&] { return parse_function_declaration(); }, [&] { return parse_variable_declaration(); },
    [&] { return parse_mixin_content(); });
}

Node * ScssParser::parse_supports_condition()
{
  return first_match(
    [&] { return parse_interpolation(); }, [&] { return CssParser::parse_supports_condition(); });
}

// ============================================================================
// Modules
// ============================================================================

bool ScssParser::parse_module_configuration(Node * node, Node *& list)
{
  if (!accept(TokenKind::ParenthesisL)) {
    mark_error(node, ParseError::LeftParenthesisExpected, {TokenKind::ParenthesisR});
    return false;
  }
  if (!append_to(node, list, parse_module_config_declaration())) {
    mark_error(node, ParseError::VariableNameExpected);
    return false;
  }
  while (accept(TokenKind::Comma)) {
    if (peek(TokenKind::ParenthesisR)) {
      break;  // trailing comma
    }
    if (!append_to(node, list, parse_module_config_declaration())) {
      mark_error(node, ParseError::VariableNameExpected);
      return false;
    }
  }
  if (!accept(TokenKind::ParenthesisR)) {
    mark_error(node, ParseError::RightParenthesisExpected);
    return false;
  }
  return true;
}

Node * ScssParser::parse_use()
{
  if (!peek_keyword("@use")) {
    return nullptr;
  }
  auto * node = create<cst::Use>();
  consume();

  if (!node->set_path(parse_string_literal())) {
    return finish(node, ParseError::StringLiteralExpected);
  }

  if (!peek(TokenKind::SemiColon) && !peek(TokenKind::Eof)) {
    if (!peek_ident("as") && !peek_ident("with")) {
      return finish(node, ParseError::UnknownKeyword);
    }
    if (accept_ident("as") && !node->set_identifier(parse_ident(ReferenceKind::Module))) {
      if (!accept_delim('*')) {
        return finish(node, ParseError::IdentifierOrWildcardExpected);
      }
      node->is_wildcard = true;
    }
    if (accept_ident("with") && !parse_module_configuration(node, node->parameters)) {
      return finish(node);
    }
  }

  if (!accept(TokenKind::SemiColon) && !peek(TokenKind::Eof)) {
    return finish(node, ParseError::SemiColonExpected);
  }
  return finish(node);
}

Node * ScssParser::parse_module_config_declaration()
{
  auto * node = create<cst::ModuleConfiguration>();
  if (!node->set_identifier(parse_variable())) {
    return nullptr;
  }
  if (!accept(TokenKind::Colon) || !node->set_value(parse_expr(true))) {
    return finish(
      node, ParseError::VariableValueExpected, {}, {TokenKind::Comma, TokenKind::ParenthesisR});
  }
  if (accept(TokenKind::Exclamation)) {
    if (has_whitespace() || !accept_ident("default")) {
      return finish(node, ParseError::UnknownKeyword);
    }
    node->is_default = true;
  }
  return finish(node);
}

Node * ScssParser::parse_forward()
{
  if (!peek_keyword("@forward")) {
    return nullptr;
  }
  auto * node = create<cst::Forward>();
  consume();

  if (!node->set_path(parse_string_literal())) {
    return finish(node, ParseError::StringLiteralExpected);
  }

  if (accept_ident("as")) {
    if (!node->set_identifier(parse_ident(ReferenceKind::Forward))) {
      return finish(node, ParseError::IdentifierExpected);
    }
    // the wildcard is glued to the prefix: `as button-*`
    if (has_whitespace() || !accept_delim('*')) {
      return finish(node, ParseError::WildcardExpected);
    }
  }

  if (accept_ident("with")) {
    if (!parse_module_configuration(node, node->parameters)) {
      return finish(node);
    }
  } else if (peek_ident("hide") || peek_ident("show")) {
    if (!node->set_visibility(parse_forward_visibility())) {
      consume();  // the bare keyword
      return finish(node, ParseError::IdentifierOrVariableExpected);
    }
  }

  if (!accept(TokenKind::SemiColon) && !peek(TokenKind::Eof)) {
    return finish(node, ParseError::SemiColonExpected);
  }
  return finish(node);
}

Node * ScssParser::parse_forward_visibility()
{
  const Mark m = mark();
  auto * node = create<cst::ForwardVisibility>();
  node->set_identifier(parse_ident());

  bool has_names = false;
  while (node->add_child(first_match(
    [&] { return parse_variable(); },
    [&] { return parse_ident(ReferenceKind::ForwardVisibility); }))) {
    has_names = true;
    accept(TokenKind::Comma);
  }
  if (!has_names) {
    restore(m);
    return nullptr;
  }
  return finish(node);
}

}  // namespace scssls::syntax
