// scssls/syntax/scss_parser.hpp - Dialect parser: variables, control flow, mixins, modules
#pragma once

#include "scssls/syntax/css_parser.hpp"

namespace scssls::syntax
{

/**
 * Parser for the SCSS dialect.
 *
 * Each override tries the dialect alternatives first and falls back to the
 * CssParser production when none of them matches. Productions that only
 * exist in the dialect are public so they can be driven in isolation.
 */
class ScssParser final : public CssParser
{
public:
  using CssParser::CssParser;

  /// Statement production used for the body of a control-flow construct.
  using StatementParser = Node * (ScssParser::*)();

  // ===========================================================================
  // Overridden base productions
  // ===========================================================================

  Node * parse_stylesheet_statement(bool is_nested = false) override;
  Node * parse_rule_set_declaration() override;
  Node * parse_import() override;

  Node * parse_simple_selector_body() override;
  Node * parse_element_name() override;
  Node * parse_nesting_selector() override;
  Node * try_parse_pseudo_identifier() override;

  Node * parse_ident(cst::ReferenceKind reference = cst::ReferenceKind::Unknown) override;
  Node * parse_term_expression() override;
  Node * parse_operator() override;
  Node * parse_unary_operator() override;
  Node * parse_operation() override;
  Node * parse_function_argument() override;
  Node * parse_url_argument() override;

  Node * parse_media_condition() override;
  Node * parse_media_feature_name() override;
  bool parse_media_feature_range_operator() override;
  Node * parse_keyframe_selector() override;
  Node * parse_supports_condition() override;

  // ===========================================================================
  // Lexical units
  // ===========================================================================

  Node * parse_variable();

  /// `#{ expr }`; an empty `#{}` is reported but still consumes the `}`.
  Node * parse_interpolation();

  /// `module.$var` or `module.fn()`; whitespace on either side of the dot is no match.
  Node * parse_module_member();

  /// `%placeholder` or `@at-root [(with|without: rule)]`.
  Node * parse_selector_placeholder();

  /// `value` or `key: value` inside a parenthesized list or map.
  Node * parse_list_element();

  // ===========================================================================
  // Statements
  // ===========================================================================

  /**
   * `$name: value [!default] [!global] [!important]`.
   *
   * @param panic  tokens at which recovery stops when the value is missing
   */
  Node * parse_variable_declaration(TokenSet panic = {});
  Node * parse_nested_properties();
  Node * parse_extends();
  Node * parse_warn_and_debug();
  Node * parse_return_statement();

  /// `@if`, `@for`, `@each` or `@while` whose body statements come from `parse_statement`.
  Node * parse_control_statement(
    StatementParser parse_statement = &ScssParser::parse_rule_set_declaration);
  Node * parse_if_statement(StatementParser parse_statement);
  Node * parse_for_statement(StatementParser parse_statement);
  Node * parse_each_statement(StatementParser parse_statement);
  Node * parse_while_statement(StatementParser parse_statement);

  /// Statements allowed in a `@function` body.
  Node * parse_function_body_declaration();

  // ===========================================================================
  // Mixins and functions
  // ===========================================================================

  Node * parse_mixin_declaration();
  Node * parse_function_declaration();
  Node * parse_parameter_declaration();
  Node * parse_mixin_content();
  Node * parse_mixin_reference();
  Node * parse_mixin_content_declaration();
  Node * parse_mixin_reference_body_statement();

  // ===========================================================================
  // Modules
  // ===========================================================================

  Node * parse_use();
  Node * parse_forward();
  Node * parse_module_config_declaration();

  /// `hide`/`show` list; nullptr (cursor restored) when only the keyword is present.
  Node * parse_forward_visibility();

protected:
  Node * complete_declaration(cst::Declaration * node) override;

private:
  Node * parse_if_statement_rest(StatementParser parse_statement);

  /// Comma-separated parameters up to (not including) the closing parenthesis.
  void parse_parameter_list(Node * owner, Node *& list);
  /// Comma-separated call arguments up to (not including) the closing parenthesis.
  void parse_argument_list(Node * owner, Node *& list);
  /// `( config, ... )` after `with`; false once an error was marked on `node`.
  bool parse_module_configuration(Node * node, Node *& list);
};

}  // namespace scssls::syntax
