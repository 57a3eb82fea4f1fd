#include <gtest/gtest.h>

#include "scssls/basic/casting.hpp"
#include "scssls/cst/node.hpp"
#include "scssls/test_support/parse_helpers.hpp"

using scssls::cast;
using scssls::dyn_cast;
using scssls::cst::NodeKind;
using scssls::cst::ReferenceKind;
using scssls::test_support::diagnostic_codes;
using scssls::test_support::find_all;
using scssls::test_support::find_first;
using scssls::test_support::parse;

namespace cst = scssls::cst;

// ============================================================================
// Variables
// ============================================================================

TEST(ParserStatements, VariableFlags)
{
  auto unit = parse("$a: 1 !default;\n$b: red !global !default;");
  EXPECT_TRUE(unit.diags.empty()) << ::testing::PrintToString(diagnostic_codes(unit.diags));

  ASSERT_EQ(unit.stylesheet->child_count(), 2U);
  const auto * a = cast<cst::VariableDeclaration>(unit.stylesheet->child_at(0));
  EXPECT_TRUE(a->is_default);
  EXPECT_FALSE(a->is_global);
  const auto * b = cast<cst::VariableDeclaration>(unit.stylesheet->child_at(1));
  EXPECT_TRUE(b->is_default);
  EXPECT_TRUE(b->is_global);
}

TEST(ParserStatements, UnknownVariableFlag)
{
  auto unit = parse("$a: 1 !often;");
  ASSERT_FALSE(unit.diags.empty());
  EXPECT_EQ(diagnostic_codes(unit.diags).front(), "E015");
}

TEST(ParserStatements, VariableWithoutValue)
{
  auto unit = parse("$a: ;");
  ASSERT_EQ(unit.diags.size(), 1U);
  EXPECT_EQ(unit.diags.all()[0].code, "E003");
}

// ============================================================================
// Control flow
// ============================================================================

TEST(ParserStatements, ElseIfChain)
{
  auto unit = parse("@if $a { b: c; } @else if $d { e: f; } @else { g: h; }");
  EXPECT_TRUE(unit.diags.empty()) << ::testing::PrintToString(diagnostic_codes(unit.diags));

  const auto * first = dyn_cast<cst::IfStatement>(unit.stylesheet->first_child());
  ASSERT_NE(first, nullptr);
  const auto * second = dyn_cast<cst::IfStatement>(first->else_clause);
  ASSERT_NE(second, nullptr);
  EXPECT_EQ(unit.slice(second->condition), "$d");
  EXPECT_NE(dyn_cast<cst::ElseClause>(second->else_clause), nullptr);
}

TEST(ParserStatements, ForThroughAndTo)
{
  auto unit = parse("@for $i from 1 through 3 { }\n@for $j from 0 to $n { }");
  EXPECT_TRUE(unit.diags.empty()) << ::testing::PrintToString(diagnostic_codes(unit.diags));

  ASSERT_EQ(unit.stylesheet->child_count(), 2U);
  const auto * inclusive = cast<cst::ForStatement>(unit.stylesheet->child_at(0));
  EXPECT_TRUE(inclusive->is_inclusive);
  EXPECT_EQ(unit.slice(inclusive->variable), "$i");
  EXPECT_EQ(unit.slice(inclusive->from), "1");
  EXPECT_EQ(unit.slice(inclusive->to), "3");

  const auto * exclusive = cast<cst::ForStatement>(unit.stylesheet->child_at(1));
  EXPECT_FALSE(exclusive->is_inclusive);
  EXPECT_EQ(unit.slice(exclusive->to), "$n");
}

TEST(ParserStatements, ForMissingFrom)
{
  auto unit = parse("@for $i in 1 { }");
  ASSERT_FALSE(unit.diags.empty());
  EXPECT_EQ(diagnostic_codes(unit.diags).front(), "E028");
}

TEST(ParserStatements, EachOverMultipleVariables)
{
  auto unit = parse("@each $key, $value in $map { #{$key}: $value; }");
  EXPECT_TRUE(unit.diags.empty()) << ::testing::PrintToString(diagnostic_codes(unit.diags));

  const auto * each = dyn_cast<cst::EachStatement>(unit.stylesheet->first_child());
  ASSERT_NE(each, nullptr);
  ASSERT_NE(each->variables, nullptr);
  ASSERT_EQ(each->variables->child_count(), 2U);
  EXPECT_EQ(unit.slice(each->variables->child_at(1)), "$value");
  EXPECT_EQ(unit.slice(each->expression), "$map");

  const auto * decl = dyn_cast<cst::Declaration>(find_first(each, NodeKind::Declaration));
  ASSERT_NE(decl, nullptr);
  EXPECT_NE(find_first(decl->property, NodeKind::Interpolation), nullptr);
}

TEST(ParserStatements, EachMissingIn)
{
  auto unit = parse("@each $x of $list { }");
  ASSERT_FALSE(unit.diags.empty());
  EXPECT_EQ(diagnostic_codes(unit.diags).front(), "E030");
}

TEST(ParserStatements, WhileLoop)
{
  auto unit = parse("@while $i > 0 { $i: $i - 1; }");
  EXPECT_TRUE(unit.diags.empty()) << ::testing::PrintToString(diagnostic_codes(unit.diags));

  const auto * loop = dyn_cast<cst::WhileStatement>(unit.stylesheet->first_child());
  ASSERT_NE(loop, nullptr);
  EXPECT_EQ(unit.slice(loop->condition), "$i > 0");
  ASSERT_NE(loop->declarations, nullptr);
  EXPECT_EQ(loop->declarations->first_child()->get_kind(), NodeKind::VariableDeclaration);
}

TEST(ParserStatements, DebugWarnError)
{
  auto unit = parse("@debug 1 + 1;\n@warn \"careful\";\n@error \"stop\";");
  EXPECT_TRUE(unit.diags.empty()) << ::testing::PrintToString(diagnostic_codes(unit.diags));
  EXPECT_EQ(find_all(unit.stylesheet, NodeKind::Debug).size(), 3U);
}

// ============================================================================
// Mixins and functions
// ============================================================================

TEST(ParserStatements, FunctionWithReturn)
{
  auto unit = parse("@function double($n) { @return $n * 2; }");
  EXPECT_TRUE(unit.diags.empty()) << ::testing::PrintToString(diagnostic_codes(unit.diags));

  const auto * fn = dyn_cast<cst::FunctionDeclaration>(unit.stylesheet->first_child());
  ASSERT_NE(fn, nullptr);
  EXPECT_EQ(unit.slice(fn->identifier), "double");
  EXPECT_EQ(cast<cst::Identifier>(fn->identifier)->reference, ReferenceKind::Function);
  ASSERT_NE(fn->parameters, nullptr);
  EXPECT_EQ(fn->parameters->child_count(), 1U);

  const auto * ret = find_first(fn, NodeKind::ReturnStatement);
  ASSERT_NE(ret, nullptr);
  EXPECT_EQ(unit.slice(ret), "@return $n * 2");
}

TEST(ParserStatements, FunctionBodyRejectsDeclarations)
{
  auto unit = parse("@function f() { color: red; }");
  EXPECT_FALSE(unit.diags.empty());
  EXPECT_EQ(find_first(unit.stylesheet, NodeKind::Declaration), nullptr);
}

TEST(ParserStatements, FunctionRequiresParentheses)
{
  auto unit = parse("@function f { @return 1; }");
  ASSERT_FALSE(unit.diags.empty());
  EXPECT_EQ(diagnostic_codes(unit.diags).front(), "E007");
}

TEST(ParserStatements, IncludeWithContentBlockAndUsing)
{
  auto unit = parse("a { @include hover using ($state) { color: $state; } }");
  EXPECT_TRUE(unit.diags.empty()) << ::testing::PrintToString(diagnostic_codes(unit.diags));

  const auto * ref = dyn_cast<cst::MixinReference>(find_first(unit.stylesheet, NodeKind::MixinReference));
  ASSERT_NE(ref, nullptr);
  EXPECT_EQ(unit.slice(ref->identifier), "hover");
  EXPECT_EQ(ref->arguments, nullptr);

  const auto * content = dyn_cast<cst::MixinContentDeclaration>(ref->content);
  ASSERT_NE(content, nullptr);
  ASSERT_NE(content->parameters, nullptr);
  EXPECT_EQ(unit.slice(content->parameters), "$state");
  ASSERT_NE(content->declarations, nullptr);
  EXPECT_EQ(content->declarations->first_child()->get_kind(), NodeKind::Declaration);
}

TEST(ParserStatements, IncludeWithContentNeedsNoSemicolon)
{
  auto unit = parse("a { @include m { b: c; } d: e; }");
  EXPECT_TRUE(unit.diags.empty()) << ::testing::PrintToString(diagnostic_codes(unit.diags));
  EXPECT_EQ(find_all(unit.stylesheet, NodeKind::Declaration).size(), 2U);
}

TEST(ParserStatements, ContentWithArguments)
{
  auto unit = parse("@mixin m { @content(1, $x); }");
  EXPECT_TRUE(unit.diags.empty()) << ::testing::PrintToString(diagnostic_codes(unit.diags));

  const auto * content = dyn_cast<cst::MixinContentReference>(
    find_first(unit.stylesheet, NodeKind::MixinContentReference));
  ASSERT_NE(content, nullptr);
  ASSERT_NE(content->arguments, nullptr);
  EXPECT_EQ(content->arguments->child_count(), 2U);
}

// ============================================================================
// Rulesets and declarations
// ============================================================================

TEST(ParserStatements, ExtendPlaceholderAndOptional)
{
  auto unit = parse("%btn { a: b; }\n.x { @extend %btn; @extend .y !optional; }");
  EXPECT_TRUE(unit.diags.empty()) << ::testing::PrintToString(diagnostic_codes(unit.diags));

  EXPECT_NE(find_first(unit.stylesheet->first_child(), NodeKind::SelectorPlaceholder), nullptr);

  const auto extends = find_all(unit.stylesheet, NodeKind::ExtendsReference);
  ASSERT_EQ(extends.size(), 2U);
  const auto * plain = cast<cst::ExtendsReference>(extends[0]);
  EXPECT_EQ(unit.slice(plain->selectors), "%btn");
  EXPECT_FALSE(plain->is_optional);
  EXPECT_TRUE(cast<cst::ExtendsReference>(extends[1])->is_optional);
}

TEST(ParserStatements, NestedProperties)
{
  auto unit = parse("a { font: 12px { family: serif; weight: bold; } }");
  EXPECT_TRUE(unit.diags.empty()) << ::testing::PrintToString(diagnostic_codes(unit.diags));

  const auto * decl = dyn_cast<cst::Declaration>(find_first(unit.stylesheet, NodeKind::Declaration));
  ASSERT_NE(decl, nullptr);
  EXPECT_EQ(unit.slice(decl->property), "font");
  EXPECT_EQ(unit.slice(decl->value), "12px");

  const auto * nested = dyn_cast<cst::NestedProperties>(decl->nested_properties);
  ASSERT_NE(nested, nullptr);
  ASSERT_NE(nested->declarations, nullptr);
  EXPECT_EQ(nested->declarations->child_count(), 2U);
}

TEST(ParserStatements, NestingSelectorSuffixes)
{
  auto unit = parse(".card { &__title { a: b; } &:hover { c: d; } & + & { e: f; } }");
  EXPECT_TRUE(unit.diags.empty()) << ::testing::PrintToString(diagnostic_codes(unit.diags));

  const auto nesting = find_all(unit.stylesheet, NodeKind::SelectorCombinator);
  ASSERT_EQ(nesting.size(), 4U);
  EXPECT_EQ(unit.slice(nesting[0]), "&__title");
  EXPECT_EQ(unit.slice(nesting[1]), "&");
  EXPECT_NE(find_first(unit.stylesheet, NodeKind::SelectorCombinatorSibling), nullptr);
}

TEST(ParserStatements, AtRootBlock)
{
  auto unit = parse(".a { @at-root .b { c: d; } }");
  EXPECT_TRUE(unit.diags.empty()) << ::testing::PrintToString(diagnostic_codes(unit.diags));
  EXPECT_EQ(find_all(unit.stylesheet, NodeKind::Ruleset).size(), 2U);
  EXPECT_NE(find_first(unit.stylesheet, NodeKind::SelectorPlaceholder), nullptr);
}

TEST(ParserStatements, DeclarationSemicolonPositions)
{
  auto unit = parse("a { b: c; d: e }");
  EXPECT_TRUE(unit.diags.empty()) << ::testing::PrintToString(diagnostic_codes(unit.diags));

  const auto decls = find_all(unit.stylesheet, NodeKind::Declaration);
  ASSERT_EQ(decls.size(), 2U);
  const auto * first = cast<cst::Declaration>(decls[0]);
  EXPECT_EQ(first->colon_position, 5U);
  EXPECT_EQ(first->semicolon_position, 8U);
  EXPECT_EQ(cast<cst::Declaration>(decls[1])->semicolon_position, cst::Declaration::k_no_position);
}

TEST(ParserStatements, ImportantPriority)
{
  auto unit = parse("a { color: red !important; }");
  EXPECT_TRUE(unit.diags.empty()) << ::testing::PrintToString(diagnostic_codes(unit.diags));
  const auto * prio = find_first(unit.stylesheet, NodeKind::Prio);
  ASSERT_NE(prio, nullptr);
  EXPECT_EQ(unit.slice(prio), "!important");
}
