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

TEST(ParserEndToEnd, VariableDeclaration)
{
  auto unit = parse("$x: 1px;");
  EXPECT_TRUE(unit.diags.empty()) << ::testing::PrintToString(diagnostic_codes(unit.diags));

  ASSERT_EQ(unit.stylesheet->child_count(), 1U);
  const auto * decl = dyn_cast<cst::VariableDeclaration>(unit.stylesheet->first_child());
  ASSERT_NE(decl, nullptr);
  EXPECT_EQ(unit.slice(decl->variable), "$x");
  EXPECT_EQ(unit.slice(decl->value), "1px");
  EXPECT_EQ(decl->colon_position, 2U);
  EXPECT_EQ(decl->semicolon_position, 7U);
  EXPECT_FALSE(decl->is_default);
  EXPECT_FALSE(decl->is_global);
}

TEST(ParserEndToEnd, IfElse)
{
  auto unit = parse("@if $a == 1 { color: red; } @else { color: blue; }");
  EXPECT_TRUE(unit.diags.empty()) << ::testing::PrintToString(diagnostic_codes(unit.diags));

  ASSERT_EQ(unit.stylesheet->child_count(), 1U);
  const auto * stmt = dyn_cast<cst::IfStatement>(unit.stylesheet->first_child());
  ASSERT_NE(stmt, nullptr);
  EXPECT_EQ(unit.slice(stmt->condition), "$a == 1");

  const auto * condition = find_first(stmt->condition, NodeKind::BinaryExpression);
  ASSERT_NE(condition, nullptr);
  EXPECT_EQ(unit.slice(cast<cst::BinaryExpression>(condition)->op), "==");

  ASSERT_NE(stmt->declarations, nullptr);
  ASSERT_EQ(stmt->declarations->child_count(), 1U);
  EXPECT_EQ(stmt->declarations->first_child()->get_kind(), NodeKind::Declaration);

  const auto * else_clause = dyn_cast<cst::ElseClause>(stmt->else_clause);
  ASSERT_NE(else_clause, nullptr);
  EXPECT_EQ(unit.slice(else_clause->declarations), "{ color: blue; }");
  EXPECT_EQ(stmt->get_range().end(), unit.source().size());
}

TEST(ParserEndToEnd, UseWithNamespace)
{
  auto unit = parse("@use \"sass:math\" as m;");
  EXPECT_TRUE(unit.diags.empty()) << ::testing::PrintToString(diagnostic_codes(unit.diags));

  const auto * use = dyn_cast<cst::Use>(unit.stylesheet->first_child());
  ASSERT_NE(use, nullptr);
  EXPECT_EQ(unit.slice(use->path), "\"sass:math\"");
  ASSERT_NE(use->identifier, nullptr);
  EXPECT_EQ(unit.slice(use->identifier), "m");
  EXPECT_EQ(cast<cst::Identifier>(use->identifier)->reference, ReferenceKind::Module);
  EXPECT_FALSE(use->is_wildcard);
  EXPECT_EQ(use->parameters, nullptr);
}

TEST(ParserEndToEnd, IncludeModuleMixinWithArguments)
{
  auto unit = parse("@include foo.bar($x: 1, $y...);");
  EXPECT_TRUE(unit.diags.empty()) << ::testing::PrintToString(diagnostic_codes(unit.diags));

  const auto * ref = dyn_cast<cst::MixinReference>(unit.stylesheet->first_child());
  ASSERT_NE(ref, nullptr);
  ASSERT_NE(ref->identifier, nullptr);
  EXPECT_EQ(unit.slice(ref->identifier), "bar");
  EXPECT_EQ(cast<cst::Identifier>(ref->identifier)->reference, ReferenceKind::Mixin);

  const auto * module_member = dyn_cast<cst::ModuleMember>(ref->find_child(NodeKind::ModuleMember));
  ASSERT_NE(module_member, nullptr);
  EXPECT_EQ(unit.slice(module_member), "foo.");
  EXPECT_EQ(unit.slice(module_member->identifier), "foo");
  EXPECT_EQ(cast<cst::Identifier>(module_member->identifier)->reference, ReferenceKind::Module);

  ASSERT_NE(ref->arguments, nullptr);
  ASSERT_EQ(ref->arguments->child_count(), 2U);
  const auto * named = cast<cst::FunctionArgument>(ref->arguments->child_at(0));
  EXPECT_EQ(unit.slice(named->identifier), "$x");
  EXPECT_EQ(unit.slice(named->value), "1");
  const auto * rest = cast<cst::FunctionArgument>(ref->arguments->child_at(1));
  EXPECT_EQ(rest->identifier, nullptr);
  EXPECT_EQ(unit.slice(rest->value), "$y");
  EXPECT_EQ(unit.slice(rest), "$y...");
  EXPECT_EQ(ref->content, nullptr);
}

TEST(ParserEndToEnd, NestedRulesets)
{
  auto unit = parse(".a { .b { color: $c; } }");
  EXPECT_TRUE(unit.diags.empty()) << ::testing::PrintToString(diagnostic_codes(unit.diags));

  const auto rulesets = find_all(unit.stylesheet, NodeKind::Ruleset);
  ASSERT_EQ(rulesets.size(), 2U);
  EXPECT_EQ(rulesets[0]->parent(), unit.stylesheet);
  EXPECT_TRUE(rulesets[1]->is_descendant_of(rulesets[0]));
  EXPECT_EQ(unit.slice(cast<cst::Ruleset>(rulesets[1])->selectors), ".b");

  const auto * decl = dyn_cast<cst::Declaration>(find_first(rulesets[1], NodeKind::Declaration));
  ASSERT_NE(decl, nullptr);
  EXPECT_EQ(unit.slice(decl->property), "color");
  const auto * variable = find_first(decl->value, NodeKind::Variable);
  ASSERT_NE(variable, nullptr);
  EXPECT_EQ(unit.slice(variable), "$c");
}

TEST(ParserEndToEnd, MixinWithDefaultsAndRestParameter)
{
  auto unit = parse("@mixin m($a: 1, $rest...) { @content; }");
  EXPECT_TRUE(unit.diags.empty()) << ::testing::PrintToString(diagnostic_codes(unit.diags));

  const auto * mixin = dyn_cast<cst::MixinDeclaration>(unit.stylesheet->first_child());
  ASSERT_NE(mixin, nullptr);
  EXPECT_EQ(unit.slice(mixin->identifier), "m");
  EXPECT_EQ(cast<cst::Identifier>(mixin->identifier)->reference, ReferenceKind::Mixin);

  ASSERT_NE(mixin->parameters, nullptr);
  ASSERT_EQ(mixin->parameters->child_count(), 2U);
  const auto * first = cast<cst::FunctionParameter>(mixin->parameters->child_at(0));
  EXPECT_EQ(unit.slice(first->identifier), "$a");
  EXPECT_EQ(unit.slice(first->default_value), "1");
  EXPECT_FALSE(first->is_variadic);
  const auto * second = cast<cst::FunctionParameter>(mixin->parameters->child_at(1));
  EXPECT_EQ(unit.slice(second->identifier), "$rest");
  EXPECT_EQ(second->default_value, nullptr);
  EXPECT_TRUE(second->is_variadic);

  ASSERT_NE(mixin->declarations, nullptr);
  ASSERT_EQ(mixin->declarations->child_count(), 1U);
  EXPECT_EQ(mixin->declarations->first_child()->get_kind(), NodeKind::MixinContentReference);
}
