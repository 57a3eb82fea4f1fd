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
using scssls::test_support::parse;

namespace cst = scssls::cst;

// ============================================================================
// @use
// ============================================================================

TEST(ParserModules, UseWildcard)
{
  auto unit = parse("@use 'theme' as *;");
  EXPECT_TRUE(unit.diags.empty()) << ::testing::PrintToString(diagnostic_codes(unit.diags));

  const auto * use = dyn_cast<cst::Use>(unit.stylesheet->first_child());
  ASSERT_NE(use, nullptr);
  EXPECT_TRUE(use->is_wildcard);
  EXPECT_EQ(use->identifier, nullptr);
}

TEST(ParserModules, UseWithConfiguration)
{
  auto unit = parse("@use 'config' with ($primary: blue, $gap: 4px !default);");
  EXPECT_TRUE(unit.diags.empty()) << ::testing::PrintToString(diagnostic_codes(unit.diags));

  const auto * use = dyn_cast<cst::Use>(unit.stylesheet->first_child());
  ASSERT_NE(use, nullptr);
  ASSERT_NE(use->parameters, nullptr);
  ASSERT_EQ(use->parameters->child_count(), 2U);

  const auto * primary = cast<cst::ModuleConfiguration>(use->parameters->child_at(0));
  EXPECT_EQ(unit.slice(primary->identifier), "$primary");
  EXPECT_EQ(unit.slice(primary->value), "blue");
  EXPECT_FALSE(primary->is_default);
  EXPECT_TRUE(cast<cst::ModuleConfiguration>(use->parameters->child_at(1))->is_default);
}

TEST(ParserModules, UseAsThenWith)
{
  auto unit = parse("@use 'lib' as l with ($a: 1);");
  EXPECT_TRUE(unit.diags.empty()) << ::testing::PrintToString(diagnostic_codes(unit.diags));

  const auto * use = dyn_cast<cst::Use>(unit.stylesheet->first_child());
  ASSERT_NE(use, nullptr);
  EXPECT_EQ(unit.slice(use->identifier), "l");
  ASSERT_NE(use->parameters, nullptr);
  EXPECT_EQ(use->parameters->child_count(), 1U);
}

TEST(ParserModules, UseAtEndOfInputNeedsNoSemicolon)
{
  auto unit = parse("@use 'a'");
  EXPECT_TRUE(unit.diags.empty()) << ::testing::PrintToString(diagnostic_codes(unit.diags));
  EXPECT_NE(dyn_cast<cst::Use>(unit.stylesheet->first_child()), nullptr);
}

TEST(ParserModules, UseErrors)
{
  EXPECT_EQ(diagnostic_codes(parse("@use foo;").diags).front(), "E012");
  EXPECT_EQ(diagnostic_codes(parse("@use 'a' as;").diags).front(), "E019");
  EXPECT_EQ(diagnostic_codes(parse("@use 'a' into b;").diags).front(), "E015");
  EXPECT_EQ(diagnostic_codes(parse("@use 'a' with $x;").diags).front(), "E007");
  EXPECT_EQ(diagnostic_codes(parse("@use 'a' with ($x: 1;").diags).front(), "E008");
  EXPECT_EQ(diagnostic_codes(parse("@use 'a' as b c;").diags).front(), "E006");
}

// ============================================================================
// @forward
// ============================================================================

TEST(ParserModules, ForwardPrefixAndHide)
{
  auto unit = parse("@forward 'src/list' as list-* hide list-reset, $horizontal-gap;");
  EXPECT_TRUE(unit.diags.empty()) << ::testing::PrintToString(diagnostic_codes(unit.diags));

  const auto * fwd = dyn_cast<cst::Forward>(unit.stylesheet->first_child());
  ASSERT_NE(fwd, nullptr);
  EXPECT_EQ(unit.slice(fwd->path), "'src/list'");
  ASSERT_NE(fwd->identifier, nullptr);
  EXPECT_EQ(unit.slice(fwd->identifier), "list-");
  EXPECT_EQ(cast<cst::Identifier>(fwd->identifier)->reference, ReferenceKind::Forward);

  const auto * visibility = dyn_cast<cst::ForwardVisibility>(fwd->visibility);
  ASSERT_NE(visibility, nullptr);
  EXPECT_EQ(unit.slice(visibility->identifier), "hide");
  EXPECT_EQ(unit.slice(visibility), "hide list-reset, $horizontal-gap");

  const auto names = find_all(visibility, NodeKind::Identifier);
  ASSERT_EQ(names.size(), 2U);
  EXPECT_EQ(cast<cst::Identifier>(names[1])->reference, ReferenceKind::ForwardVisibility);
  EXPECT_EQ(find_all(visibility, NodeKind::Variable).size(), 1U);
}

TEST(ParserModules, ForwardShowWithConfiguration)
{
  auto unit = parse("@forward 'a' show b;\n@forward 'c' with ($d: 1 !default);");
  EXPECT_TRUE(unit.diags.empty()) << ::testing::PrintToString(diagnostic_codes(unit.diags));

  ASSERT_EQ(unit.stylesheet->child_count(), 2U);
  const auto * show = cast<cst::Forward>(unit.stylesheet->child_at(0));
  ASSERT_NE(show->visibility, nullptr);
  EXPECT_EQ(unit.slice(show->visibility), "show b");

  const auto * with = cast<cst::Forward>(unit.stylesheet->child_at(1));
  ASSERT_NE(with->parameters, nullptr);
  EXPECT_TRUE(cast<cst::ModuleConfiguration>(with->parameters->first_child())->is_default);
}

TEST(ParserModules, ForwardPrefixNeedsGluedWildcard)
{
  auto unit = parse("@forward 'a' as b *;");
  ASSERT_FALSE(unit.diags.empty());
  EXPECT_EQ(diagnostic_codes(unit.diags).front(), "E018");
}

TEST(ParserModules, ForwardVisibilityWithoutNames)
{
  auto unit = parse("@forward 'a' hide;");
  ASSERT_EQ(unit.diags.size(), 1U);
  EXPECT_EQ(unit.diags.all()[0].code, "E020");

  const auto * fwd = dyn_cast<cst::Forward>(unit.stylesheet->first_child());
  ASSERT_NE(fwd, nullptr);
  EXPECT_EQ(fwd->visibility, nullptr);
  EXPECT_EQ(unit.slice(fwd), "@forward 'a' hide");
}

// ============================================================================
// @import
// ============================================================================

TEST(ParserModules, ImportList)
{
  auto unit = parse("@import 'a', \"b\", url(c.css);");
  EXPECT_TRUE(unit.diags.empty()) << ::testing::PrintToString(diagnostic_codes(unit.diags));

  const cst::Node * import = unit.stylesheet->first_child();
  ASSERT_EQ(import->get_kind(), NodeKind::Import);
  EXPECT_EQ(import->child_count(), 3U);
  EXPECT_EQ(import->child_at(2)->get_kind(), NodeKind::UriLiteral);
}

TEST(ParserModules, ImportWithLayerSupportsAndMedia)
{
  auto unit = parse("@import url(theme.css) layer(base.theme) supports(display: grid) screen;");
  EXPECT_TRUE(unit.diags.empty()) << ::testing::PrintToString(diagnostic_codes(unit.diags));

  const cst::Node * import = unit.stylesheet->first_child();
  ASSERT_EQ(import->get_kind(), NodeKind::Import);
  EXPECT_NE(import->find_child(NodeKind::LayerName), nullptr);
  EXPECT_NE(import->find_child(NodeKind::Declaration), nullptr);
  EXPECT_NE(import->find_child(NodeKind::MediaQueryList), nullptr);
}

TEST(ParserModules, ImportRequiresTarget)
{
  auto unit = parse("@import ;");
  ASSERT_EQ(unit.diags.size(), 1U);
  EXPECT_EQ(unit.diags.all()[0].code, "E013");
}
