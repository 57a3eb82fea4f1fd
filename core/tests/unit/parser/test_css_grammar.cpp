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
// Selectors
// ============================================================================

TEST(ParserCss, SelectorListAndCombinators)
{
  auto unit = parse("ul > li + li ~ p, #main .x, * { a: b; }");
  EXPECT_TRUE(unit.diags.empty()) << ::testing::PrintToString(diagnostic_codes(unit.diags));

  const auto * rule = dyn_cast<cst::Ruleset>(unit.stylesheet->first_child());
  ASSERT_NE(rule, nullptr);
  ASSERT_NE(rule->selectors, nullptr);
  ASSERT_EQ(rule->selectors->child_count(), 3U);
  EXPECT_EQ(unit.slice(rule->selectors->child_at(0)), "ul > li + li ~ p");

  EXPECT_NE(find_first(rule, NodeKind::SelectorCombinatorParent), nullptr);
  EXPECT_NE(find_first(rule, NodeKind::SelectorCombinatorSibling), nullptr);
  EXPECT_NE(find_first(rule, NodeKind::SelectorCombinatorAllSiblings), nullptr);
  EXPECT_NE(find_first(rule, NodeKind::IdentifierSelector), nullptr);

  const auto * element = find_first(rule, NodeKind::ElementNameSelector);
  ASSERT_NE(element, nullptr);
  EXPECT_EQ(cast<cst::Identifier>(element->first_child())->reference, ReferenceKind::Selector);
}

TEST(ParserCss, PseudoSelectors)
{
  auto unit = parse("a:not(.b, .c)::before, li:nth-child(2n + 1) { d: e; }");
  EXPECT_TRUE(unit.diags.empty()) << ::testing::PrintToString(diagnostic_codes(unit.diags));

  const auto pseudos = find_all(unit.stylesheet, NodeKind::PseudoSelector);
  ASSERT_EQ(pseudos.size(), 3U);
  EXPECT_EQ(unit.slice(pseudos[0]), ":not(.b, .c)");
  EXPECT_EQ(unit.slice(pseudos[1]), "::before");
  EXPECT_EQ(unit.slice(pseudos[2]), ":nth-child(2n + 1)");
}

TEST(ParserCss, AttributeSelector)
{
  auto unit = parse("input[type=\"text\" i], a[href^='http'] { b: c; }");
  EXPECT_TRUE(unit.diags.empty()) << ::testing::PrintToString(diagnostic_codes(unit.diags));

  const auto attributes = find_all(unit.stylesheet, NodeKind::AttributeSelector);
  ASSERT_EQ(attributes.size(), 2U);
  EXPECT_EQ(unit.slice(attributes[0]), "[type=\"text\" i]");
  EXPECT_EQ(unit.slice(attributes[1]), "[href^='http']");
}

TEST(ParserCss, UnclosedAttributeSelector)
{
  auto unit = parse("a[href { b: c; }");
  ASSERT_FALSE(unit.diags.empty());
  EXPECT_EQ(diagnostic_codes(unit.diags).front(), "E011");
}

// ============================================================================
// @media
// ============================================================================

TEST(ParserCss, MediaQueryWithFeature)
{
  auto unit = parse("@media screen and (min-width: 100px), print { a { b: c; } }");
  EXPECT_TRUE(unit.diags.empty()) << ::testing::PrintToString(diagnostic_codes(unit.diags));

  const auto * media = dyn_cast<cst::Media>(unit.stylesheet->first_child());
  ASSERT_NE(media, nullptr);

  const auto * list = media->find_child(NodeKind::MediaQueryList);
  ASSERT_NE(list, nullptr);
  EXPECT_EQ(list->child_count(), 2U);

  const auto * feature = find_first(list, NodeKind::MediaFeature);
  ASSERT_NE(feature, nullptr);
  EXPECT_EQ(unit.slice(feature), "min-width: 100px");

  ASSERT_NE(media->declarations, nullptr);
  EXPECT_EQ(media->declarations->first_child()->get_kind(), NodeKind::Ruleset);
}

TEST(ParserCss, MediaRangeSyntaxAndNestedDeclarations)
{
  auto unit = parse(".a { @media (400px <= width <= 700px) { color: red; } }");
  EXPECT_TRUE(unit.diags.empty()) << ::testing::PrintToString(diagnostic_codes(unit.diags));

  const auto * feature = find_first(unit.stylesheet, NodeKind::MediaFeature);
  ASSERT_NE(feature, nullptr);
  EXPECT_EQ(unit.slice(feature), "400px <= width <= 700px");

  const auto * media = find_first(unit.stylesheet, NodeKind::Media);
  ASSERT_NE(media, nullptr);
  EXPECT_NE(find_first(media, NodeKind::Declaration), nullptr);
}

TEST(ParserCss, MediaWithInterpolatedQuery)
{
  auto unit = parse("@media #{$query} { a { b: c; } }");
  EXPECT_TRUE(unit.diags.empty()) << ::testing::PrintToString(diagnostic_codes(unit.diags));
  EXPECT_NE(find_first(unit.stylesheet, NodeKind::Interpolation), nullptr);
}

TEST(ParserCss, MediaWithoutQuery)
{
  auto unit = parse("@media { a { b: c; } }");
  ASSERT_FALSE(unit.diags.empty());
  EXPECT_EQ(diagnostic_codes(unit.diags).front(), "E024");
}

// ============================================================================
// @keyframes, @font-face
// ============================================================================

TEST(ParserCss, Keyframes)
{
  auto unit = parse("@keyframes spin { from { opacity: 0; } 50%, 75% { opacity: 1; } to { opacity: 0; } }");
  EXPECT_TRUE(unit.diags.empty()) << ::testing::PrintToString(diagnostic_codes(unit.diags));

  const auto * keyframe = dyn_cast<cst::Keyframe>(unit.stylesheet->first_child());
  ASSERT_NE(keyframe, nullptr);
  EXPECT_EQ(unit.slice(keyframe->keyword), "@keyframes");
  EXPECT_EQ(unit.slice(keyframe->identifier), "spin");
  EXPECT_EQ(cast<cst::Identifier>(keyframe->identifier)->reference, ReferenceKind::Keyframe);

  const auto selectors = find_all(keyframe, NodeKind::KeyframeSelector);
  ASSERT_EQ(selectors.size(), 3U);
  EXPECT_EQ(unit.slice(cast<cst::KeyframeSelector>(selectors[1])->declarations), "{ opacity: 1; }");
}

TEST(ParserCss, VendorKeyframesWithControlFlow)
{
  auto unit = parse("@-webkit-keyframes k { @for $i from 0 to 2 { #{$i * 50%} { a: b; } } }");
  EXPECT_TRUE(unit.diags.empty()) << ::testing::PrintToString(diagnostic_codes(unit.diags));
  EXPECT_NE(find_first(unit.stylesheet, NodeKind::ForStatement), nullptr);
}

TEST(ParserCss, FontFace)
{
  auto unit = parse("@font-face { font-family: X; src: url(x.woff2); }");
  EXPECT_TRUE(unit.diags.empty()) << ::testing::PrintToString(diagnostic_codes(unit.diags));

  const auto * font_face = dyn_cast<cst::FontFace>(unit.stylesheet->first_child());
  ASSERT_NE(font_face, nullptr);
  ASSERT_NE(font_face->declarations, nullptr);
  EXPECT_EQ(font_face->declarations->child_count(), 2U);
}

// ============================================================================
// @supports, @layer, @property
// ============================================================================

TEST(ParserCss, SupportsConjunction)
{
  auto unit = parse("@supports (display: grid) and (gap: 1px) { a { b: c; } }");
  EXPECT_TRUE(unit.diags.empty()) << ::testing::PrintToString(diagnostic_codes(unit.diags));

  const auto * supports = dyn_cast<cst::Supports>(unit.stylesheet->first_child());
  ASSERT_NE(supports, nullptr);
  const auto * condition = supports->find_child(NodeKind::SupportsCondition);
  ASSERT_NE(condition, nullptr);
  EXPECT_EQ(condition->child_count(), 2U);
  EXPECT_EQ(find_all(condition, NodeKind::Declaration).size(), 2U);
}

TEST(ParserCss, SupportsNegationAndSelectorFunction)
{
  auto unit = parse("@supports not selector(:has(a)) { b { c: d; } }");
  EXPECT_TRUE(unit.diags.empty()) << ::testing::PrintToString(diagnostic_codes(unit.diags));
  EXPECT_NE(find_first(unit.stylesheet, NodeKind::Supports), nullptr);
}

TEST(ParserCss, LayerStatementAndBlock)
{
  auto unit = parse("@layer reset, base;\n@layer base.theme { a { b: c; } }\n@layer { d { e: f; } }");
  EXPECT_TRUE(unit.diags.empty()) << ::testing::PrintToString(diagnostic_codes(unit.diags));

  ASSERT_EQ(unit.stylesheet->child_count(), 3U);
  const auto * statement = cast<cst::Layer>(unit.stylesheet->child_at(0));
  ASSERT_NE(statement->names, nullptr);
  EXPECT_EQ(statement->names->child_count(), 2U);
  EXPECT_EQ(statement->declarations, nullptr);

  const auto * block = cast<cst::Layer>(unit.stylesheet->child_at(1));
  EXPECT_EQ(unit.slice(block->names), "base.theme");
  EXPECT_NE(block->declarations, nullptr);

  const auto * anonymous = cast<cst::Layer>(unit.stylesheet->child_at(2));
  EXPECT_EQ(anonymous->names, nullptr);
  EXPECT_NE(anonymous->declarations, nullptr);
}

TEST(ParserCss, LayerListCannotHaveBody)
{
  auto unit = parse("@layer a, b { }");
  ASSERT_FALSE(unit.diags.empty());
  EXPECT_EQ(diagnostic_codes(unit.diags).front(), "E006");
}

TEST(ParserCss, PropertyAtRule)
{
  auto unit = parse("@property --angle { syntax: '<angle>'; inherits: false; initial-value: 0deg; }");
  EXPECT_TRUE(unit.diags.empty()) << ::testing::PrintToString(diagnostic_codes(unit.diags));

  const auto * rule = dyn_cast<cst::PropertyAtRule>(unit.stylesheet->first_child());
  ASSERT_NE(rule, nullptr);
  EXPECT_EQ(unit.slice(rule->name), "--angle");
  EXPECT_TRUE(cast<cst::Identifier>(rule->name)->is_custom_property);
  EXPECT_EQ(rule->declarations->child_count(), 3U);
}

// ============================================================================
// Unknown at-rules, custom properties
// ============================================================================

TEST(ParserCss, UnknownAtRules)
{
  auto unit = parse("@charset \"utf-8\";\n@page :first { margin: 1in; }\n@custom-thing a (b) [c];");
  EXPECT_TRUE(unit.diags.empty()) << ::testing::PrintToString(diagnostic_codes(unit.diags));

  const auto rules = find_all(unit.stylesheet, NodeKind::UnknownAtRule);
  ASSERT_EQ(rules.size(), 3U);
  EXPECT_EQ(unit.slice(rules[0]), "@charset \"utf-8\"");
  EXPECT_EQ(unit.slice(rules[1]), "@page :first { margin: 1in; }");
  EXPECT_EQ(unit.slice(rules[2]->first_child()), "@custom-thing");
}

TEST(ParserCss, UnknownAtRuleUnbalanced)
{
  auto unit = parse("@foo (bar");
  ASSERT_EQ(unit.diags.size(), 1U);
  EXPECT_EQ(unit.diags.all()[0].code, "E008");
}

TEST(ParserCss, CustomPropertyKeepsRawValue)
{
  auto unit = parse(":root { --gap: 4px; --raw: [a] {b}; --empty: ; }");

  const auto decls = find_all(unit.stylesheet, NodeKind::Declaration);
  ASSERT_EQ(decls.size(), 3U);

  const auto * gap = cast<cst::Declaration>(decls[0]);
  EXPECT_EQ(gap->value->get_kind(), NodeKind::Expression);
  EXPECT_TRUE(cast<cst::Identifier>(cast<cst::Property>(gap->property)->identifier)->is_custom_property);

  const auto * raw = cast<cst::Declaration>(decls[1]);
  ASSERT_NE(raw->value, nullptr);
  EXPECT_EQ(raw->value->get_kind(), NodeKind::CustomPropertyValue);
  EXPECT_EQ(unit.slice(raw->value), "[a] {b}");

  ASSERT_EQ(unit.diags.size(), 1U);
  EXPECT_EQ(unit.diags.all()[0].code, "E021");
}
