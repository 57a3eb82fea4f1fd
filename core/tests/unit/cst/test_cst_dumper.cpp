#include <gtest/gtest.h>

#include <string>

#include "scssls/cst/cst_dumper.hpp"
#include "scssls/test_support/parse_helpers.hpp"

using scssls::cst::dump_to_string;
using scssls::test_support::parse;

TEST(CstDumper, VariableDeclarationTree)
{
  auto unit = parse("$x: 1px;");
  EXPECT_EQ(
    dump_to_string(unit.stylesheet, unit.source()),
    "Stylesheet [0, 8)\n"
    "`-VariableDeclaration [0, 7)\n"
    "  |-Variable [0, 2) '$x'\n"
    "  `-Expression [4, 7)\n"
    "    `-BinaryExpression [4, 7)\n"
    "      `-Term [4, 7)\n"
    "        `-NumericValue [4, 7) '1px'\n");
}

TEST(CstDumper, IssuesPrintBelowOwningNode)
{
  auto unit = parse("$x 1;");
  const std::string text = dump_to_string(unit.stylesheet, unit.source());
  EXPECT_NE(
    text.find("`-VariableDeclaration [0, 2)\n  | !! error E005: colon expected at 3\n"),
    std::string::npos)
    << text;
}

TEST(CstDumper, PrintsFlagsAndReferences)
{
  auto unit = parse("@use 'a' as *;\n@include m;");
  const std::string text = dump_to_string(unit.stylesheet, unit.source());
  EXPECT_NE(text.find("Use [0, 14) as *"), std::string::npos) << text;
  EXPECT_NE(text.find("Identifier [24, 25) 'm' <mixin>"), std::string::npos) << text;
}

TEST(CstDumper, NullNode)
{
  EXPECT_EQ(dump_to_string(nullptr, ""), "<null>\n");
}
