#include <gtest/gtest.h>

#include <vector>

#include "scssls/basic/casting.hpp"
#include "scssls/cst/cst_context.hpp"
#include "scssls/cst/node.hpp"

using scssls::FileId;
using scssls::SourceRange;
using namespace scssls::cst;

namespace
{

SourceRange range(uint32_t b, uint32_t e) { return SourceRange(FileId{0}, b, e); }

}  // namespace

TEST(CstNode, AddChildGrowsParentRange)
{
  CstContext ctx;
  auto * parent = ctx.create<Node>(NodeKind::Generic, range(4, 4));
  auto * a = ctx.create<Node>(NodeKind::Generic, range(4, 6));
  auto * b = ctx.create<Node>(NodeKind::Generic, range(7, 10));

  EXPECT_TRUE(parent->add_child(a));
  EXPECT_TRUE(parent->add_child(b));
  EXPECT_FALSE(parent->add_child(nullptr));

  EXPECT_EQ(parent->get_range(), range(4, 10));
  EXPECT_EQ(parent->child_count(), 2U);
  EXPECT_EQ(parent->first_child(), a);
  EXPECT_EQ(parent->last_child(), b);
  EXPECT_EQ(a->next_sibling(), b);
  EXPECT_EQ(b->prev_sibling(), a);
  EXPECT_EQ(b->parent(), parent);
  EXPECT_EQ(parent->child_at(1), b);
  EXPECT_EQ(parent->child_at(2), nullptr);
}

TEST(CstNode, InvalidRangeAdoptsFirstChildRange)
{
  CstContext ctx;
  auto * list = ctx.create<Node>(NodeKind::NodeList, SourceRange{});
  EXPECT_FALSE(list->get_range().is_valid());
  list->add_child(ctx.create<Node>(NodeKind::Generic, range(3, 5)));
  EXPECT_EQ(list->get_range(), range(3, 5));
}

TEST(CstNode, AddChildReparents)
{
  CstContext ctx;
  auto * first = ctx.create<Node>(NodeKind::Generic, range(0, 10));
  auto * second = ctx.create<Node>(NodeKind::Generic, range(0, 10));
  auto * child = ctx.create<Node>(NodeKind::Generic, range(1, 2));

  first->add_child(child);
  second->add_child(child);

  EXPECT_EQ(first->child_count(), 0U);
  EXPECT_EQ(first->first_child(), nullptr);
  EXPECT_EQ(child->parent(), second);
  EXPECT_TRUE(child->is_descendant_of(second));
  EXPECT_FALSE(child->is_descendant_of(first));
}

TEST(CstNode, TypedSlotsJoinChildList)
{
  CstContext ctx;
  auto * decl = ctx.create<VariableDeclaration>(range(0, 0));
  auto * var = ctx.create<Node>(NodeKind::Variable, range(0, 2));
  auto * value = ctx.create<Node>(NodeKind::Expression, range(4, 7));

  EXPECT_TRUE(decl->set_variable(var));
  EXPECT_TRUE(decl->set_value(value));
  EXPECT_FALSE(decl->set_value(nullptr));

  EXPECT_EQ(decl->variable, var);
  EXPECT_EQ(decl->value, value);
  EXPECT_EQ(decl->child_count(), 2U);
  EXPECT_EQ(decl->get_range(), range(0, 7));
}

TEST(CstNode, SlotKeepsExistingDescendantInPlace)
{
  CstContext ctx;
  auto * member = ctx.create<ModuleMember>(range(0, 0));
  auto * wrapper = ctx.create<Node>(NodeKind::Generic, range(0, 3));
  auto * ident = ctx.create<Identifier>(range(0, 3));
  wrapper->add_child(ident);
  member->add_child(wrapper);

  EXPECT_TRUE(member->set_identifier(ident));
  EXPECT_EQ(ident->parent(), wrapper);
  EXPECT_EQ(member->child_count(), 1U);
}

TEST(CstNode, Casting)
{
  CstContext ctx;
  Node * ruleset = ctx.create<Ruleset>(range(0, 5));
  Node * generic = ctx.create<Node>(NodeKind::Generic, range(0, 5));

  EXPECT_TRUE(scssls::isa<Ruleset>(ruleset));
  EXPECT_TRUE(scssls::isa<BodyDeclaration>(ruleset));
  EXPECT_FALSE(scssls::isa<BodyDeclaration>(generic));
  EXPECT_EQ(scssls::dyn_cast<MixinDeclaration>(ruleset), nullptr);
  EXPECT_NE(scssls::dyn_cast<Ruleset>(ruleset), nullptr);
  EXPECT_FALSE(scssls::isa<Ruleset>(static_cast<Node *>(nullptr)));
}

TEST(CstNode, BodyKinds)
{
  EXPECT_TRUE(is_body_kind(NodeKind::MixinDeclaration));
  EXPECT_TRUE(is_body_kind(NodeKind::ElseClause));
  EXPECT_FALSE(is_body_kind(NodeKind::Declaration));
  EXPECT_FALSE(is_body_kind(NodeKind::MixinReference));
}

TEST(CstNode, WalkIsPreOrderAndCanSkipChildren)
{
  CstContext ctx;
  auto * root = ctx.create<Node>(NodeKind::Stylesheet, range(0, 10));
  auto * skip = ctx.create<Node>(NodeKind::Ruleset, range(0, 5));
  auto * hidden = ctx.create<Node>(NodeKind::Declaration, range(1, 4));
  auto * last = ctx.create<Node>(NodeKind::Generic, range(6, 10));
  skip->add_child(hidden);
  root->add_child(skip);
  root->add_child(last);

  std::vector<NodeKind> visited;
  root->walk([&](const Node * n) {
    visited.push_back(n->get_kind());
    return n->get_kind() != NodeKind::Ruleset;
  });
  EXPECT_EQ(
    visited, (std::vector<NodeKind>{NodeKind::Stylesheet, NodeKind::Ruleset, NodeKind::Generic}));
}

TEST(CstNode, IssuesChainInOrder)
{
  CstContext ctx;
  auto * parent = ctx.create<Node>(NodeKind::Generic, range(0, 10));
  auto * child = ctx.create<Node>(NodeKind::Generic, range(0, 2));
  parent->add_child(child);

  EXPECT_FALSE(parent->is_erroneous(true));
  child->add_issue(ctx.create_issue(ParseError::ColonExpected, range(2, 3)));
  child->add_issue(ctx.create_issue(ParseError::SemiColonExpected, range(5, 6)));

  EXPECT_FALSE(parent->is_erroneous());
  EXPECT_TRUE(parent->is_erroneous(true));
  ASSERT_NE(child->issues(), nullptr);
  EXPECT_EQ(child->issues()->error, ParseError::ColonExpected);
  ASSERT_NE(child->issues()->next, nullptr);
  EXPECT_EQ(child->issues()->next->error, ParseError::SemiColonExpected);
  EXPECT_EQ(child->issues()->next->next, nullptr);
}

TEST(CstNode, ErrorTables)
{
  EXPECT_EQ(code(ParseError::IdentifierExpected), "E001");
  EXPECT_EQ(message(ParseError::ColonExpected), "colon expected");
  EXPECT_EQ(code(ParseError::InExpected), "E030");
  EXPECT_EQ(to_string(NodeKind::VariableDeclaration), "VariableDeclaration");
  EXPECT_EQ(to_string(ReferenceKind::Module), "module");
}
