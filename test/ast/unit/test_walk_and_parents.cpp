/***
 * Name: test_walk_and_parents
 * Purpose: Breadth-first walk order, parent lookup and geometry.
 */
#include <gtest/gtest.h>
#include "ast/Children.h"
#include "ast/ClassDef.h"
#include "ast/FunctionDef.h"
#include "ast/GeometrySummary.h"
#include "ast/ParentMap.h"
#include "ast/TypeAliasStmt.h"
#include "parser/ParseSource.h"

using namespace pytgen;

TEST(AstWalk, RootFirstThenLevels) {
  const auto mod = parse::ParseSource("def a():\n    def b():\n        pass\nclass C:\n    pass\n", "w.py");
  const auto nodes = ast::WalkBreadthFirst(*mod);
  ASSERT_GE(nodes.size(), 4u);
  EXPECT_EQ(nodes[0], mod.get());
  EXPECT_EQ(nodes[1]->kind, ast::NodeKind::FunctionDef);
  EXPECT_EQ(nodes[2]->kind, ast::NodeKind::ClassDef);
  EXPECT_EQ(nodes[3]->kind, ast::NodeKind::FunctionDef);
}

TEST(AstWalk, ParentMapAnswersEnclosingNode) {
  const auto mod = parse::ParseSource("class C:\n    def m(self):\n        def inner():\n            pass\n", "p.py");
  const ast::ParentMap parents(*mod);
  const auto& cls = static_cast<const ast::ClassDef&>(*mod->body[0]);
  const auto& method = static_cast<const ast::FunctionDef&>(*cls.body[0]);
  const auto& inner = *method.body[0];
  EXPECT_EQ(parents.parentOf(*mod), nullptr);
  EXPECT_EQ(parents.parentOf(cls), mod.get());
  EXPECT_EQ(parents.parentOf(method), &cls);
  EXPECT_EQ(parents.parentOf(inner), &method);
  EXPECT_EQ(parents.size(), ast::WalkBreadthFirst(*mod).size() - 1);
}

TEST(AstWalk, TypeParameterBoundsAreChildren) {
  const auto mod = parse::ParseSource("def f[T: Base = Default](x): pass\ntype Alias[U] = list[U]\n", "t.py");
  const auto& fn = static_cast<const ast::FunctionDef&>(*mod->body[0]);
  const auto children = ast::ChildNodes(fn);
  ASSERT_GE(children.size(), 2u);
  EXPECT_EQ(children[children.size() - 2], fn.typeParams[0].bound.get());
  EXPECT_EQ(children.back(), fn.typeParams[0].defaultValue.get());

  const auto& alias = static_cast<const ast::TypeAliasStmt&>(*mod->body[1]);
  const ast::ParentMap parents(*mod);
  EXPECT_EQ(parents.parentOf(*alias.name), &alias);
  EXPECT_EQ(parents.parentOf(*alias.value), &alias);
}

TEST(AstWalk, GeometryGrowsWithNesting) {
  const auto shallow = parse::ParseSource("def main() -> int:\n  return 1 + 2\n", "g.py");
  const auto deep = parse::ParseSource("def main() -> int:\n  return 1 + (2 * (3 + 4))\n", "g.py");
  const auto gS = ast::ComputeGeometry(*shallow);
  const auto gD = ast::ComputeGeometry(*deep);
  EXPECT_GT(gS.nodes, 0u);
  EXPECT_GT(gD.nodes, gS.nodes);
  EXPECT_GT(gD.maxDepth, gS.maxDepth);
}
