/***
 * Name: test_expr_renderer
 * Purpose: Rendering of annotation-style expressions back to source text.
 */
#include <gtest/gtest.h>
#include <string>
#include "ast/ExprRenderer.h"
#include "ast/ExprStmt.h"
#include "parser/ParseSource.h"

using namespace pytgen;

static std::string rendered(const std::string& expr) {
  const auto mod = parse::ParseSource(expr + "\n", "r.py");
  return ast::RenderExpr(*static_cast<const ast::ExprStmt&>(*mod->body.at(0)).value);
}

TEST(ExprRenderer, TypeAnnotations) {
  EXPECT_EQ(rendered("dict[str,int]"), "dict[str, int]");
  EXPECT_EQ(rendered("Callable[[int],None]"), "Callable[[int], None]");
  EXPECT_EQ(rendered("Optional[ List[str] ]"), "Optional[List[str]]");
  EXPECT_EQ(rendered("typing.Tuple[int, ...]"), "typing.Tuple[int, ...]");
  EXPECT_EQ(rendered("int|None"), "int | None");
  EXPECT_EQ(rendered("tuple[()]"), "tuple[()]");
}

TEST(ExprRenderer, StringLiteralsUseRepr) {
  EXPECT_EQ(rendered("\"Vector\""), "'Vector'");
  EXPECT_EQ(rendered("\"it's\""), "\"it's\"");
  EXPECT_EQ(rendered("b'\\x00a'"), "b'\\x00a'");
}

TEST(ExprRenderer, NumbersAsWritten) {
  EXPECT_EQ(rendered("0x_FF"), "0x_FF");
  EXPECT_EQ(rendered("1.50"), "1.50");
}

TEST(ExprRenderer, MinimalParentheses) {
  EXPECT_EQ(rendered("(a + b) * c"), "(a + b) * c");
  EXPECT_EQ(rendered("a + (b * c)"), "a + b * c");
  EXPECT_EQ(rendered("2 ** 3 ** 4"), "2 ** 3 ** 4");
  EXPECT_EQ(rendered("(2 ** 3) ** 4"), "(2 ** 3) ** 4");
  EXPECT_EQ(rendered("not (a and b)"), "not (a and b)");
  EXPECT_EQ(rendered("-(x)"), "-x");
}

TEST(ExprRenderer, CallsAndDisplays) {
  EXPECT_EQ(rendered("f(1, *a, k=2, **kw)"), "f(1, *a, k=2, **kw)");
  EXPECT_EQ(rendered("{'a': 1, **rest}"), "{'a': 1, **rest}");
  EXPECT_EQ(rendered("[x for x in y if x]"), "[x for x in y if x]");
  EXPECT_EQ(rendered("a[1:2, ::3]"), "a[1:2, ::3]");
  EXPECT_EQ(rendered("lambda x, *, y=1: x"), "lambda x, *, y=1: x");
  EXPECT_EQ(rendered("a if b else c"), "a if b else c");
  EXPECT_EQ(rendered("x not in y"), "x not in y");
}
