/***
 * Name: test_parser_string_literals
 * Purpose: Escape decoding, implicit concatenation and f-string fields.
 */
#include <gtest/gtest.h>
#include "ast/Nodes.h"
#include "parser/ParseSource.h"
#include "pytgen/exceptions/parse_error.h"

using namespace pytgen;

static const ast::Expr& exprOf(const ast::Module& mod) {
  return *static_cast<const ast::ExprStmt&>(*mod.body.at(0)).value;
}

TEST(ParserStrings, EscapesDecode) {
  const auto mod = parse::ParseSource("'a\\tb\\x41\\u00e9\\N{BULLET}\\q'\n", "s.py");
  const auto& s = static_cast<const ast::StringLiteral&>(exprOf(*mod));
  EXPECT_EQ(s.value, "a\tbA\xC3\xA9\xE2\x80\xA2\\q");
}

TEST(ParserStrings, RawKeepsBackslashes) {
  const auto mod = parse::ParseSource("r'\\d+'\n", "s.py");
  EXPECT_EQ(static_cast<const ast::StringLiteral&>(exprOf(*mod)).value, "\\d+");
}

TEST(ParserStrings, AdjacentLiteralsConcatenate) {
  const auto mod = parse::ParseSource("('abc'\n 'def')\n", "s.py");
  EXPECT_EQ(static_cast<const ast::StringLiteral&>(exprOf(*mod)).value, "abcdef");
}

TEST(ParserStrings, BytesAndTextDoNotMix) {
  EXPECT_THROW((void)parse::ParseSource("b'a' 'b'\n", "s.py"), exceptions::ParseError);
}

TEST(ParserStrings, FStringFieldsParsed) {
  const auto mod = parse::ParseSource("f'{a + 1!r:>{width}} {{x}} {b=}'\n", "f.py");
  const auto& fs = static_cast<const ast::FStringLiteral&>(exprOf(*mod));
  ASSERT_EQ(fs.values.size(), 3u);
  EXPECT_EQ(fs.values[0]->kind, ast::NodeKind::BinaryExpr);
  EXPECT_EQ(fs.values[1]->kind, ast::NodeKind::Name);
  EXPECT_EQ(fs.values[2]->kind, ast::NodeKind::Name);
}

TEST(ParserStrings, FStringErrors) {
  EXPECT_THROW((void)parse::ParseSource("f'{}'\n", "f.py"), exceptions::ParseError);
  EXPECT_THROW((void)parse::ParseSource("f'a}'\n", "f.py"), exceptions::ParseError);
  EXPECT_THROW((void)parse::ParseSource("f'{a'\n", "f.py"), exceptions::ParseError);
}
