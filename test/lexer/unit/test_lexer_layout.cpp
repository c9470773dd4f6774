/***
 * Name: test_lexer_layout
 * Purpose: Indentation, line joining and end-of-input tokens.
 */
#include <gtest/gtest.h>
#include <vector>
#include "lexer/Lexer.h"
#include "pytgen/exceptions/parse_error.h"

using namespace pytgen;
using TK = lex::TokenKind;

static std::vector<TK> kindsOf(const std::string& src) {
  lex::Lexer L; L.pushString(src, "layout.py");
  std::vector<TK> out;
  for (const auto& t : L.tokens()) out.push_back(t.kind);
  return out;
}

TEST(LexerLayout, IndentDedentAroundBlock) {
  const std::vector<TK> expected{TK::Def, TK::Ident, TK::LParen, TK::Ident, TK::RParen, TK::Colon, TK::Newline,
                                 TK::Indent, TK::Return, TK::Ident, TK::Newline, TK::Dedent, TK::End};
  EXPECT_EQ(kindsOf("def f(x):\n    return x\n"), expected);
}

TEST(LexerLayout, BracketsJoinLines) {
  const std::vector<TK> expected{TK::Ident, TK::Equal, TK::LParen, TK::Int, TK::Comma, TK::Int, TK::RParen,
                                 TK::Newline, TK::End};
  EXPECT_EQ(kindsOf("x = (1,\n     2)\n"), expected);
}

TEST(LexerLayout, BackslashContinuationAndComments) {
  const std::vector<TK> expected{TK::Ident, TK::Equal, TK::Int, TK::Plus, TK::Int, TK::Newline, TK::End};
  EXPECT_EQ(kindsOf("# leading comment\n\nx = 1 + \\\n    2  # trailing\n"), expected);
}

TEST(LexerLayout, MissingFinalNewlineIsSynthesized) {
  const std::vector<TK> expected{TK::Pass, TK::Newline, TK::End};
  EXPECT_EQ(kindsOf("pass"), expected);
}

TEST(LexerLayout, EmptySourceIsJustEnd) {
  EXPECT_EQ(kindsOf(""), std::vector<TK>{TK::End});
}

TEST(LexerLayout, MultiLineStringRecordsEndLine) {
  lex::Lexer L; L.pushString("s = \"\"\"a\nb\nc\"\"\"\n", "s.py");
  const auto toks = L.tokens();
  ASSERT_GE(toks.size(), 3u);
  EXPECT_EQ(toks[2].kind, TK::String);
  EXPECT_EQ(toks[2].line, 1);
  EXPECT_EQ(toks[2].endLine, 3);
}

TEST(LexerLayout, ColumnsAreOneBased) {
  lex::Lexer L; L.pushString("ab = cd\n", "c.py");
  const auto toks = L.tokens();
  EXPECT_EQ(toks[0].col, 1);
  EXPECT_EQ(toks[1].col, 4);
  EXPECT_EQ(toks[2].col, 6);
}

TEST(LexerLayout, BadDedentThrows) {
  lex::Lexer L; L.pushString("if x:\n    a\n  b\n", "d.py");
  try {
    (void)L.tokens();
    FAIL() << "expected ParseError";
  } catch (const exceptions::ParseError& e) {
    EXPECT_EQ(e.detail(), "unindent does not match any outer indentation level");
    EXPECT_EQ(e.line(), 3);
  }
}

TEST(LexerLayout, UnclosedBracketReportsOpener) {
  lex::Lexer L; L.pushString("x = (1,\n", "u.py");
  try {
    (void)L.tokens();
    FAIL() << "expected ParseError";
  } catch (const exceptions::ParseError& e) {
    EXPECT_EQ(e.detail(), "'(' was never closed");
    EXPECT_EQ(e.line(), 1);
    EXPECT_EQ(e.column(), 5);
  }
}

TEST(LexerLayout, UnmatchedCloserThrows) {
  lex::Lexer L; L.pushString("x = 1)\n", "m.py");
  EXPECT_THROW((void)L.tokens(), exceptions::ParseError);
}
