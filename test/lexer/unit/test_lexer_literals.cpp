/***
 * Name: test_lexer_literals
 * Purpose: Numbers, strings with prefixes, soft keywords and Unicode identifiers.
 */
#include <gtest/gtest.h>
#include "lexer/Lexer.h"
#include "pytgen/exceptions/parse_error.h"

using namespace pytgen;
using TK = lex::TokenKind;

static lex::Token firstToken(const std::string& src) {
  lex::Lexer L; L.pushString(src, "lit.py");
  return L.tokens().front();
}

TEST(LexerLiterals, NumberForms) {
  EXPECT_EQ(firstToken("0x_FF\n").kind, TK::Int);
  EXPECT_EQ(firstToken("1_000\n").text, "1_000");
  EXPECT_EQ(firstToken("1.5e-3\n").kind, TK::Float);
  EXPECT_EQ(firstToken(".5\n").kind, TK::Float);
  EXPECT_EQ(firstToken("3j\n").kind, TK::Imag);
  EXPECT_EQ(firstToken("0b101\n").kind, TK::Int);
}

TEST(LexerLiterals, UnderscoreAfterRadixPrefix) {
  EXPECT_EQ(firstToken("0x_FF\n").text, "0x_FF");
  EXPECT_EQ(firstToken("0b_1\n").text, "0b_1");
  EXPECT_EQ(firstToken("0o_7\n").text, "0o_7");
  lex::Lexer L; L.pushString("0x__F\n", "lit.py");
  EXPECT_THROW((void)L.tokens(), exceptions::ParseError);
}

TEST(LexerLiterals, LeadingZeroDecimals) {
  EXPECT_EQ(firstToken("0\n").kind, TK::Int);
  EXPECT_EQ(firstToken("00\n").text, "00");
  EXPECT_EQ(firstToken("0_0\n").text, "0_0");
  EXPECT_EQ(firstToken("09.5\n").kind, TK::Float);
  EXPECT_EQ(firstToken("09j\n").kind, TK::Imag);
  lex::Lexer L; L.pushString("x = 09\n", "lit.py");
  try {
    (void)L.tokens();
    FAIL() << "expected ParseError";
  } catch (const exceptions::ParseError& e) {
    EXPECT_NE(e.detail().find("leading zeros in decimal integer literals"), std::string::npos) << e.detail();
  }
}

TEST(LexerLiterals, StringPrefixesKeepText) {
  EXPECT_EQ(firstToken("rb'\\d'\n").kind, TK::Bytes);
  EXPECT_EQ(firstToken("f'{x}'\n").kind, TK::String);
  EXPECT_EQ(firstToken("u'x'\n").text, "u'x'");
}

TEST(LexerLiterals, KeywordLiterals) {
  EXPECT_EQ(firstToken("True\n").kind, TK::BoolLit);
  EXPECT_EQ(firstToken("None\n").kind, TK::NoneLit);
  EXPECT_EQ(firstToken("...\n").kind, TK::Ellipsis);
}

TEST(LexerLiterals, SoftKeywordsAreIdentifiers) {
  EXPECT_EQ(firstToken("match = 1\n").kind, TK::Ident);
  EXPECT_EQ(firstToken("case\n").kind, TK::Ident);
  EXPECT_EQ(firstToken("type\n").kind, TK::Ident);
}

TEST(LexerLiterals, UnicodeIdentifier) {
  const auto tok = firstToken("\xCF\x80 = 3\n");  // pi
  EXPECT_EQ(tok.kind, TK::Ident);
  EXPECT_EQ(tok.text, "\xCF\x80");
}

TEST(LexerLiterals, UnterminatedStringThrows) {
  lex::Lexer L; L.pushString("s = 'abc\n", "s.py");
  try {
    (void)L.tokens();
    FAIL() << "expected ParseError";
  } catch (const exceptions::ParseError& e) {
    EXPECT_EQ(e.detail(), "unterminated string literal (detected at line 1)");
  }
}

TEST(LexerLiterals, InvalidCharacterThrows) {
  lex::Lexer L; L.pushString("x = 1 $ 2\n", "c.py");
  EXPECT_THROW((void)L.tokens(), exceptions::ParseError);
}
