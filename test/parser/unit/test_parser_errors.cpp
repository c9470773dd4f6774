/***
 * Name: test_parser_errors
 * Purpose: Malformed input raises ParseError with location and a Python-style message.
 */
#include <gtest/gtest.h>
#include <string>
#include "parser/ParseSource.h"
#include "pytgen/exceptions/parse_error.h"

using namespace pytgen;

static exceptions::ParseError errorOf(const std::string& src) {
  try {
    (void)parse::ParseSource(src, "bad.py");
  } catch (const exceptions::ParseError& e) {
    return e;
  }
  ADD_FAILURE() << "no ParseError for: " << src;
  return exceptions::ParseError("", 0, 0, "");
}

TEST(ParserErrors, MissingColon) {
  const auto e = errorOf("def test_missing_colon()\n    pass\n");
  EXPECT_EQ(e.detail(), "expected ':'");
  EXPECT_EQ(e.line(), 1);
  EXPECT_EQ(e.file(), "bad.py");
}

TEST(ParserErrors, DanglingOperator) {
  const auto e = errorOf("def test_x():\n    assert 1 +\n");
  EXPECT_EQ(e.line(), 2);
  EXPECT_EQ(e.detail(), "invalid syntax");
}

TEST(ParserErrors, MissingIndentedBlock) {
  EXPECT_EQ(errorOf("if x:\npass\n").detail(), "expected an indented block");
}

TEST(ParserErrors, UnexpectedIndent) {
  EXPECT_EQ(errorOf("x = 1\n    y = 2\n").detail(), "unexpected indent");
}

TEST(ParserErrors, AssignmentTargets) {
  EXPECT_EQ(errorOf("f() = 1\n").detail(), "cannot assign to function call");
  EXPECT_EQ(errorOf("1 = x\n").detail(), "cannot assign to literal");
  EXPECT_EQ(errorOf("a + 1 += 2\n").detail(), "'expression' is an illegal expression for augmented assignment");
}

TEST(ParserErrors, ParameterOrder) {
  EXPECT_EQ(errorOf("def f(a=1, b): pass\n").detail(),
            "parameter without a default follows parameter with a default");
  EXPECT_EQ(errorOf("def f(*): pass\n").detail(), "named arguments must follow bare *");
}

TEST(ParserErrors, CallArgumentOrder) {
  EXPECT_EQ(errorOf("f(a=1, b)\n").detail(), "positional argument follows keyword argument");
  EXPECT_EQ(errorOf("f(x for x in y, 1)\n").detail(), "Generator expression must be parenthesized");
}

TEST(ParserErrors, TryNeedsHandler) {
  EXPECT_EQ(errorOf("try:\n    pass\nx = 1\n").detail(), "expected 'except' or 'finally' block");
}

TEST(ParserErrors, WhatIncludesLocation) {
  const auto e = errorOf("x = (1,\n");
  EXPECT_EQ(std::string(e.what()), "bad.py:1:5: '(' was never closed");
}
