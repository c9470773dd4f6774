/***
 * Name: test_parser_statements
 * Purpose: Statement shapes, line spans and soft keywords.
 */
#include <gtest/gtest.h>
#include "ast/Nodes.h"
#include "parser/ParseSource.h"
#include "pytgen/exceptions/parse_error.h"

using namespace pytgen;

template <typename T>
static const T& as(const ast::Node& n) { return static_cast<const T&>(n); }

TEST(ParserStatements, EmptyModule) {
  const auto mod = parse::ParseSource("", "empty.py");
  EXPECT_TRUE(mod->body.empty());
}

TEST(ParserStatements, DecoratedDefStartsAtDefLine) {
  const auto mod = parse::ParseSource("@a\n@b.c(1)\ndef f(x):\n    return x\n", "d.py");
  ASSERT_EQ(mod->body.size(), 1u);
  const auto& fn = as<ast::FunctionDef>(*mod->body[0]);
  EXPECT_EQ(fn.name, "f");
  EXPECT_EQ(fn.decorators.size(), 2u);
  EXPECT_EQ(fn.line, 3);
  EXPECT_EQ(fn.endLine, 4);
}

TEST(ParserStatements, EndLineCoversTrailingDocstring) {
  const auto mod = parse::ParseSource("class C:\n    \"\"\"Doc\n    more\n    \"\"\"\n", "c.py");
  const auto& cls = as<ast::ClassDef>(*mod->body[0]);
  EXPECT_EQ(cls.line, 1);
  EXPECT_EQ(cls.endLine, 4);
}

TEST(ParserStatements, ParameterKinds) {
  const auto mod = parse::ParseSource("def f(a, /, b=1, *args, c, d=2, **kw): pass\n", "p.py");
  const auto& fn = as<ast::FunctionDef>(*mod->body[0]);
  ASSERT_EQ(fn.params.size(), 6u);
  EXPECT_TRUE(fn.params[0].isPosOnly);
  EXPECT_NE(fn.params[1].defaultValue, nullptr);
  EXPECT_TRUE(fn.params[2].isVarArg);
  EXPECT_TRUE(fn.params[3].isKwOnly);
  EXPECT_TRUE(fn.params[4].isKwOnly);
  EXPECT_TRUE(fn.params[5].isKwVarArg);
}

TEST(ParserStatements, ElifNestsAsIf) {
  const auto mod = parse::ParseSource("if a:\n    x = 1\nelif b:\n    x = 2\nelse:\n    x = 3\n", "e.py");
  const auto& top = as<ast::IfStmt>(*mod->body[0]);
  ASSERT_EQ(top.elseBody.size(), 1u);
  const auto& nested = as<ast::IfStmt>(*top.elseBody[0]);
  EXPECT_EQ(nested.elseBody.size(), 1u);
}

TEST(ParserStatements, CompoundStatementsParse) {
  const char* src =
      "import os.path as p, sys\n"
      "from ..pkg import (a, b as c,)\n"
      "async def g():\n"
      "    async with open(x) as f, lock:\n"
      "        async for i in f:\n"
      "            await i\n"
      "try:\n"
      "    pass\n"
      "except* (ValueError, TypeError) as e:\n"
      "    raise RuntimeError() from e\n"
      "finally:\n"
      "    del a[0], b.c\n"
      "while True:\n"
      "    break\n"
      "else:\n"
      "    pass\n"
      "x: int = 1; y += 2; z = w = 3\n"
      "global q\n"
      "assert x, 'msg'\n"
      "lambda a, *b, **c: (yield)\n";
  const auto mod = parse::ParseSource(src, "c.py");
  ASSERT_EQ(mod->body.size(), 11u);
  const auto& imp = as<ast::Import>(*mod->body[0]);
  ASSERT_EQ(imp.names.size(), 2u);
  EXPECT_EQ(imp.names[0]->name, "os.path");
  EXPECT_EQ(imp.names[0]->asname, "p");
  const auto& from = as<ast::ImportFrom>(*mod->body[1]);
  EXPECT_EQ(from.level, 2);
  EXPECT_EQ(from.module, "pkg");
  EXPECT_EQ(from.names.size(), 2u);
  EXPECT_TRUE(as<ast::FunctionDef>(*mod->body[2]).isAsync);
  EXPECT_TRUE(as<ast::TryStmt>(*mod->body[3]).isStar);
}

TEST(ParserStatements, MatchIsSoftKeyword) {
  const char* src =
      "match = 3\n"
      "match command.split():\n"
      "    case [action]:\n"
      "        pass\n"
      "    case Point(x=0) | None if flag:\n"
      "        pass\n"
      "    case _:\n"
      "        pass\n";
  const auto mod = parse::ParseSource(src, "m.py");
  ASSERT_EQ(mod->body.size(), 2u);
  EXPECT_EQ(mod->body[0]->kind, ast::NodeKind::AssignStmt);
  const auto& m = as<ast::MatchStmt>(*mod->body[1]);
  EXPECT_EQ(m.cases.size(), 3u);
}

TEST(ParserStatements, TypeParameterLists) {
  const auto mod = parse::ParseSource(
      "def first[T: (int, str), *Ts, **P, U = int](x: T) -> T: pass\n"
      "class Box[T](Base):\n"
      "    pass\n", "tp.py");
  ASSERT_EQ(mod->body.size(), 2u);
  const auto& fn = as<ast::FunctionDef>(*mod->body[0]);
  ASSERT_EQ(fn.typeParams.size(), 4u);
  EXPECT_EQ(fn.typeParams[0].name, "T");
  ASSERT_TRUE(fn.typeParams[0].bound);
  EXPECT_EQ(fn.typeParams[0].bound->kind, ast::NodeKind::TupleLiteral);
  EXPECT_EQ(fn.typeParams[1].kind, ast::TypeParam::Kind::TypeVarTuple);
  EXPECT_EQ(fn.typeParams[2].kind, ast::TypeParam::Kind::ParamSpec);
  ASSERT_TRUE(fn.typeParams[3].defaultValue);
  ASSERT_EQ(fn.params.size(), 1u);
  const auto& cls = as<ast::ClassDef>(*mod->body[1]);
  ASSERT_EQ(cls.typeParams.size(), 1u);
  EXPECT_EQ(cls.bases.size(), 1u);

  EXPECT_THROW((void)parse::ParseSource("def f[](): pass\n", "tp.py"), exceptions::ParseError);
  EXPECT_THROW((void)parse::ParseSource("class C[*Ts: int]: pass\n", "tp.py"), exceptions::ParseError);
}

TEST(ParserStatements, TypeIsSoftKeyword) {
  const auto mod = parse::ParseSource(
      "type = 3\n"
      "type(x)\n"
      "type Point = tuple[float, float]\n"
      "type Pair[T] = tuple[T, T]; y = 1\n", "ty.py");
  ASSERT_EQ(mod->body.size(), 5u);
  EXPECT_EQ(mod->body[0]->kind, ast::NodeKind::AssignStmt);
  EXPECT_EQ(mod->body[1]->kind, ast::NodeKind::ExprStmt);
  const auto& alias = as<ast::TypeAliasStmt>(*mod->body[2]);
  EXPECT_EQ(as<ast::Name>(*alias.name).id, "Point");
  EXPECT_EQ(alias.value->kind, ast::NodeKind::Subscript);
  EXPECT_EQ(as<ast::TypeAliasStmt>(*mod->body[3]).typeParams.size(), 1u);
  EXPECT_EQ(mod->body[4]->kind, ast::NodeKind::AssignStmt);
}

TEST(ParserStatements, ClassBasesAndKeywords) {
  const auto mod = parse::ParseSource("class A(B, mod.C, metaclass=M):\n    x = 1\n", "k.py");
  const auto& cls = as<ast::ClassDef>(*mod->body[0]);
  EXPECT_EQ(cls.bases.size(), 2u);
  ASSERT_EQ(cls.keywords.size(), 1u);
  EXPECT_EQ(cls.keywords[0].name, "metaclass");
}

TEST(ParserStatements, NodesCarryIdentifier) {
  const auto mod = parse::ParseSource("x = 1\n", "ident.py");
  EXPECT_EQ(mod->body[0]->file, "ident.py");
  EXPECT_EQ(mod->body[0]->line, 1);
}
