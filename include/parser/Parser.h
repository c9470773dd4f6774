/***
 * Name: pytgen::parse::Parser
 * Purpose: Build an owned AST for a Python 3 module from a token stream.
 * Inputs:
 *   - Token stream from Lexer (buffered eagerly on first use)
 * Outputs:
 *   - Module AST; every node carries file/line/col and the last line it covers.
 * Theory of Operation:
 *   Recursive descent over the full statement grammar and a precedence chain
 *   for expressions:
 *     expr      := lambda | or_test ['if' or_test 'else' expr]
 *     or_test   := and_test {'or' and_test}
 *     and_test  := not_test {'and' not_test}
 *     not_test  := 'not' not_test | comparison
 *     comparison:= bitor {cmp_op bitor}
 *     bitor > bitxor > bitand > shift > arith > term > factor > power > await primary
 *   'match' and 'case' are soft keywords recognized by a line lookahead.
 *   The first syntax error throws exceptions::ParseError at the offending token;
 *   there is no recovery and no partial tree.
 */
#pragma once

#include "ast/Nodes.h"
#include "lexer/Lexer.h"
#include <cstddef>
#include <memory>
#include <string>
#include <vector>

namespace pytgen::parse {

class Parser {
 public:
  explicit Parser(lex::ITokenStream& stream) : ts_(stream) {}
  std::unique_ptr<ast::Module> parseModule();

  // Parse the whole stream as one expression (f-string replacement fields).
  std::unique_ptr<ast::Expr> parseStandaloneExpr();

 private:
  using StmtList = std::vector<std::unique_ptr<ast::Stmt>>;
  using ExprList = std::vector<std::unique_ptr<ast::Expr>>;

  lex::ITokenStream& ts_;
  std::vector<lex::Token> tokens_{};
  size_t pos_{0};
  bool initialized_{false};
  int lastLine_{1}; // endLine of the last consumed non-layout token

  void initBuffer();
  const lex::Token& peek() const;
  const lex::Token& peekNext() const;
  const lex::Token& peekAt(size_t k) const;
  lex::Token get();
  bool match(lex::TokenKind tokenKind);
  lex::Token expect(lex::TokenKind tokenKind, const char* msg);
  [[noreturn]] static void fail(const lex::Token& at, const std::string& msg);

  void finish(ast::Node& node) const { node.endLine = lastLine_; }

  // statements
  void parseStatementInto(StmtList& out);
  void parseSimpleStatementsInto(StmtList& out);
  std::unique_ptr<ast::Stmt> parseSimpleStatement();
  std::unique_ptr<ast::Stmt> parseExprOrAssignStmt();
  void parseSuiteInto(StmtList& out);
  std::vector<std::unique_ptr<ast::Expr>> parseDecorators();
  std::unique_ptr<ast::Stmt> parseDecorated();
  std::unique_ptr<ast::FunctionDef> parseFunction(ExprList decorators);
  std::unique_ptr<ast::ClassDef> parseClass(ExprList decorators);
  void parseParamList(std::vector<ast::Param>& outParams, lex::TokenKind closer, bool allowAnnotations);
  void parseTypeParams(std::vector<ast::TypeParam>& out);
  std::unique_ptr<ast::Stmt> parseTypeAliasStmt();
  std::unique_ptr<ast::Stmt> parseIfStmt();
  std::unique_ptr<ast::Stmt> parseWhileStmt();
  std::unique_ptr<ast::Stmt> parseForStmt();
  std::unique_ptr<ast::Stmt> parseTryStmt();
  std::unique_ptr<ast::Stmt> parseWithStmt();
  std::unique_ptr<ast::WithItem> parseWithItem();
  std::unique_ptr<ast::Stmt> parseImportStmt();
  std::unique_ptr<ast::Stmt> parseRaiseStmt();
  std::unique_ptr<ast::Stmt> parseGlobalStmt();
  std::unique_ptr<ast::Stmt> parseNonlocalStmt();
  std::unique_ptr<ast::Stmt> parseAssertStmt();
  std::unique_ptr<ast::Stmt> parseDelStmt();
  std::unique_ptr<ast::Stmt> parseReturnStmt();
  std::unique_ptr<ast::Stmt> parseMatchStmt();
  std::unique_ptr<ast::MatchCase> parseMatchCase();
  std::unique_ptr<ast::Expr> parsePattern();
  std::string parseDottedName();

  // soft keywords 'match' and 'type' at statement start
  bool looksLikeMatchStmt() const;
  bool looksLikeTypeAlias() const;
  bool parenthesizedWithItems() const;

  // expressions
  std::unique_ptr<ast::Expr> parseStarExpressions();
  std::unique_ptr<ast::Expr> parseStarOrNamed();
  std::unique_ptr<ast::Expr> parseNamedExpr();
  std::unique_ptr<ast::Expr> parseExpr();
  std::unique_ptr<ast::Expr> parseLambda();
  std::unique_ptr<ast::Expr> parseLogicalOr();
  std::unique_ptr<ast::Expr> parseLogicalAnd();
  std::unique_ptr<ast::Expr> parseLogicalNot();
  std::unique_ptr<ast::Expr> parseComparison();
  std::unique_ptr<ast::Expr> parseBitwiseOr();
  std::unique_ptr<ast::Expr> parseBitwiseXor();
  std::unique_ptr<ast::Expr> parseBitwiseAnd();
  std::unique_ptr<ast::Expr> parseShift();
  std::unique_ptr<ast::Expr> parseAdditive();
  std::unique_ptr<ast::Expr> parseMultiplicative();
  std::unique_ptr<ast::Expr> parseUnary();
  std::unique_ptr<ast::Expr> parsePower();
  std::unique_ptr<ast::Expr> parsePostfix(std::unique_ptr<ast::Expr> base);
  std::unique_ptr<ast::Expr> parseAtom();
  std::unique_ptr<ast::Expr> parseYieldExpr();
  std::unique_ptr<ast::Expr> parseStarTargets();
  std::unique_ptr<ast::Expr> parseSlices();
  std::unique_ptr<ast::Expr> parseSliceItem();
  void parseCallArgs(ExprList& args, std::vector<ast::KeywordArg>& keywords);
  std::unique_ptr<ast::Expr> parseTupleOrParen(const lex::Token& openTok);
  std::unique_ptr<ast::Expr> parseListLiteral(const lex::Token& openTok);
  std::unique_ptr<ast::Expr> parseDictOrSetLiteral(const lex::Token& openTok);
  std::vector<ast::ComprehensionFor> parseComprehensionFors();
  bool atComprehensionFor() const;
  static bool startsExpression(lex::TokenKind kind);

  // string literals (ParserStrings.cpp)
  std::unique_ptr<ast::Expr> parseStringAtom(const lex::Token& first);
  static std::string decodeStringToken(const lex::Token& tok, bool& isBytes, bool& isFString);
  static void parseFStringFields(const lex::Token& tok, ExprList& out);
};

} // namespace pytgen::parse
