/***
 * Name: pytgen::parse::Parser (impl)
 * Purpose: Strict recursive-descent parser for Python 3 modules.
 */
#include "parser/Parser.h"
#include "parser/ParserSupport.h"
#include "pytgen/exceptions/parse_error.h"
#include <cstddef>
#include <memory>
#include <string>
#include <utility>
#include <vector>

namespace pytgen::parse {

using TK = lex::TokenKind;
using detail::failAt;
using detail::makeAt;
using detail::stampFrom;

namespace {

bool isLayout(const TK k) { return k == TK::Newline || k == TK::Indent || k == TK::Dedent || k == TK::End; }

bool augOpFor(const TK k, ast::BinaryOperator& op) {
  switch (k) {
    case TK::PlusEqual: op = ast::BinaryOperator::Add; return true;
    case TK::MinusEqual: op = ast::BinaryOperator::Sub; return true;
    case TK::StarEqual: op = ast::BinaryOperator::Mul; return true;
    case TK::AtEqual: op = ast::BinaryOperator::MatMul; return true;
    case TK::SlashEqual: op = ast::BinaryOperator::Div; return true;
    case TK::SlashSlashEqual: op = ast::BinaryOperator::FloorDiv; return true;
    case TK::PercentEqual: op = ast::BinaryOperator::Mod; return true;
    case TK::StarStarEqual: op = ast::BinaryOperator::Pow; return true;
    case TK::LShiftEqual: op = ast::BinaryOperator::LShift; return true;
    case TK::RShiftEqual: op = ast::BinaryOperator::RShift; return true;
    case TK::AmpEqual: op = ast::BinaryOperator::BitAnd; return true;
    case TK::PipeEqual: op = ast::BinaryOperator::BitOr; return true;
    case TK::CaretEqual: op = ast::BinaryOperator::BitXor; return true;
    default: return false;
  }
}

// Python's wording for an expression used where a target is required.
std::string describe(const ast::Expr& e) {
  using NK = ast::NodeKind;
  switch (e.kind) {
    case NK::Call: return "function call";
    case NK::Attribute: return "attribute";
    case NK::Subscript: return "subscript";
    case NK::Starred: return "starred";
    case NK::Name: return "name";
    case NK::TupleLiteral: return "tuple";
    case NK::ListLiteral: return "list";
    case NK::NoneLiteral: return "None";
    case NK::BoolLiteral: return static_cast<const ast::BoolLiteral&>(e).value ? "True" : "False";
    case NK::EllipsisLiteral: return "ellipsis";
    case NK::IntLiteral: case NK::FloatLiteral: case NK::ImagLiteral:
    case NK::StringLiteral: case NK::BytesLiteral: return "literal";
    case NK::FStringLiteral: return "f-string expression";
    case NK::Compare: return "comparison";
    case NK::LambdaExpr: return "lambda";
    case NK::IfExpr: return "conditional expression";
    case NK::NamedExpr: return "named expression";
    case NK::AwaitExpr: return "await expression";
    case NK::YieldExpr: return "yield expression";
    case NK::ListComp: return "list comprehension";
    case NK::SetComp: return "set comprehension";
    case NK::DictComp: return "dict comprehension";
    case NK::GeneratorExpr: return "generator expression";
    case NK::DictLiteral: return "dict literal";
    case NK::SetLiteral: return "set display";
    default: return "expression";
  }
}

[[noreturn]] void failAtNode(const ast::Node& n, const std::string& msg) {
  throw exceptions::ParseError(n.file, n.line, n.col, msg);
}

// Assignment, for/with/comprehension and del targets.
void checkTarget(const ast::Expr& e, const char* verb) {
  using NK = ast::NodeKind;
  switch (e.kind) {
    case NK::Name:
    case NK::Attribute:
    case NK::Subscript:
      return;
    case NK::Starred:
      if (std::string(verb) == "delete") failAtNode(e, "cannot delete starred");
      checkTarget(*static_cast<const ast::Starred&>(e).value, verb);
      return;
    case NK::TupleLiteral:
      for (const auto& el : static_cast<const ast::TupleLiteral&>(e).elements) checkTarget(*el, verb);
      return;
    case NK::ListLiteral:
      for (const auto& el : static_cast<const ast::ListLiteral&>(e).elements) checkTarget(*el, verb);
      return;
    default:
      failAtNode(e, std::string("cannot ") + verb + " " + describe(e));
  }
}

bool isSingleTarget(const ast::Expr& e) {
  return e.kind == ast::NodeKind::Name || e.kind == ast::NodeKind::Attribute || e.kind == ast::NodeKind::Subscript;
}

} // namespace

void Parser::initBuffer() {
  if (initialized_) return;
  if (auto* lx = dynamic_cast<lex::Lexer*>(&ts_)) {
    tokens_ = lx->tokens();
  } else {
    tokens_.clear();
    for (;;) {
      auto t = ts_.next();
      tokens_.push_back(t);
      if (t.kind == TK::End) break;
    }
  }
  if (tokens_.empty() || tokens_.back().kind != TK::End) tokens_.push_back(lex::Token{});
  pos_ = 0;
  initialized_ = true;
}

const lex::Token& Parser::peek() const { return peekAt(0); }
const lex::Token& Parser::peekNext() const { return peekAt(1); }
const lex::Token& Parser::peekAt(const size_t k) const {
  const size_t idx = pos_ + k;
  return tokens_[idx < tokens_.size() ? idx : (tokens_.size() - 1)];
}

lex::Token Parser::get() {
  const lex::Token& tok = peek();
  if (tok.kind != TK::End) ++pos_;
  if (!isLayout(tok.kind)) lastLine_ = tok.endLine;
  return tok;
}

bool Parser::match(const TK tokenKind) {
  if (peek().kind == tokenKind) { (void)get(); return true; }
  return false;
}

lex::Token Parser::expect(const TK tokenKind, const char* msg) {
  if (peek().kind != tokenKind) fail(peek(), msg);
  return get();
}

void Parser::fail(const lex::Token& at, const std::string& msg) { failAt(at, msg); }

std::unique_ptr<ast::Module> Parser::parseModule() {
  initBuffer();
  auto mod = std::make_unique<ast::Module>();
  mod->file = tokens_.front().file;
  mod->line = 1;
  mod->col = 1;
  while (peek().kind != TK::End) {
    if (match(TK::Newline)) continue;
    parseStatementInto(mod->body);
  }
  finish(*mod);
  return mod;
}

std::unique_ptr<ast::Expr> Parser::parseStandaloneExpr() {
  initBuffer();
  auto e = (peek().kind == TK::Yield) ? parseYieldExpr() : parseStarExpressions();
  while (match(TK::Newline)) {}
  if (peek().kind != TK::End) fail(peek(), "invalid syntax");
  return e;
}

// ---------------------------------------------------------------- statements

void Parser::parseStatementInto(StmtList& out) {
  const lex::Token& tok = peek();
  switch (tok.kind) {
    case TK::Indent: fail(tok, "unexpected indent");
    case TK::Dedent: fail(tok, "unindent does not match any outer indentation level");
    case TK::At: out.push_back(parseDecorated()); return;
    case TK::Def: out.push_back(parseFunction({})); return;
    case TK::Class: out.push_back(parseClass({})); return;
    case TK::If: out.push_back(parseIfStmt()); return;
    case TK::While: out.push_back(parseWhileStmt()); return;
    case TK::For: out.push_back(parseForStmt()); return;
    case TK::Try: out.push_back(parseTryStmt()); return;
    case TK::With: out.push_back(parseWithStmt()); return;
    case TK::Async: {
      const TK nk = peekNext().kind;
      if (nk == TK::Def) { out.push_back(parseFunction({})); return; }
      if (nk == TK::For) { out.push_back(parseForStmt()); return; }
      if (nk == TK::With) { out.push_back(parseWithStmt()); return; }
      fail(peekNext(), "invalid syntax");
    }
    case TK::Ident:
      if (tok.text == "match" && looksLikeMatchStmt()) { out.push_back(parseMatchStmt()); return; }
      break;
    default:
      break;
  }
  parseSimpleStatementsInto(out);
}

void Parser::parseSimpleStatementsInto(StmtList& out) {
  for (;;) {
    out.push_back(parseSimpleStatement());
    if (!match(TK::Semicolon)) break;
    if (peek().kind == TK::Newline || peek().kind == TK::End) break;
  }
  if (peek().kind == TK::End) return;
  if (!match(TK::Newline)) fail(peek(), "invalid syntax");
}

std::unique_ptr<ast::Stmt> Parser::parseSimpleStatement() {
  const lex::Token tok = peek();
  std::unique_ptr<ast::Stmt> stmt;
  switch (tok.kind) {
    case TK::Pass: (void)get(); stmt = makeAt<ast::PassStmt>(tok); break;
    case TK::Break: (void)get(); stmt = makeAt<ast::BreakStmt>(tok); break;
    case TK::Continue: (void)get(); stmt = makeAt<ast::ContinueStmt>(tok); break;
    case TK::Return: return parseReturnStmt();
    case TK::Raise: return parseRaiseStmt();
    case TK::Global: return parseGlobalStmt();
    case TK::Nonlocal: return parseNonlocalStmt();
    case TK::Assert: return parseAssertStmt();
    case TK::Del: return parseDelStmt();
    case TK::Import:
    case TK::From: return parseImportStmt();
    case TK::Ident:
      if (tok.text == "type" && looksLikeTypeAlias()) return parseTypeAliasStmt();
      return parseExprOrAssignStmt();
    default: return parseExprOrAssignStmt();
  }
  finish(*stmt);
  return stmt;
}

std::unique_ptr<ast::Stmt> Parser::parseExprOrAssignStmt() {
  const lex::Token startTok = peek();
  auto rhs = [this]() { return peek().kind == TK::Yield ? parseYieldExpr() : parseStarExpressions(); };
  auto first = rhs();
  const TK k = peek().kind;
  if (k == TK::Colon) {
    (void)get();
    if (first->kind == ast::NodeKind::TupleLiteral) failAtNode(*first, "only single target (not tuple) can be annotated");
    if (first->kind == ast::NodeKind::ListLiteral) failAtNode(*first, "only single target (not list) can be annotated");
    if (!isSingleTarget(*first)) failAtNode(*first, "illegal target for annotation");
    auto stmt = makeAt<ast::AnnAssignStmt>(startTok);
    stmt->target = std::move(first);
    stmt->annotation = parseExpr();
    if (match(TK::Equal)) stmt->value = rhs();
    finish(*stmt);
    return stmt;
  }
  ast::BinaryOperator op{};
  if (augOpFor(k, op)) {
    (void)get();
    if (!isSingleTarget(*first)) failAtNode(*first, "'" + describe(*first) + "' is an illegal expression for augmented assignment");
    auto stmt = std::make_unique<ast::AugAssignStmt>(std::move(first), op, rhs());
    stampFrom(*stmt, startTok);
    finish(*stmt);
    return stmt;
  }
  if (k == TK::Equal) {
    auto stmt = makeAt<ast::AssignStmt>(startTok);
    auto cur = std::move(first);
    while (match(TK::Equal)) {
      checkTarget(*cur, "assign to");
      stmt->targets.push_back(std::move(cur));
      cur = rhs();
    }
    stmt->value = std::move(cur);
    finish(*stmt);
    return stmt;
  }
  if (first->kind == ast::NodeKind::Starred) failAtNode(*first, "can't use starred expression here");
  auto stmt = std::make_unique<ast::ExprStmt>(std::move(first));
  stampFrom(*stmt, startTok);
  finish(*stmt);
  return stmt;
}

void Parser::parseSuiteInto(StmtList& out) {
  (void)expect(TK::Colon, "expected ':'");
  if (match(TK::Newline)) {
    if (peek().kind != TK::Indent) fail(peek(), "expected an indented block");
    (void)get();
    while (peek().kind != TK::Dedent && peek().kind != TK::End) parseStatementInto(out);
    (void)match(TK::Dedent);
    return;
  }
  parseSimpleStatementsInto(out);
}

Parser::ExprList Parser::parseDecorators() {
  ExprList decos;
  while (match(TK::At)) {
    decos.push_back(parseNamedExpr());
    if (!match(TK::Newline)) fail(peek(), "invalid syntax");
  }
  return decos;
}

std::unique_ptr<ast::Stmt> Parser::parseDecorated() {
  auto decos = parseDecorators();
  if (peek().kind == TK::Class) return parseClass(std::move(decos));
  if (peek().kind == TK::Def || (peek().kind == TK::Async && peekNext().kind == TK::Def)) {
    return parseFunction(std::move(decos));
  }
  fail(peek(), "invalid syntax");
}

std::unique_ptr<ast::FunctionDef> Parser::parseFunction(ExprList decorators) {
  const lex::Token startTok = peek();
  const bool isAsync = match(TK::Async);
  (void)expect(TK::Def, "invalid syntax");
  if (peek().kind != TK::Ident) fail(peek(), "invalid syntax");
  auto fn = makeAt<ast::FunctionDef>(startTok, get().text);
  fn->isAsync = isAsync;
  fn->decorators = std::move(decorators);
  if (peek().kind == TK::LBracket) parseTypeParams(fn->typeParams);
  (void)expect(TK::LParen, "expected '('");
  parseParamList(fn->params, TK::RParen, true);
  (void)expect(TK::RParen, "invalid syntax");
  if (match(TK::Arrow)) fn->returns = parseExpr();
  parseSuiteInto(fn->body);
  finish(*fn);
  return fn;
}

std::unique_ptr<ast::ClassDef> Parser::parseClass(ExprList decorators) {
  const lex::Token startTok = get(); // 'class'
  if (peek().kind != TK::Ident) fail(peek(), "invalid syntax");
  auto cls = makeAt<ast::ClassDef>(startTok, get().text);
  cls->decorators = std::move(decorators);
  if (peek().kind == TK::LBracket) parseTypeParams(cls->typeParams);
  if (match(TK::LParen)) {
    parseCallArgs(cls->bases, cls->keywords);
    (void)expect(TK::RParen, "invalid syntax");
  }
  parseSuiteInto(cls->body);
  finish(*cls);
  return cls;
}

// '[' T, T: bound, *Ts, **P, T = default ']'
void Parser::parseTypeParams(std::vector<ast::TypeParam>& out) {
  const lex::Token openTok = get(); // '['
  if (peek().kind == TK::RBracket) fail(openTok, "Type parameter list cannot be empty");
  while (peek().kind != TK::RBracket) {
    ast::TypeParam param;
    if (match(TK::Star)) param.kind = ast::TypeParam::Kind::TypeVarTuple;
    else if (match(TK::StarStar)) param.kind = ast::TypeParam::Kind::ParamSpec;
    if (peek().kind != TK::Ident) fail(peek(), "invalid syntax");
    param.name = get().text;
    if (peek().kind == TK::Colon) {
      if (param.kind == ast::TypeParam::Kind::TypeVarTuple) fail(peek(), "cannot use bound with TypeVarTuple");
      if (param.kind == ast::TypeParam::Kind::ParamSpec) fail(peek(), "cannot use bound with ParamSpec");
      (void)get();
      param.bound = parseExpr();
    }
    if (match(TK::Equal)) {
      param.defaultValue = param.kind == ast::TypeParam::Kind::TypeVarTuple ? parseStarOrNamed() : parseExpr();
    }
    out.push_back(std::move(param));
    if (!match(TK::Comma)) break;
  }
  (void)expect(TK::RBracket, "invalid syntax");
}

void Parser::parseParamList(std::vector<ast::Param>& outParams, const TK closer, const bool allowAnnotations) {
  bool kwOnly = false;
  bool seenDefault = false;
  bool seenSlash = false;
  bool seenKwVar = false;
  auto paramName = [this]() {
    if (peek().kind != TK::Ident) fail(peek(), "invalid syntax");
    return get().text;
  };
  auto annotation = [&]() -> std::unique_ptr<ast::Expr> {
    if (!allowAnnotations || !match(TK::Colon)) return nullptr;
    return parseExpr();
  };
  while (peek().kind != closer) {
    const lex::Token tok = peek();
    if (seenKwVar) fail(tok, "arguments cannot follow var-keyword argument");
    if (match(TK::Slash)) {
      if (seenSlash) fail(tok, "/ may appear only once");
      if (kwOnly) fail(tok, "/ must be ahead of *");
      if (outParams.empty()) fail(tok, "at least one argument must precede /");
      seenSlash = true;
      for (auto& p : outParams) p.isPosOnly = true;
    } else if (match(TK::Star)) {
      if (kwOnly) fail(tok, "* argument may appear only once");
      kwOnly = true;
      if (peek().kind == TK::Comma || peek().kind == closer) {
        // bare '*' must be followed by a keyword-only parameter
        if (peek().kind == closer || peekNext().kind != TK::Ident) fail(tok, "named arguments must follow bare *");
      } else {
        ast::Param p;
        p.name = paramName();
        p.isVarArg = true;
        p.annotation = annotation();
        if (peek().kind == TK::Equal) fail(peek(), "var-positional argument cannot have default value");
        outParams.push_back(std::move(p));
      }
    } else if (match(TK::StarStar)) {
      ast::Param p;
      p.name = paramName();
      p.isKwVarArg = true;
      p.annotation = annotation();
      if (peek().kind == TK::Equal) fail(peek(), "var-keyword argument cannot have default value");
      seenKwVar = true;
      outParams.push_back(std::move(p));
    } else {
      ast::Param p;
      p.name = paramName();
      p.isKwOnly = kwOnly;
      p.annotation = annotation();
      if (match(TK::Equal)) {
        p.defaultValue = parseExpr();
        if (!kwOnly) seenDefault = true;
      } else if (seenDefault && !kwOnly) {
        fail(tok, "parameter without a default follows parameter with a default");
      }
      outParams.push_back(std::move(p));
    }
    if (!match(TK::Comma)) break;
  }
}

std::unique_ptr<ast::Stmt> Parser::parseIfStmt() {
  const lex::Token tok = get(); // 'if' or 'elif'
  auto node = std::make_unique<ast::IfStmt>(parseNamedExpr());
  stampFrom(*node, tok);
  parseSuiteInto(node->thenBody);
  if (peek().kind == TK::Elif) {
    node->elseBody.push_back(parseIfStmt());
  } else if (match(TK::Else)) {
    parseSuiteInto(node->elseBody);
  }
  finish(*node);
  return node;
}

std::unique_ptr<ast::Stmt> Parser::parseWhileStmt() {
  const lex::Token tok = get();
  auto node = std::make_unique<ast::WhileStmt>(parseNamedExpr());
  stampFrom(*node, tok);
  parseSuiteInto(node->thenBody);
  if (match(TK::Else)) parseSuiteInto(node->elseBody);
  finish(*node);
  return node;
}

std::unique_ptr<ast::Stmt> Parser::parseForStmt() {
  const lex::Token startTok = peek();
  const bool isAsync = match(TK::Async);
  (void)expect(TK::For, "invalid syntax");
  auto target = parseStarTargets();
  checkTarget(*target, "assign to");
  (void)expect(TK::In, "invalid syntax");
  auto node = std::make_unique<ast::ForStmt>(std::move(target), parseStarExpressions());
  stampFrom(*node, startTok);
  node->isAsync = isAsync;
  parseSuiteInto(node->thenBody);
  if (match(TK::Else)) parseSuiteInto(node->elseBody);
  finish(*node);
  return node;
}

std::unique_ptr<ast::Stmt> Parser::parseTryStmt() {
  const lex::Token tok = get();
  auto node = makeAt<ast::TryStmt>(tok);
  parseSuiteInto(node->body);
  bool sawPlain = false;
  while (peek().kind == TK::Except) {
    const lex::Token exTok = get();
    auto handler = makeAt<ast::ExceptHandler>(exTok);
    const bool star = match(TK::Star);
    if (star) node->isStar = true; else sawPlain = true;
    if (node->isStar && sawPlain) fail(exTok, "cannot have both 'except' and 'except*' on the same 'try'");
    if (peek().kind != TK::Colon) {
      handler->type = parseExpr();
      if (peek().kind == TK::Comma) fail(peek(), "multiple exception types must be parenthesized");
      if (match(TK::As)) {
        if (peek().kind != TK::Ident) fail(peek(), "invalid syntax");
        handler->name = get().text;
      }
    } else if (star) {
      fail(peek(), "expected one or more exception types");
    }
    parseSuiteInto(handler->body);
    finish(*handler);
    node->handlers.push_back(std::move(handler));
  }
  if (!node->handlers.empty() && match(TK::Else)) parseSuiteInto(node->orelse);
  if (match(TK::Finally)) parseSuiteInto(node->finalbody);
  if (node->handlers.empty() && node->finalbody.empty()) fail(peek(), "expected 'except' or 'finally' block");
  finish(*node);
  return node;
}

bool Parser::parenthesizedWithItems() const {
  // '(' at pos_: items are parenthesized when the matching ')' is directly followed by ':'
  int depth = 0;
  for (size_t k = 0;; ++k) {
    const lex::Token& t = peekAt(k);
    if (t.kind == TK::End || t.kind == TK::Newline) return false;
    if (t.kind == TK::LParen || t.kind == TK::LBracket || t.kind == TK::LBrace) ++depth;
    if (t.kind == TK::RParen || t.kind == TK::RBracket || t.kind == TK::RBrace) {
      if (--depth == 0) return peekAt(k + 1).kind == TK::Colon;
    }
  }
}

std::unique_ptr<ast::WithItem> Parser::parseWithItem() {
  const lex::Token tok = peek();
  auto item = makeAt<ast::WithItem>(tok);
  item->context = parseExpr();
  if (match(TK::As)) {
    item->target = parseBitwiseOr();
    checkTarget(*item->target, "assign to");
  }
  finish(*item);
  return item;
}

std::unique_ptr<ast::Stmt> Parser::parseWithStmt() {
  const lex::Token startTok = peek();
  const bool isAsync = match(TK::Async);
  (void)expect(TK::With, "invalid syntax");
  auto node = makeAt<ast::WithStmt>(startTok);
  node->isAsync = isAsync;
  if (peek().kind == TK::LParen && parenthesizedWithItems()) {
    (void)get();
    for (;;) {
      node->items.push_back(parseWithItem());
      if (!match(TK::Comma) || peek().kind == TK::RParen) break;
    }
    (void)expect(TK::RParen, "invalid syntax");
  } else {
    do { node->items.push_back(parseWithItem()); } while (match(TK::Comma));
  }
  parseSuiteInto(node->body);
  finish(*node);
  return node;
}

std::string Parser::parseDottedName() {
  if (peek().kind != TK::Ident) fail(peek(), "invalid syntax");
  std::string name = get().text;
  while (match(TK::Dot)) {
    if (peek().kind != TK::Ident) fail(peek(), "invalid syntax");
    name += ".";
    name += get().text;
  }
  return name;
}

std::unique_ptr<ast::Stmt> Parser::parseImportStmt() {
  const lex::Token tok = get();
  auto asName = [this]() -> std::string {
    if (!match(TK::As)) return {};
    if (peek().kind != TK::Ident) fail(peek(), "invalid syntax");
    return get().text;
  };
  if (tok.kind == TK::Import) {
    auto node = makeAt<ast::Import>(tok);
    do {
      auto alias = makeAt<ast::Alias>(peek());
      alias->name = parseDottedName();
      alias->asname = asName();
      finish(*alias);
      node->names.push_back(std::move(alias));
    } while (match(TK::Comma));
    finish(*node);
    return node;
  }
  auto node = makeAt<ast::ImportFrom>(tok);
  for (;;) {
    if (match(TK::Dot)) node->level += 1;
    else if (match(TK::Ellipsis)) node->level += 3;
    else break;
  }
  if (peek().kind != TK::Import) node->module = parseDottedName();
  else if (node->level == 0) fail(peek(), "invalid syntax");
  (void)expect(TK::Import, "invalid syntax");
  if (peek().kind == TK::Star) {
    auto alias = makeAt<ast::Alias>(get());
    alias->name = "*";
    node->names.push_back(std::move(alias));
    finish(*node);
    return node;
  }
  const bool paren = match(TK::LParen);
  bool afterComma = false;
  for (;;) {
    if (peek().kind != TK::Ident) {
      if (afterComma && !paren) fail(peek(), "trailing comma not allowed without surrounding parentheses");
      fail(peek(), "invalid syntax");
    }
    auto alias = makeAt<ast::Alias>(peek());
    alias->name = get().text;
    alias->asname = asName();
    finish(*alias);
    node->names.push_back(std::move(alias));
    if (!match(TK::Comma)) break;
    afterComma = true;
    if (paren && peek().kind == TK::RParen) break;
  }
  if (paren) (void)expect(TK::RParen, "invalid syntax");
  finish(*node);
  return node;
}

std::unique_ptr<ast::Stmt> Parser::parseReturnStmt() {
  const lex::Token tok = get();
  std::unique_ptr<ast::Expr> value;
  if (startsExpression(peek().kind)) value = parseStarExpressions();
  auto node = std::make_unique<ast::ReturnStmt>(std::move(value));
  stampFrom(*node, tok);
  finish(*node);
  return node;
}

std::unique_ptr<ast::Stmt> Parser::parseRaiseStmt() {
  const lex::Token tok = get();
  auto node = makeAt<ast::RaiseStmt>(tok);
  if (startsExpression(peek().kind)) {
    node->exc = parseExpr();
    if (match(TK::From)) node->cause = parseExpr();
  }
  finish(*node);
  return node;
}

std::unique_ptr<ast::Stmt> Parser::parseGlobalStmt() {
  const lex::Token tok = get();
  auto node = makeAt<ast::GlobalStmt>(tok);
  do {
    if (peek().kind != TK::Ident) fail(peek(), "invalid syntax");
    node->names.push_back(get().text);
  } while (match(TK::Comma));
  finish(*node);
  return node;
}

std::unique_ptr<ast::Stmt> Parser::parseNonlocalStmt() {
  const lex::Token tok = get();
  auto node = makeAt<ast::NonlocalStmt>(tok);
  do {
    if (peek().kind != TK::Ident) fail(peek(), "invalid syntax");
    node->names.push_back(get().text);
  } while (match(TK::Comma));
  finish(*node);
  return node;
}

std::unique_ptr<ast::Stmt> Parser::parseAssertStmt() {
  const lex::Token tok = get();
  auto node = makeAt<ast::AssertStmt>(tok);
  node->test = parseExpr();
  if (match(TK::Comma)) node->msg = parseExpr();
  finish(*node);
  return node;
}

std::unique_ptr<ast::Stmt> Parser::parseDelStmt() {
  const lex::Token tok = get();
  auto node = makeAt<ast::DelStmt>(tok);
  do {
    if (!node->targets.empty() && !startsExpression(peek().kind)) break;
    auto target = parseBitwiseOr();
    checkTarget(*target, "delete");
    node->targets.push_back(std::move(target));
  } while (match(TK::Comma));
  finish(*node);
  return node;
}

bool Parser::looksLikeMatchStmt() const {
  // 'match' <subject> ':' NEWLINE; brackets never contain Newline tokens
  const TK nk = peekNext().kind;
  if (!startsExpression(nk) || nk == TK::Lambda) return false;
  TK prev = TK::End;
  for (size_t k = 1;; ++k) {
    const lex::Token& t = peekAt(k);
    if (t.kind == TK::End) return false;
    if (t.kind == TK::Newline) return prev == TK::Colon;
    prev = t.kind;
  }
}

bool Parser::looksLikeTypeAlias() const {
  // 'type' NAME ['[' ...] '='
  if (peekNext().kind != TK::Ident) return false;
  const TK after = peekAt(2).kind;
  return after == TK::Equal || after == TK::LBracket;
}

std::unique_ptr<ast::Stmt> Parser::parseTypeAliasStmt() {
  const lex::Token tok = get(); // soft keyword 'type'
  auto node = makeAt<ast::TypeAliasStmt>(tok);
  const lex::Token nameTok = get();
  node->name = makeAt<ast::Name>(nameTok, nameTok.text);
  finish(*node->name);
  if (peek().kind == TK::LBracket) parseTypeParams(node->typeParams);
  (void)expect(TK::Equal, "invalid syntax");
  node->value = parseExpr();
  finish(*node);
  return node;
}

std::unique_ptr<ast::Stmt> Parser::parseMatchStmt() {
  const lex::Token tok = get(); // soft keyword 'match'
  auto node = makeAt<ast::MatchStmt>(tok);
  if (peek().kind == TK::Ident && peekNext().kind == TK::ColonEqual) node->subject = parseNamedExpr();
  else node->subject = parseStarExpressions();
  (void)expect(TK::Colon, "expected ':'");
  (void)expect(TK::Newline, "invalid syntax");
  if (peek().kind != TK::Indent) fail(peek(), "expected an indented block");
  (void)get();
  while (peek().kind != TK::Dedent && peek().kind != TK::End) node->cases.push_back(parseMatchCase());
  (void)match(TK::Dedent);
  finish(*node);
  return node;
}

std::unique_ptr<ast::MatchCase> Parser::parseMatchCase() {
  const lex::Token tok = peek();
  if (tok.kind != TK::Ident || tok.text != "case") fail(tok, "invalid syntax");
  (void)get();
  auto mc = makeAt<ast::MatchCase>(tok);
  mc->pattern = parsePattern();
  if (match(TK::As)) {
    if (peek().kind != TK::Ident) fail(peek(), "invalid pattern target");
    mc->asName = get().text;
  }
  if (match(TK::If)) mc->guard = parseNamedExpr();
  parseSuiteInto(mc->body);
  finish(*mc);
  return mc;
}

std::unique_ptr<ast::Expr> Parser::parsePattern() {
  auto one = [this]() -> std::unique_ptr<ast::Expr> {
    const lex::Token tok = peek();
    if (!match(TK::Star)) return parseBitwiseOr();
    if (peek().kind != TK::Ident) fail(peek(), "invalid syntax");
    const lex::Token nameTok = get();
    auto capture = makeAt<ast::Name>(nameTok, nameTok.text);
    auto starred = std::make_unique<ast::Starred>(std::move(capture));
    stampFrom(*starred, tok);
    finish(*starred);
    return starred;
  };
  auto first = one();
  if (peek().kind != TK::Comma) return first;
  auto tup = std::make_unique<ast::TupleLiteral>();
  stampFrom(*tup, *first);
  tup->elements.push_back(std::move(first));
  while (match(TK::Comma)) {
    if (!startsExpression(peek().kind)) break;
    tup->elements.push_back(one());
  }
  finish(*tup);
  return tup;
}

// ---------------------------------------------------------------- expressions

bool Parser::startsExpression(const TK kind) {
  switch (kind) {
    case TK::Ident: case TK::Int: case TK::Float: case TK::Imag:
    case TK::String: case TK::Bytes: case TK::BoolLit: case TK::NoneLit: case TK::Ellipsis:
    case TK::LParen: case TK::LBracket: case TK::LBrace:
    case TK::Minus: case TK::Plus: case TK::Tilde: case TK::Not:
    case TK::Lambda: case TK::Await: case TK::Star:
      return true;
    default:
      return false;
  }
}

bool Parser::atComprehensionFor() const {
  return peek().kind == TK::For || (peek().kind == TK::Async && peekNext().kind == TK::For);
}

std::unique_ptr<ast::Expr> Parser::parseStarExpressions() {
  auto one = [this]() -> std::unique_ptr<ast::Expr> {
    const lex::Token tok = peek();
    if (!match(TK::Star)) return parseExpr();
    auto starred = std::make_unique<ast::Starred>(parseBitwiseOr());
    stampFrom(*starred, tok);
    finish(*starred);
    return starred;
  };
  auto first = one();
  if (peek().kind != TK::Comma) return first;
  auto tup = std::make_unique<ast::TupleLiteral>();
  stampFrom(*tup, *first);
  tup->elements.push_back(std::move(first));
  while (match(TK::Comma)) {
    if (!startsExpression(peek().kind)) break;
    tup->elements.push_back(one());
  }
  finish(*tup);
  return tup;
}

std::unique_ptr<ast::Expr> Parser::parseStarOrNamed() {
  const lex::Token tok = peek();
  if (!match(TK::Star)) return parseNamedExpr();
  auto starred = std::make_unique<ast::Starred>(parseBitwiseOr());
  stampFrom(*starred, tok);
  finish(*starred);
  return starred;
}

std::unique_ptr<ast::Expr> Parser::parseStarTargets() {
  auto one = [this]() -> std::unique_ptr<ast::Expr> {
    const lex::Token tok = peek();
    if (!match(TK::Star)) return parseBitwiseOr();
    auto starred = std::make_unique<ast::Starred>(parseBitwiseOr());
    stampFrom(*starred, tok);
    finish(*starred);
    return starred;
  };
  auto first = one();
  if (peek().kind != TK::Comma) return first;
  auto tup = std::make_unique<ast::TupleLiteral>();
  stampFrom(*tup, *first);
  tup->elements.push_back(std::move(first));
  while (match(TK::Comma)) {
    if (!startsExpression(peek().kind)) break;
    tup->elements.push_back(one());
  }
  finish(*tup);
  return tup;
}

std::unique_ptr<ast::Expr> Parser::parseNamedExpr() {
  if (peek().kind == TK::Ident && peekNext().kind == TK::ColonEqual) {
    const lex::Token nameTok = get();
    (void)get(); // ':='
    auto target = makeAt<ast::Name>(nameTok, nameTok.text);
    auto node = std::make_unique<ast::NamedExpr>(std::move(target), parseExpr());
    stampFrom(*node, nameTok);
    finish(*node);
    return node;
  }
  auto e = parseExpr();
  if (peek().kind == TK::ColonEqual) failAtNode(*e, "cannot use assignment expressions with " + describe(*e));
  return e;
}

std::unique_ptr<ast::Expr> Parser::parseExpr() {
  if (peek().kind == TK::Lambda) return parseLambda();
  auto body = parseLogicalOr();
  if (!match(TK::If)) return body;
  auto test = parseLogicalOr();
  if (!match(TK::Else)) fail(peek(), "expected 'else' after 'if' expression");
  auto node = std::make_unique<ast::IfExpr>(std::move(body), std::move(test), parseExpr());
  stampFrom(*node, *node->body);
  finish(*node);
  return node;
}

std::unique_ptr<ast::Expr> Parser::parseLambda() {
  const lex::Token tok = get();
  auto lam = makeAt<ast::LambdaExpr>(tok);
  parseParamList(lam->params, TK::Colon, false);
  (void)expect(TK::Colon, "expected ':'");
  lam->body = parseExpr();
  finish(*lam);
  return lam;
}

std::unique_ptr<ast::Expr> Parser::parseLogicalOr() {
  auto lhs = parseLogicalAnd();
  while (match(TK::Or)) {
    auto node = std::make_unique<ast::Binary>(ast::BinaryOperator::Or, std::move(lhs), parseLogicalAnd());
    stampFrom(*node, *node->lhs);
    finish(*node);
    lhs = std::move(node);
  }
  return lhs;
}

std::unique_ptr<ast::Expr> Parser::parseLogicalAnd() {
  auto lhs = parseLogicalNot();
  while (match(TK::And)) {
    auto node = std::make_unique<ast::Binary>(ast::BinaryOperator::And, std::move(lhs), parseLogicalNot());
    stampFrom(*node, *node->lhs);
    finish(*node);
    lhs = std::move(node);
  }
  return lhs;
}

std::unique_ptr<ast::Expr> Parser::parseLogicalNot() {
  const lex::Token tok = peek();
  if (!match(TK::Not)) return parseComparison();
  auto node = std::make_unique<ast::Unary>(ast::UnaryOperator::Not, parseLogicalNot());
  stampFrom(*node, tok);
  finish(*node);
  return node;
}

std::unique_ptr<ast::Expr> Parser::parseComparison() {
  auto left = parseBitwiseOr();
  auto readOp = [this](ast::BinaryOperator& op) {
    switch (peek().kind) {
      case TK::EqEq: op = ast::BinaryOperator::Eq; break;
      case TK::NotEq: op = ast::BinaryOperator::Ne; break;
      case TK::Lt: op = ast::BinaryOperator::Lt; break;
      case TK::Le: op = ast::BinaryOperator::Le; break;
      case TK::Gt: op = ast::BinaryOperator::Gt; break;
      case TK::Ge: op = ast::BinaryOperator::Ge; break;
      case TK::In: op = ast::BinaryOperator::In; break;
      case TK::Is:
        (void)get();
        op = match(TK::Not) ? ast::BinaryOperator::IsNot : ast::BinaryOperator::Is;
        return true;
      case TK::Not:
        if (peekNext().kind != TK::In) return false;
        (void)get();
        op = ast::BinaryOperator::NotIn;
        break;
      default:
        return false;
    }
    (void)get();
    return true;
  };
  ast::BinaryOperator op{};
  if (!readOp(op)) return left;
  auto cmp = std::make_unique<ast::Compare>();
  stampFrom(*cmp, *left);
  cmp->left = std::move(left);
  do {
    cmp->ops.push_back(op);
    cmp->comparators.push_back(parseBitwiseOr());
  } while (readOp(op));
  finish(*cmp);
  return cmp;
}

namespace {
std::unique_ptr<ast::Expr> joinBinary(ast::BinaryOperator op, std::unique_ptr<ast::Expr> lhs,
                                      std::unique_ptr<ast::Expr> rhs, const int endLine) {
  auto node = std::make_unique<ast::Binary>(op, std::move(lhs), std::move(rhs));
  stampFrom(*node, *node->lhs);
  node->endLine = endLine;
  return node;
}
} // namespace

std::unique_ptr<ast::Expr> Parser::parseBitwiseOr() {
  auto lhs = parseBitwiseXor();
  while (match(TK::Pipe)) {
    auto rhs = parseBitwiseXor();
    lhs = joinBinary(ast::BinaryOperator::BitOr, std::move(lhs), std::move(rhs), lastLine_);
  }
  return lhs;
}

std::unique_ptr<ast::Expr> Parser::parseBitwiseXor() {
  auto lhs = parseBitwiseAnd();
  while (match(TK::Caret)) {
    auto rhs = parseBitwiseAnd();
    lhs = joinBinary(ast::BinaryOperator::BitXor, std::move(lhs), std::move(rhs), lastLine_);
  }
  return lhs;
}

std::unique_ptr<ast::Expr> Parser::parseBitwiseAnd() {
  auto lhs = parseShift();
  while (match(TK::Amp)) {
    auto rhs = parseShift();
    lhs = joinBinary(ast::BinaryOperator::BitAnd, std::move(lhs), std::move(rhs), lastLine_);
  }
  return lhs;
}

std::unique_ptr<ast::Expr> Parser::parseShift() {
  auto lhs = parseAdditive();
  for (;;) {
    ast::BinaryOperator op{};
    if (match(TK::LShift)) op = ast::BinaryOperator::LShift;
    else if (match(TK::RShift)) op = ast::BinaryOperator::RShift;
    else break;
    auto rhs = parseAdditive();
    lhs = joinBinary(op, std::move(lhs), std::move(rhs), lastLine_);
  }
  return lhs;
}

std::unique_ptr<ast::Expr> Parser::parseAdditive() {
  auto lhs = parseMultiplicative();
  for (;;) {
    ast::BinaryOperator op{};
    if (match(TK::Plus)) op = ast::BinaryOperator::Add;
    else if (match(TK::Minus)) op = ast::BinaryOperator::Sub;
    else break;
    auto rhs = parseMultiplicative();
    lhs = joinBinary(op, std::move(lhs), std::move(rhs), lastLine_);
  }
  return lhs;
}

std::unique_ptr<ast::Expr> Parser::parseMultiplicative() {
  auto lhs = parseUnary();
  for (;;) {
    ast::BinaryOperator op{};
    switch (peek().kind) {
      case TK::Star: op = ast::BinaryOperator::Mul; break;
      case TK::Slash: op = ast::BinaryOperator::Div; break;
      case TK::SlashSlash: op = ast::BinaryOperator::FloorDiv; break;
      case TK::Percent: op = ast::BinaryOperator::Mod; break;
      case TK::At: op = ast::BinaryOperator::MatMul; break;
      default: return lhs;
    }
    (void)get();
    auto rhs = parseUnary();
    lhs = joinBinary(op, std::move(lhs), std::move(rhs), lastLine_);
  }
}

std::unique_ptr<ast::Expr> Parser::parseUnary() {
  const lex::Token tok = peek();
  ast::UnaryOperator op{};
  if (tok.kind == TK::Minus) op = ast::UnaryOperator::Neg;
  else if (tok.kind == TK::Plus) op = ast::UnaryOperator::Pos;
  else if (tok.kind == TK::Tilde) op = ast::UnaryOperator::BitNot;
  else return parsePower();
  (void)get();
  auto node = std::make_unique<ast::Unary>(op, parseUnary());
  stampFrom(*node, tok);
  finish(*node);
  return node;
}

std::unique_ptr<ast::Expr> Parser::parsePower() {
  const lex::Token tok = peek();
  std::unique_ptr<ast::Expr> base;
  if (match(TK::Await)) {
    auto aw = std::make_unique<ast::AwaitExpr>(parsePostfix(parseAtom()));
    stampFrom(*aw, tok);
    finish(*aw);
    base = std::move(aw);
  } else {
    base = parsePostfix(parseAtom());
  }
  if (!match(TK::StarStar)) return base;
  auto rhs = parseUnary(); // right-associative: 2 ** -1, a ** b ** c
  return joinBinary(ast::BinaryOperator::Pow, std::move(base), std::move(rhs), lastLine_);
}

std::unique_ptr<ast::Expr> Parser::parsePostfix(std::unique_ptr<ast::Expr> base) {
  for (;;) {
    if (match(TK::LParen)) {
      auto call = std::make_unique<ast::Call>(std::move(base));
      stampFrom(*call, *call->callee);
      parseCallArgs(call->args, call->keywords);
      (void)expect(TK::RParen, "invalid syntax");
      finish(*call);
      base = std::move(call);
    } else if (match(TK::Dot)) {
      if (peek().kind != TK::Ident) fail(peek(), "invalid syntax");
      auto attr = std::make_unique<ast::Attribute>(std::move(base), get().text);
      stampFrom(*attr, *attr->value);
      finish(*attr);
      base = std::move(attr);
    } else if (match(TK::LBracket)) {
      auto slice = parseSlices();
      (void)expect(TK::RBracket, "invalid syntax");
      auto sub = std::make_unique<ast::Subscript>(std::move(base), std::move(slice));
      stampFrom(*sub, *sub->value);
      finish(*sub);
      base = std::move(sub);
    } else {
      return base;
    }
  }
}

std::unique_ptr<ast::Expr> Parser::parseSlices() {
  auto first = parseSliceItem();
  if (peek().kind != TK::Comma) return first;
  auto tup = std::make_unique<ast::TupleLiteral>();
  stampFrom(*tup, *first);
  tup->elements.push_back(std::move(first));
  while (match(TK::Comma)) {
    if (peek().kind == TK::RBracket) break;
    tup->elements.push_back(parseSliceItem());
  }
  finish(*tup);
  return tup;
}

std::unique_ptr<ast::Expr> Parser::parseSliceItem() {
  const lex::Token tok = peek();
  if (tok.kind == TK::Star) return parseStarOrNamed();
  std::unique_ptr<ast::Expr> lower;
  if (tok.kind != TK::Colon) {
    lower = parseNamedExpr();
    if (peek().kind != TK::Colon) return lower;
  }
  (void)get(); // ':'
  auto sl = makeAt<ast::Slice>(tok);
  sl->lower = std::move(lower);
  auto atPartEnd = [this]() {
    const TK k = peek().kind;
    return k == TK::Colon || k == TK::Comma || k == TK::RBracket;
  };
  if (!atPartEnd()) sl->upper = parseExpr();
  if (match(TK::Colon) && !atPartEnd()) sl->step = parseExpr();
  finish(*sl);
  return sl;
}

void Parser::parseCallArgs(ExprList& args, std::vector<ast::KeywordArg>& keywords) {
  bool sawKeyword = false;
  bool sawKwUnpack = false;
  while (peek().kind != TK::RParen) {
    const lex::Token tok = peek();
    if (match(TK::StarStar)) {
      keywords.push_back(ast::KeywordArg{std::string{}, parseExpr()});
      sawKwUnpack = true;
    } else if (match(TK::Star)) {
      if (sawKwUnpack) fail(tok, "iterable argument unpacking follows keyword argument unpacking");
      auto starred = std::make_unique<ast::Starred>(parseExpr());
      stampFrom(*starred, tok);
      finish(*starred);
      args.push_back(std::move(starred));
    } else if (tok.kind == TK::Ident && peekNext().kind == TK::Equal) {
      (void)get();
      (void)get();
      keywords.push_back(ast::KeywordArg{tok.text, parseExpr()});
      sawKeyword = true;
    } else {
      auto e = parseNamedExpr();
      if (atComprehensionFor()) {
        auto gen = std::make_unique<ast::GeneratorExpr>();
        stampFrom(*gen, *e);
        gen->elt = std::move(e);
        gen->fors = parseComprehensionFors();
        finish(*gen);
        // an unparenthesized generator must be the sole argument
        if (!args.empty() || !keywords.empty() || peek().kind == TK::Comma) {
          fail(tok, "Generator expression must be parenthesized");
        }
        args.push_back(std::move(gen));
        break;
      }
      if (sawKwUnpack) fail(tok, "positional argument follows keyword argument unpacking");
      if (sawKeyword) fail(tok, "positional argument follows keyword argument");
      args.push_back(std::move(e));
    }
    if (!match(TK::Comma)) break;
  }
}

std::vector<ast::ComprehensionFor> Parser::parseComprehensionFors() {
  std::vector<ast::ComprehensionFor> fors;
  while (atComprehensionFor()) {
    ast::ComprehensionFor cf;
    cf.isAsync = match(TK::Async);
    (void)expect(TK::For, "invalid syntax");
    cf.target = parseStarTargets();
    checkTarget(*cf.target, "assign to");
    (void)expect(TK::In, "invalid syntax");
    cf.iter = parseLogicalOr();
    while (match(TK::If)) cf.ifs.push_back(parseLogicalOr());
    fors.push_back(std::move(cf));
  }
  return fors;
}

std::unique_ptr<ast::Expr> Parser::parseYieldExpr() {
  const lex::Token tok = get(); // 'yield'
  auto y = makeAt<ast::YieldExpr>(tok);
  if (match(TK::From)) {
    y->isFrom = true;
    y->value = parseExpr();
  } else if (startsExpression(peek().kind)) {
    y->value = parseStarExpressions();
  }
  finish(*y);
  return y;
}

std::unique_ptr<ast::Expr> Parser::parseAtom() {
  const lex::Token tok = peek();
  switch (tok.kind) {
    case TK::Ident: (void)get(); return makeAt<ast::Name>(tok, tok.text);
    case TK::Int: (void)get(); return makeAt<ast::IntLiteral>(tok, tok.text);
    case TK::Float: (void)get(); return makeAt<ast::FloatLiteral>(tok, tok.text);
    case TK::Imag: (void)get(); return makeAt<ast::ImagLiteral>(tok, tok.text);
    case TK::BoolLit: (void)get(); return makeAt<ast::BoolLiteral>(tok, tok.text == "True");
    case TK::NoneLit: (void)get(); return makeAt<ast::NoneLiteral>(tok);
    case TK::Ellipsis: (void)get(); return makeAt<ast::EllipsisLiteral>(tok);
    case TK::String:
    case TK::Bytes: return parseStringAtom(tok);
    case TK::LParen: (void)get(); return parseTupleOrParen(tok);
    case TK::LBracket: (void)get(); return parseListLiteral(tok);
    case TK::LBrace: (void)get(); return parseDictOrSetLiteral(tok);
    default: break;
  }
  fail(tok, "invalid syntax");
}

std::unique_ptr<ast::Expr> Parser::parseTupleOrParen(const lex::Token& openTok) {
  if (peek().kind == TK::RParen) {
    (void)get();
    auto empty = makeAt<ast::TupleLiteral>(openTok);
    empty->parenthesized = true;
    finish(*empty);
    return empty;
  }
  if (peek().kind == TK::Yield) {
    auto y = parseYieldExpr();
    (void)expect(TK::RParen, "invalid syntax");
    return y;
  }
  auto first = parseStarOrNamed();
  if (atComprehensionFor()) {
    if (first->kind == ast::NodeKind::Starred) failAtNode(*first, "iterable unpacking cannot be used in comprehension");
    auto gen = makeAt<ast::GeneratorExpr>(openTok);
    gen->elt = std::move(first);
    gen->fors = parseComprehensionFors();
    (void)expect(TK::RParen, "invalid syntax");
    finish(*gen);
    return gen;
  }
  if (peek().kind != TK::Comma) {
    (void)expect(TK::RParen, "invalid syntax");
    if (first->kind == ast::NodeKind::Starred) failAtNode(*first, "cannot use starred expression here");
    return first;
  }
  auto tup = makeAt<ast::TupleLiteral>(openTok);
  tup->parenthesized = true;
  tup->elements.push_back(std::move(first));
  while (match(TK::Comma)) {
    if (peek().kind == TK::RParen) break;
    tup->elements.push_back(parseStarOrNamed());
  }
  (void)expect(TK::RParen, "invalid syntax");
  finish(*tup);
  return tup;
}

std::unique_ptr<ast::Expr> Parser::parseListLiteral(const lex::Token& openTok) {
  auto lst = makeAt<ast::ListLiteral>(openTok);
  if (match(TK::RBracket)) { finish(*lst); return lst; }
  auto first = parseStarOrNamed();
  if (atComprehensionFor()) {
    if (first->kind == ast::NodeKind::Starred) failAtNode(*first, "iterable unpacking cannot be used in comprehension");
    auto comp = makeAt<ast::ListComp>(openTok);
    comp->elt = std::move(first);
    comp->fors = parseComprehensionFors();
    (void)expect(TK::RBracket, "invalid syntax");
    finish(*comp);
    return comp;
  }
  lst->elements.push_back(std::move(first));
  while (match(TK::Comma)) {
    if (peek().kind == TK::RBracket) break;
    lst->elements.push_back(parseStarOrNamed());
  }
  (void)expect(TK::RBracket, "invalid syntax");
  finish(*lst);
  return lst;
}

std::unique_ptr<ast::Expr> Parser::parseDictOrSetLiteral(const lex::Token& openTok) {
  if (match(TK::RBrace)) {
    auto empty = makeAt<ast::DictLiteral>(openTok);
    finish(*empty);
    return empty;
  }
  auto dictEntries = [this](ast::DictLiteral& dict) {
    while (match(TK::Comma)) {
      if (peek().kind == TK::RBrace) break;
      if (match(TK::StarStar)) {
        dict.keys.push_back(nullptr);
        dict.values.push_back(parseBitwiseOr());
        continue;
      }
      dict.keys.push_back(parseExpr());
      (void)expect(TK::Colon, "':' expected after dictionary key");
      dict.values.push_back(parseExpr());
    }
    (void)expect(TK::RBrace, "invalid syntax");
  };
  if (match(TK::StarStar)) {
    auto dict = makeAt<ast::DictLiteral>(openTok);
    dict->keys.push_back(nullptr);
    dict->values.push_back(parseBitwiseOr());
    dictEntries(*dict);
    finish(*dict);
    return dict;
  }
  auto first = parseStarOrNamed();
  if (match(TK::Colon)) {
    if (first->kind == ast::NodeKind::Starred) failAtNode(*first, "cannot use a starred expression in a dictionary key");
    auto value = parseExpr();
    if (atComprehensionFor()) {
      auto comp = makeAt<ast::DictComp>(openTok);
      comp->key = std::move(first);
      comp->value = std::move(value);
      comp->fors = parseComprehensionFors();
      (void)expect(TK::RBrace, "invalid syntax");
      finish(*comp);
      return comp;
    }
    auto dict = makeAt<ast::DictLiteral>(openTok);
    dict->keys.push_back(std::move(first));
    dict->values.push_back(std::move(value));
    dictEntries(*dict);
    finish(*dict);
    return dict;
  }
  if (atComprehensionFor()) {
    if (first->kind == ast::NodeKind::Starred) failAtNode(*first, "iterable unpacking cannot be used in comprehension");
    auto comp = makeAt<ast::SetComp>(openTok);
    comp->elt = std::move(first);
    comp->fors = parseComprehensionFors();
    (void)expect(TK::RBrace, "invalid syntax");
    finish(*comp);
    return comp;
  }
  auto set = makeAt<ast::SetLiteral>(openTok);
  set->elements.push_back(std::move(first));
  while (match(TK::Comma)) {
    if (peek().kind == TK::RBrace) break;
    set->elements.push_back(parseStarOrNamed());
  }
  (void)expect(TK::RBrace, "invalid syntax");
  finish(*set);
  return set;
}

} // namespace pytgen::parse
