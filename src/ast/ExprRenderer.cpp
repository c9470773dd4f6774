/***
 * Name: pytgen::ast::RenderExpr
 * Purpose: Expression-to-source renderer (ast.unparse layout).
 * Theory of Operation:
 *   Each node is rendered under a precedence requested by its parent. A node
 *   whose own precedence is lower than the requested one is wrapped in
 *   parentheses. Children default to the TEST level.
 */
#include "ast/ExprRenderer.h"
#include "ast/Nodes.h"
#include "ast/VisitorBase.h"

#include <unicode/uchar.h>
#include <unicode/utf8.h>

#include <cstdint>
#include <cstdio>
#include <string>
#include <vector>

namespace pytgen::ast {

namespace {

// Mirrors ast._Precedence; BOR shares the EXPR level.
enum Prec : int {
  kNamedExpr = 1, kTuple, kYield, kTest, kOr, kAnd, kNot, kCmp, kExpr, kBor = kExpr,
  kBxor, kBand, kShift, kArith, kTerm, kFactor, kPower, kAwait, kAtom
};

int precedenceOf(BinaryOperator op) {
  switch (op) {
    case BinaryOperator::Add: case BinaryOperator::Sub: return kArith;
    case BinaryOperator::Mul: case BinaryOperator::MatMul: case BinaryOperator::Div:
    case BinaryOperator::Mod: case BinaryOperator::FloorDiv: return kTerm;
    case BinaryOperator::Pow: return kPower;
    case BinaryOperator::LShift: case BinaryOperator::RShift: return kShift;
    case BinaryOperator::BitAnd: return kBand;
    case BinaryOperator::BitOr: return kBor;
    case BinaryOperator::BitXor: return kBxor;
    case BinaryOperator::And: return kAnd;
    case BinaryOperator::Or: return kOr;
    default: return kCmp;
  }
}

bool isPrintable(UChar32 cp) {
  if (cp == ' ') { return true; }
  switch (u_charType(cp)) {
    case U_CONTROL_CHAR: case U_FORMAT_CHAR: case U_SURROGATE: case U_PRIVATE_USE_CHAR:
    case U_UNASSIGNED: case U_LINE_SEPARATOR: case U_PARAGRAPH_SEPARATOR: case U_SPACE_SEPARATOR:
      return false;
    default:
      return true;
  }
}

char pickQuote(const std::string& s) {
  const bool hasSingle = s.find('\'') != std::string::npos;
  const bool hasDouble = s.find('"') != std::string::npos;
  return (hasSingle && !hasDouble) ? '"' : '\'';
}

void appendHex(std::string& out, const char* fmt, unsigned value) {
  char buf[16];
  std::snprintf(buf, sizeof(buf), fmt, value);
  out += buf;
}

bool appendCommonEscape(std::string& out, unsigned c, char quote) {
  if (c == '\\') { out += "\\\\"; return true; }
  if (c == static_cast<unsigned char>(quote)) { out += '\\'; out += quote; return true; }
  if (c == '\n') { out += "\\n"; return true; }
  if (c == '\r') { out += "\\r"; return true; }
  if (c == '\t') { out += "\\t"; return true; }
  return false;
}

class ExprRenderer final : public VisitorBase {
 public:
  std::string out;

  void emit(const Expr& expr, int prec) {
    const int saved = requested_;
    requested_ = prec;
    expr.accept(*this);
    requested_ = saved;
  }

  void visit(const Name& n) override { out += n.id; }
  void visit(const IntLiteral& n) override { out += n.value; }
  void visit(const FloatLiteral& n) override { out += n.value; }
  void visit(const ImagLiteral& n) override { out += n.value; }
  void visit(const BoolLiteral& b) override { out += b.value ? "True" : "False"; }
  void visit(const StringLiteral& s) override { out += ReprString(s.value); }
  void visit(const BytesLiteral& b) override { out += ReprBytes(b.value); }
  void visit(const FStringLiteral& f) override { out += f.text; }
  void visit(const NoneLiteral&) override { out += "None"; }
  void visit(const EllipsisLiteral&) override { out += "..."; }

  void visit(const Attribute& a) override {
    emit(*a.value, kAtom);
    if (a.value->kind == NodeKind::IntLiteral) { out += ' '; }
    out += '.';
    out += a.attr;
  }

  void visit(const Subscript& s) override {
    emit(*s.value, kAtom);
    out += '[';
    if (s.slice->kind == NodeKind::TupleLiteral && !static_cast<const TupleLiteral&>(*s.slice).elements.empty()) {
      itemsView(static_cast<const TupleLiteral&>(*s.slice).elements);
    } else {
      emit(*s.slice, kTest);
    }
    out += ']';
  }

  void visit(const Slice& s) override {
    if (s.lower) { emit(*s.lower, kTest); }
    out += ':';
    if (s.upper) { emit(*s.upper, kTest); }
    if (s.step) { out += ':'; emit(*s.step, kTest); }
  }

  void visit(const Starred& s) override { out += '*'; emit(*s.value, kExpr); }

  void visit(const Call& c) override {
    emit(*c.callee, kAtom);
    out += '(';
    bool first = true;
    for (const auto& arg : c.args) { sep(first); emit(*arg, kTest); }
    for (const auto& kw : c.keywords) {
      sep(first);
      if (kw.name.empty()) { out += "**"; } else { out += kw.name; out += '='; }
      emit(*kw.value, kTest);
    }
    out += ')';
  }

  void visit(const Binary& b) override {
    const int prec = precedenceOf(b.op);
    const bool parens = requested_ > prec;
    if (parens) { out += '('; }
    const bool boolOp = b.op == BinaryOperator::And || b.op == BinaryOperator::Or;
    const bool rightAssoc = b.op == BinaryOperator::Pow;
    emit(*b.lhs, (rightAssoc) ? prec + 1 : prec);
    out += ' '; out += to_symbol(b.op); out += ' ';
    emit(*b.rhs, (rightAssoc && !boolOp) ? prec : prec + 1);
    if (parens) { out += ')'; }
  }

  void visit(const Unary& u) override {
    const int prec = (u.op == UnaryOperator::Not) ? kNot : kFactor;
    const bool parens = requested_ > prec;
    if (parens) { out += '('; }
    switch (u.op) {
      case UnaryOperator::Not: out += "not "; break;
      case UnaryOperator::Neg: out += '-'; break;
      case UnaryOperator::Pos: out += '+'; break;
      case UnaryOperator::BitNot: out += '~'; break;
    }
    emit(*u.operand, prec);
    if (parens) { out += ')'; }
  }

  void visit(const Compare& c) override {
    const bool parens = requested_ > kCmp;
    if (parens) { out += '('; }
    emit(*c.left, kCmp + 1);
    for (std::size_t i = 0; i < c.ops.size(); ++i) {
      out += ' '; out += to_symbol(c.ops[i]); out += ' ';
      emit(*c.comparators[i], kCmp + 1);
    }
    if (parens) { out += ')'; }
  }

  void visit(const IfExpr& e) override {
    const bool parens = requested_ > kTest;
    if (parens) { out += '('; }
    emit(*e.body, kTest + 1);
    out += " if ";
    emit(*e.test, kTest + 1);
    out += " else ";
    emit(*e.orelse, kTest);
    if (parens) { out += ')'; }
  }

  void visit(const LambdaExpr& l) override {
    const bool parens = requested_ > kTest;
    if (parens) { out += '('; }
    out += "lambda";
    if (!l.params.empty()) { out += ' '; params(l.params); }
    out += ": ";
    emit(*l.body, kTest);
    if (parens) { out += ')'; }
  }

  void visit(const NamedExpr& n) override {
    const bool parens = requested_ > kNamedExpr;
    if (parens) { out += '('; }
    emit(*n.target, kAtom);
    out += " := ";
    emit(*n.value, kAtom);
    if (parens) { out += ')'; }
  }

  void visit(const YieldExpr& y) override {
    const bool parens = requested_ > kYield;
    if (parens) { out += '('; }
    out += y.isFrom ? "yield from" : "yield";
    if (y.value) { out += ' '; emit(*y.value, kTest); }
    if (parens) { out += ')'; }
  }

  void visit(const AwaitExpr& a) override {
    const bool parens = requested_ > kAwait;
    if (parens) { out += '('; }
    out += "await ";
    emit(*a.value, kAtom);
    if (parens) { out += ')'; }
  }

  void visit(const TupleLiteral& t) override {
    const bool parens = t.elements.empty() || requested_ > kTuple;
    if (parens) { out += '('; }
    itemsView(t.elements);
    if (parens) { out += ')'; }
  }

  void visit(const ListLiteral& l) override {
    out += '[';
    bool first = true;
    for (const auto& e : l.elements) { sep(first); emit(*e, kTest); }
    out += ']';
  }

  void visit(const SetLiteral& s) override {
    if (s.elements.empty()) { out += "{*()}"; return; }
    out += '{';
    bool first = true;
    for (const auto& e : s.elements) { sep(first); emit(*e, kTest); }
    out += '}';
  }

  void visit(const DictLiteral& d) override {
    out += '{';
    bool first = true;
    for (std::size_t i = 0; i < d.values.size(); ++i) {
      sep(first);
      if (d.keys[i]) {
        emit(*d.keys[i], kTest);
        out += ": ";
        emit(*d.values[i], kTest);
      } else {
        out += "**";
        emit(*d.values[i], kExpr);
      }
    }
    out += '}';
  }

  void visit(const ListComp& c) override { out += '['; emit(*c.elt, kTest); fors(c.fors); out += ']'; }
  void visit(const SetComp& c) override { out += '{'; emit(*c.elt, kTest); fors(c.fors); out += '}'; }
  void visit(const GeneratorExpr& c) override { out += '('; emit(*c.elt, kTest); fors(c.fors); out += ')'; }
  void visit(const DictComp& c) override {
    out += '{'; emit(*c.key, kTest); out += ": "; emit(*c.value, kTest); fors(c.fors); out += '}';
  }

 private:
  int requested_{kTest};

  void sep(bool& first) { if (!first) { out += ", "; } first = false; }

  void itemsView(const std::vector<std::unique_ptr<Expr>>& items) {
    if (items.size() == 1) { emit(*items.front(), kTest); out += ','; return; }
    bool first = true;
    for (const auto& e : items) { sep(first); emit(*e, kTest); }
  }

  void fors(const std::vector<ComprehensionFor>& gens) {
    for (const auto& g : gens) {
      out += g.isAsync ? " async for " : " for ";
      emit(*g.target, kTuple);
      out += " in ";
      emit(*g.iter, kTest + 1);
      for (const auto& cond : g.ifs) { out += " if "; emit(*cond, kTest + 1); }
    }
  }

  void params(const std::vector<Param>& ps) {
    bool first = true;
    bool sawPosOnly = false;
    bool starWritten = false;
    for (const auto& p : ps) {
      if (sawPosOnly && !p.isPosOnly) { sep(first); out += '/'; sawPosOnly = false; }
      if (p.isKwOnly && !starWritten) { sep(first); out += '*'; starWritten = true; }
      sep(first);
      if (p.isVarArg) { out += '*'; starWritten = true; }
      if (p.isKwVarArg) { out += "**"; }
      out += p.name;
      if (p.annotation) { out += ": "; emit(*p.annotation, kTest); }
      if (p.defaultValue) { out += p.annotation ? " = " : "="; emit(*p.defaultValue, kTest); }
      if (p.isPosOnly) { sawPosOnly = true; }
    }
    if (sawPosOnly) { sep(first); out += '/'; }
  }
};

} // namespace

std::string RenderExpr(const Expr& expr) {
  ExprRenderer renderer;
  renderer.emit(expr, kTest);
  return renderer.out;
}

std::string ReprString(const std::string& utf8) {
  const char quote = pickQuote(utf8);
  std::string out(1, quote);
  const auto* data = reinterpret_cast<const uint8_t*>(utf8.data());
  const auto len = static_cast<int32_t>(utf8.size());
  int32_t i = 0;
  while (i < len) {
    const int32_t start = i;
    UChar32 cp = 0;
    U8_NEXT(data, i, len, cp);
    if (cp < 0) { appendHex(out, "\\x%02x", data[start]); continue; }
    if (cp < 0x80 && appendCommonEscape(out, static_cast<unsigned>(cp), quote)) { continue; }
    if (cp < 0x20 || cp == 0x7f) { appendHex(out, "\\x%02x", static_cast<unsigned>(cp)); continue; }
    if (cp >= 0x80 && !isPrintable(cp)) {
      if (cp <= 0xff) { appendHex(out, "\\x%02x", static_cast<unsigned>(cp)); }
      else if (cp <= 0xffff) { appendHex(out, "\\u%04x", static_cast<unsigned>(cp)); }
      else { appendHex(out, "\\U%08x", static_cast<unsigned>(cp)); }
      continue;
    }
    out.append(utf8, static_cast<std::size_t>(start), static_cast<std::size_t>(i - start));
  }
  out += quote;
  return out;
}

std::string ReprBytes(const std::string& bytes) {
  const char quote = pickQuote(bytes);
  std::string out = "b";
  out += quote;
  for (const char ch : bytes) {
    const auto c = static_cast<unsigned char>(ch);
    if (appendCommonEscape(out, c, quote)) { continue; }
    if (c < 0x20 || c >= 0x7f) { appendHex(out, "\\x%02x", c); continue; }
    out += static_cast<char>(c);
  }
  out += quote;
  return out;
}

} // namespace pytgen::ast
