/***
 * Name: pytgen::ast::ChildNodes / WalkBreadthFirst
 * Purpose: Enumerate direct children of any node and walk a tree breadth-first.
 * Theory of Operation:
 *   ChildCollector is a VisitorBase whose overloads push each child pointer in
 *   the field order Python's ast module uses. The walk is a FIFO queue seeded
 *   with the root, extended with each dequeued node's children.
 */
#include "ast/Children.h"
#include "ast/Nodes.h"
#include "ast/VisitorBase.h"

#include <cstddef>
#include <memory>
#include <vector>

namespace pytgen::ast {

namespace {

class ChildCollector final : public VisitorBase {
 public:
  std::vector<const Node*> out;

  template <typename T>
  void add(const std::unique_ptr<T>& child) { if (child) { out.push_back(child.get()); } }
  template <typename T>
  void addAll(const std::vector<std::unique_ptr<T>>& children) { for (const auto& c : children) { add(c); } }
  void addParams(const std::vector<Param>& params) {
    for (const auto& p : params) { add(p.annotation); }
    for (const auto& p : params) { add(p.defaultValue); }
  }
  void addTypeParams(const std::vector<TypeParam>& params) {
    for (const auto& p : params) { add(p.bound); add(p.defaultValue); }
  }
  void addKeywords(const std::vector<KeywordArg>& keywords) { for (const auto& kw : keywords) { add(kw.value); } }
  void addFors(const std::vector<ComprehensionFor>& fors) {
    for (const auto& f : fors) { add(f.target); add(f.iter); addAll(f.ifs); }
  }

  void visit(const Module& m) override { addAll(m.body); }
  void visit(const FunctionDef& fn) override {
    addParams(fn.params); addAll(fn.body); addAll(fn.decorators); add(fn.returns); addTypeParams(fn.typeParams);
  }
  void visit(const ClassDef& cls) override {
    addAll(cls.bases); addKeywords(cls.keywords); addAll(cls.body); addAll(cls.decorators); addTypeParams(cls.typeParams);
  }
  void visit(const ReturnStmt& s) override { add(s.value); }
  void visit(const AssignStmt& s) override { addAll(s.targets); add(s.value); }
  void visit(const AnnAssignStmt& s) override { add(s.target); add(s.annotation); add(s.value); }
  void visit(const AugAssignStmt& s) override { add(s.target); add(s.value); }
  void visit(const TypeAliasStmt& s) override { add(s.name); addTypeParams(s.typeParams); add(s.value); }
  void visit(const ExprStmt& s) override { add(s.value); }
  void visit(const IfStmt& s) override { add(s.cond); addAll(s.thenBody); addAll(s.elseBody); }
  void visit(const WhileStmt& s) override { add(s.cond); addAll(s.thenBody); addAll(s.elseBody); }
  void visit(const ForStmt& s) override { add(s.target); add(s.iterable); addAll(s.thenBody); addAll(s.elseBody); }
  void visit(const DelStmt& s) override { addAll(s.targets); }
  void visit(const TryStmt& s) override { addAll(s.body); addAll(s.handlers); addAll(s.orelse); addAll(s.finalbody); }
  void visit(const ExceptHandler& h) override { add(h.type); addAll(h.body); }
  void visit(const WithItem& w) override { add(w.context); add(w.target); }
  void visit(const WithStmt& s) override { addAll(s.items); addAll(s.body); }
  void visit(const RaiseStmt& s) override { add(s.exc); add(s.cause); }
  void visit(const AssertStmt& s) override { add(s.test); add(s.msg); }
  void visit(const Import& s) override { addAll(s.names); }
  void visit(const ImportFrom& s) override { addAll(s.names); }
  void visit(const MatchStmt& s) override { add(s.subject); addAll(s.cases); }
  void visit(const MatchCase& c) override { add(c.pattern); add(c.guard); addAll(c.body); }

  void visit(const FStringLiteral& f) override { addAll(f.values); }
  void visit(const Attribute& a) override { add(a.value); }
  void visit(const Subscript& s) override { add(s.value); add(s.slice); }
  void visit(const Slice& s) override { add(s.lower); add(s.upper); add(s.step); }
  void visit(const Call& c) override { add(c.callee); addAll(c.args); addKeywords(c.keywords); }
  void visit(const Binary& b) override { add(b.lhs); add(b.rhs); }
  void visit(const Unary& u) override { add(u.operand); }
  void visit(const Compare& c) override { add(c.left); addAll(c.comparators); }
  void visit(const IfExpr& e) override { add(e.test); add(e.body); add(e.orelse); }
  void visit(const LambdaExpr& l) override { addParams(l.params); add(l.body); }
  void visit(const NamedExpr& n) override { add(n.target); add(n.value); }
  void visit(const Starred& s) override { add(s.value); }
  void visit(const YieldExpr& y) override { add(y.value); }
  void visit(const AwaitExpr& a) override { add(a.value); }
  void visit(const TupleLiteral& t) override { addAll(t.elements); }
  void visit(const ListLiteral& l) override { addAll(l.elements); }
  void visit(const SetLiteral& s) override { addAll(s.elements); }
  void visit(const DictLiteral& d) override { addAll(d.keys); addAll(d.values); }
  void visit(const ListComp& c) override { add(c.elt); addFors(c.fors); }
  void visit(const SetComp& c) override { add(c.elt); addFors(c.fors); }
  void visit(const DictComp& c) override { add(c.key); add(c.value); addFors(c.fors); }
  void visit(const GeneratorExpr& c) override { add(c.elt); addFors(c.fors); }
};

} // namespace

std::vector<const Node*> ChildNodes(const Node& node) {
  ChildCollector collector;
  node.accept(collector);
  return std::move(collector.out);
}

std::vector<const Node*> WalkBreadthFirst(const Node& root) {
  std::vector<const Node*> order{&root};
  for (std::size_t head = 0; head < order.size(); ++head) {
    for (const Node* child : ChildNodes(*order[head])) { order.push_back(child); }
  }
  return order;
}

} // namespace pytgen::ast
