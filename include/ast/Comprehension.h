/**
 * @file
 * @brief Comprehension and generator-expression nodes.
 */
#pragma once

#include <memory>
#include <vector>
#include "Expr.h"
#include "ast/Acceptable.h"

namespace pytgen::ast {

// One 'for target in iter if ...' clause; clauses nest left to right.
struct ComprehensionFor {
  std::unique_ptr<Expr> target;
  std::unique_ptr<Expr> iter;
  std::vector<std::unique_ptr<Expr>> ifs; // zero or more if guards
  bool isAsync{false};                    // 'async for'
};

// Fields common to every comprehension form; K fixes the node kind.
template <typename Derived, NodeKind K>
struct ComprehensionBase : Expr, Acceptable<Derived, K> {
  std::vector<ComprehensionFor> fors; // at least one after parsing
  ComprehensionBase() : Expr(K) {}
};

// [elt for ...], {elt for ...}, (elt for ...)
template <typename Derived, NodeKind K>
struct ElementComprehension : ComprehensionBase<Derived, K> {
  std::unique_ptr<Expr> elt;
};

struct ListComp final : ElementComprehension<ListComp, NodeKind::ListComp> {};
struct SetComp final : ElementComprehension<SetComp, NodeKind::SetComp> {};
struct GeneratorExpr final : ElementComprehension<GeneratorExpr, NodeKind::GeneratorExpr> {};

// {key: value for ...}
struct DictComp final : ComprehensionBase<DictComp, NodeKind::DictComp> {
  std::unique_ptr<Expr> key;
  std::unique_ptr<Expr> value;
};

} // namespace pytgen::ast
