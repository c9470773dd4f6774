#pragma once

#include <memory>
#include <string>
#include <vector>
#include "ast/Stmt.h"
#include "ast/Expr.h"
#include "ast/HasBody.h"
#include "ast/Acceptable.h"

namespace pytgen::ast {

// Patterns are kept in expression shape (capture names as Name, class patterns as Call, ...).
struct MatchCase final : Node, HasBody<Stmt>, Acceptable<MatchCase, NodeKind::MatchCase> {
  std::unique_ptr<Expr> pattern;
  std::string asName;           // top-level 'as' capture, empty if none
  std::unique_ptr<Expr> guard;  // optional; null when absent
  MatchCase() : Node(NodeKind::MatchCase) {}
};

struct MatchStmt final : Stmt, Acceptable<MatchStmt, NodeKind::MatchStmt> {
  std::unique_ptr<Expr> subject;
  std::vector<std::unique_ptr<MatchCase>> cases;
  MatchStmt() : Stmt(NodeKind::MatchStmt) {}
};

} // namespace pytgen::ast
