#pragma once

#include <string>
#include <vector>
#include "Stmt.h"
#include "ast/Acceptable.h"

namespace pytgen::ast {

struct GlobalStmt final : Stmt, Acceptable<GlobalStmt, NodeKind::GlobalStmt> {
  std::vector<std::string> names;
  GlobalStmt() : Stmt(NodeKind::GlobalStmt) {}
};

} // namespace pytgen::ast
