#pragma once

#include <memory>
#include <vector>

#include "Expr.h"
#include "Stmt.h"
#include "ast/Acceptable.h"
#include "ast/TypeParam.h"

namespace pytgen::ast {

    // type Name[T, ...] = value
    struct TypeAliasStmt final : Stmt, Acceptable<TypeAliasStmt, NodeKind::TypeAliasStmt> {
        std::unique_ptr<Expr> name; // Name
        std::vector<TypeParam> typeParams;
        std::unique_ptr<Expr> value;
        TypeAliasStmt() : Stmt(NodeKind::TypeAliasStmt) {}
    };
} // namespace pytgen::ast
