#pragma once

#include <memory>
#include <string>
#include <vector>
#include "ast/Acceptable.h"
#include "ast/Expr.h"
#include "ast/HasBody.h"
#include "ast/HasParams.h"
#include "ast/HasName.h"
#include "ast/Param.h"
#include "ast/Stmt.h"
#include "ast/TypeParam.h"

namespace pytgen::ast {
    // def / async def; line is the 'def' keyword line, never a decorator's.
    struct FunctionDef final : Stmt, Acceptable<FunctionDef, NodeKind::FunctionDef>, HasBody<Stmt>, HasParams<Param>, HasName {
        std::unique_ptr<Expr> returns;                  // optional '->' annotation
        std::vector<std::unique_ptr<Expr>> decorators;  // optional decorator expressions
        std::vector<TypeParam> typeParams;              // def f[T](...)
        bool isAsync{false};
        explicit FunctionDef(std::string n)
            : Stmt(NodeKind::FunctionDef), HasName{std::move(n)} {}
    };

} // namespace pytgen::ast
