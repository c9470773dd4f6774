#pragma once

#include <memory>
#include <string>
#include <vector>
#include "ast/Node.h"
#include "ast/HasBody.h"
#include "ast/HasName.h"
#include "ast/Acceptable.h"
#include "ast/Call.h"
#include "ast/Expr.h"
#include "ast/Stmt.h"
#include "ast/TypeParam.h"

namespace pytgen::ast {
    struct ClassDef final : Stmt, Acceptable<ClassDef, NodeKind::ClassDef>, HasBody<Stmt>, HasName {
        std::vector<std::unique_ptr<Expr>> bases;       // positional bases, Starred for *bases
        std::vector<KeywordArg> keywords;               // metaclass=..., **kw
        std::vector<std::unique_ptr<Expr>> decorators;  // decorator expressions
        std::vector<TypeParam> typeParams;              // class C[T]
        explicit ClassDef(std::string n) : Stmt(NodeKind::ClassDef), HasName{std::move(n)} {}
    };
}
