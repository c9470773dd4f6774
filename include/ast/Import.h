#pragma once

#include <memory>
#include <vector>
#include "ast/Stmt.h"
#include "ast/Alias.h"
#include "ast/Acceptable.h"

namespace pytgen::ast {
    struct Import final : Stmt, Acceptable<Import, NodeKind::Import> {
        std::vector<std::unique_ptr<Alias>> names;
        Import() : Stmt(NodeKind::Import) {}
    };
}
