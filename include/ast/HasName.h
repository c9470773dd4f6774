/**
 * @file
 * @brief AST utility declarations (HasName mixin).
 */
#pragma once

#include <string>

namespace pytgen::ast {

struct HasName {
    std::string name;
};

}
