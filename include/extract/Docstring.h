/***
 * Name: pytgen::extract (docstrings)
 * Purpose: Locate and normalize docstrings.
 */
#pragma once

#include <memory>
#include <optional>
#include <string>
#include <vector>

#include "ast/Stmt.h"

namespace pytgen::extract {

// Decoded text of the leading bare string-literal statement of a body, if any.
std::optional<std::string> DocstringOf(const std::vector<std::unique_ptr<ast::Stmt>>& body);

/***
 * Name: pytgen::extract::CleanDocstring
 * Purpose: Normalize docstring indentation for display.
 * Theory of Operation: Same rules as inspect.cleandoc: tabs expand to 8 columns,
 *   the first line loses its leading whitespace, the common indentation of the
 *   remaining non-blank lines is removed, then leading and trailing blank lines
 *   are dropped.
 */
std::string CleanDocstring(const std::string& doc);

} // namespace pytgen::extract
