/***
 * Name: pytgen::parse::ParseSource
 * Purpose: Lex and parse one in-memory source into a module tree.
 * Inputs: source text, identifier recorded as the file of every node
 * Outputs: owned Module; throws exceptions::ParseError on malformed input
 */
#pragma once

#include <memory>
#include <string>

#include "ast/Module.h"

namespace pytgen::parse {

std::unique_ptr<ast::Module> ParseSource(const std::string& text, const std::string& identifier);

} // namespace pytgen::parse
