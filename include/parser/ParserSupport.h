/***
 * Name: pytgen::parse::detail
 * Purpose: Location stamping and error helpers shared by the parser sources.
 */
#pragma once

#include <memory>
#include <string>
#include <utility>

#include "ast/Node.h"
#include "lexer/Token.h"
#include "pytgen/exceptions/parse_error.h"

namespace pytgen::parse::detail {

inline void stampFrom(ast::Node& node, const lex::Token& tok) {
  node.line = tok.line;
  node.col = tok.col;
  node.file = tok.file;
  node.endLine = tok.endLine;
}

inline void stampFrom(ast::Node& node, const ast::Node& first) {
  node.line = first.line;
  node.col = first.col;
  node.file = first.file;
  node.endLine = first.endLine;
}

template <typename N, typename... Args>
std::unique_ptr<N> makeAt(const lex::Token& tok, Args&&... args) {
  auto node = std::make_unique<N>(std::forward<Args>(args)...);
  stampFrom(*node, tok);
  return node;
}

[[noreturn]] inline void failAt(const lex::Token& at, const std::string& msg) {
  throw exceptions::ParseError(at.file, at.line, at.col, msg);
}

} // namespace pytgen::parse::detail
