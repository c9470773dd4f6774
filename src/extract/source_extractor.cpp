/***
 * Name: pytgen::extract::SourceExtractor::extract
 * Purpose: Breadth-first signature extraction with parent-based routing.
 */
#include "extract/SourceExtractor.h"

#include "ast/Children.h"
#include "ast/ClassDef.h"
#include "ast/FunctionDef.h"
#include "ast/NodeKind.h"
#include "ast/ParentMap.h"
#include "extract/SignatureBuilder.h"
#include "parser/ParseSource.h"

#include <string>

namespace pytgen::extract {

AnalysisResult SourceExtractor::extract(const std::string& sourceText, const std::string& identifier) const {
  const auto module = parse::ParseSource(sourceText, identifier);
  return extract(*module);
}

AnalysisResult SourceExtractor::extract(const ast::Module& module) const {
  AnalysisResult result;
  const ast::ParentMap parents(module);
  for (const ast::Node* node : ast::WalkBreadthFirst(module)) {
    if (node->kind == ast::NodeKind::FunctionDef) {
      const ast::Node* parent = parents.parentOf(*node);
      if (parent != nullptr && parent->kind == ast::NodeKind::ClassDef) continue;
      result.functions.push_back(BuildCallableSignature(static_cast<const ast::FunctionDef&>(*node)));
    } else if (node->kind == ast::NodeKind::ClassDef) {
      result.classes.push_back(BuildClassSignature(static_cast<const ast::ClassDef&>(*node)));
    }
  }
  return result;
}

std::string FormatSyntaxError(const exceptions::ParseError& err) {
  return "Syntax error in " + err.file() + " at line " + std::to_string(err.line()) + ": " + err.detail();
}

} // namespace pytgen::extract
