/***
 * Name: pytgen::extract::BuildCallableSignature / BuildClassSignature
 * Purpose: Convert def and class nodes into signature values.
 */
#include "extract/SignatureBuilder.h"

#include "ast/Expr.h"
#include "ast/ExprRenderer.h"
#include "ast/NodeKind.h"
#include "extract/Docstring.h"

#include <optional>
#include <string>
#include <vector>

namespace pytgen::extract {

namespace {

std::optional<std::string> renderOptional(const ast::Expr* expr) {
  if (expr == nullptr) return std::nullopt;
  return ast::RenderExpr(*expr);
}

ArgumentSpec toArgument(const ast::Param& p, const ArgumentKind kind) {
  return ArgumentSpec{p.name, renderOptional(p.annotation.get()), kind};
}

} // namespace

CallableSignature BuildCallableSignature(const ast::FunctionDef& fn) {
  CallableSignature sig;
  sig.name = fn.name;
  std::vector<ArgumentSpec> positional;
  std::vector<ArgumentSpec> keywordOnly;
  std::optional<ArgumentSpec> varArg;
  std::optional<ArgumentSpec> kwVarArg;
  for (const auto& p : fn.params) {
    if (p.isVarArg) varArg = toArgument(p, ArgumentKind::VariadicPositional);
    else if (p.isKwVarArg) kwVarArg = toArgument(p, ArgumentKind::VariadicKeyword);
    else if (p.isKwOnly) keywordOnly.push_back(toArgument(p, ArgumentKind::KeywordOnly));
    else positional.push_back(toArgument(p, ArgumentKind::Positional));
  }
  sig.arguments = std::move(positional);
  if (varArg) sig.arguments.push_back(*varArg);
  sig.arguments.insert(sig.arguments.end(), keywordOnly.begin(), keywordOnly.end());
  if (kwVarArg) sig.arguments.push_back(*kwVarArg);
  sig.returnType = renderOptional(fn.returns.get());
  sig.docstring = DocstringOf(fn.body);
  sig.startLine = fn.line;
  sig.endLine = fn.endLine;
  sig.isAsync = fn.isAsync;
  return sig;
}

ClassSignature BuildClassSignature(const ast::ClassDef& cls) {
  ClassSignature sig;
  sig.name = cls.name;
  for (const auto& base : cls.bases) sig.baseNames.push_back(ast::RenderExpr(*base));
  sig.docstring = DocstringOf(cls.body);
  for (const auto& stmt : cls.body) {
    if (stmt->kind == ast::NodeKind::FunctionDef) {
      sig.methods.push_back(BuildCallableSignature(static_cast<const ast::FunctionDef&>(*stmt)));
    }
  }
  sig.startLine = cls.line;
  sig.endLine = cls.endLine;
  return sig;
}

} // namespace pytgen::extract
