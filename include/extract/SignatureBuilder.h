/***
 * Name: pytgen::extract (signature builders)
 * Purpose: Convert def/class nodes into signature values.
 * Inputs: FunctionDef or ClassDef nodes of a parsed module
 * Outputs: CallableSignature / ClassSignature
 * Theory of Operation: Parameters are regrouped by kind (positional, *args,
 *   keyword-only, **kwargs); annotations and bases are rendered with
 *   ast::RenderExpr. Decorators are never inspected.
 */
#pragma once

#include "ast/ClassDef.h"
#include "ast/FunctionDef.h"
#include "extract/Signatures.h"

namespace pytgen::extract {

CallableSignature BuildCallableSignature(const ast::FunctionDef& fn);

ClassSignature BuildClassSignature(const ast::ClassDef& cls);

} // namespace pytgen::extract
