/***
 * Name: pytgen::ast::to_symbol
 * Purpose: Python spelling of binary, boolean and comparison operators.
 */
#include "ast/BinaryOperator.h"

namespace pytgen::ast {

const char* to_symbol(const BinaryOperator op) {
  using enum pytgen::ast::BinaryOperator;
  switch (op) {
    case Add: return "+";
    case Sub: return "-";
    case Mul: return "*";
    case MatMul: return "@";
    case Div: return "/";
    case Mod: return "%";
    case FloorDiv: return "//";
    case Pow: return "**";
    case LShift: return "<<";
    case RShift: return ">>";
    case BitAnd: return "&";
    case BitOr: return "|";
    case BitXor: return "^";
    case Eq: return "==";
    case Ne: return "!=";
    case Lt: return "<";
    case Le: return "<=";
    case Gt: return ">";
    case Ge: return ">=";
    case Is: return "is";
    case IsNot: return "is not";
    case In: return "in";
    case NotIn: return "not in";
    case And: return "and";
    case Or: return "or";
  }
  return "?";
}

} // namespace pytgen::ast
