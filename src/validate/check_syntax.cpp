#include "validate/Checks.h"

namespace pytgen::validate::detail {

std::string DescribeParseError(const exceptions::ParseError& err) {
  return err.detail() + " (" + err.file() + ", line " + std::to_string(err.line()) + ")";
}

void CheckSyntax(const CheckInput& in, std::vector<Finding>& out) {
  if (in.parseError) {
    out.push_back({Severity::Error, "Syntax error: " + DescribeParseError(*in.parseError)});
  }
}

} // namespace pytgen::validate::detail
