/***
 * Name: pytgen::driver::detail::HandleValueListArg
 * Purpose: Handle valued long options: --name=<val> or --name <val>.
 * Inputs:
 *   - arg: current argument string
 *   - long_opt: option name (e.g., "--framework")
 *   - args: full argument vector
 *   - index: current index (will be advanced if value is consumed from next arg)
 *   - argc: total argument count
 *   - out: list to append the parsed value
 *   - err: error stream
 * Outputs: OptResult indicating match and success/failure
 * Theory of Operation: Supports both joined and spaced forms in a single helper.
 */
#include "pytgen/driver/cli_parse.h"

#include <cstddef>
#include <string>
#include <vector>

namespace pytgen {
namespace driver {
namespace detail {

auto HandleValueListArg(const std::string& arg, const ValueListParams& params) -> OptResult {
  if (arg.rfind(params.long_opt, 0) != 0U) {
    return OptResult::NotMatched;
  }
  if (arg.size() > params.long_opt.size()) {
    if (arg[params.long_opt.size()] != '=') {
      return OptResult::NotMatched;  // a longer option sharing this prefix
    }
    params.out.emplace_back(arg.substr(params.long_opt.size() + 1));
    return OptResult::Handled;
  }
  if (params.index + 1 >= params.argc) {
    params.err << "pytgen: error: missing value after '" << params.long_opt << "'" << '\n';
    return OptResult::Error;
  }
  ++params.index;
  params.out.emplace_back(params.args[static_cast<std::size_t>(params.index)]);
  return OptResult::Handled;
}

}  // namespace detail
}  // namespace driver
}  // namespace pytgen
