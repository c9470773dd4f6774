/***
 * Name: pytgen::driver::detail::RunHandlers
 * Purpose: Execute the ordered handler list for argument at 'index'.
 * Inputs: args, index (in/out), argc, dst, err
 * Outputs: OptResult (Error halts, Handled continues)
 * Theory of Operation: Table-driven dispatch; the last handler takes the
 *   command word and input path and rejects unknown options.
 */
#include "pytgen/driver/cli_parse.h"

#include <array>
#include <cstddef>
#include <functional>
#include <ostream>
#include <string>
#include <utility>
#include <vector>

namespace pytgen {
namespace driver {
namespace detail {

auto RunHandlers(const std::vector<std::string>& args,
                 int& index,
                 int argc,
                 CliOptions& dst,
                 std::ostream& err) -> OptResult {
  using HandlerFn = std::function<OptResult(int&)>;

  const auto valueList = [&](const std::string& long_opt, std::vector<std::string>& out) {
    std::vector<std::string>* target = &out;
    return HandlerFn{[&args, &err, argc, long_opt, target](int& idx) {
      const std::string& current = args[static_cast<std::size_t>(idx)];
      const ValueListParams params{long_opt, args, idx, argc, *target, err};
      return HandleValueListArg(current, params);
    }};
  };

  const std::array handlers{
      HandlerFn{[&](int& idx) { return HandleSwitch(args[static_cast<std::size_t>(idx)], dst); }},
      HandlerFn{[&](int& idx) { return HandleChoiceArg(args[static_cast<std::size_t>(idx)], dst, err); }},
      valueList("--context", dst.context),
      valueList("--reject-log", dst.reject_log),
      valueList("--test-prefix", dst.test_prefix),
      valueList("--framework", dst.frameworks),
      valueList("--assert-pattern", dst.assert_patterns),
      valueList("--mock-pattern", dst.mock_patterns),
      valueList("--callable-type", dst.callable_types),
      valueList("--dangerous-call", dst.dangerous_calls),
      valueList("--known-module", dst.known_modules),
      valueList("--module-path", dst.module_paths),
      HandlerFn{[&](int& idx) {
        return HandlePositional(args[static_cast<std::size_t>(idx)], false, dst, err);
      }},
  };

  for (const auto& handler : handlers) {
    const OptResult result = handler(index);
    if (result == OptResult::Error) {
      return OptResult::Error;
    }
    if (result == OptResult::Handled) {
      return OptResult::Handled;
    }
  }
  return OptResult::NotMatched;
}

}  // namespace detail
}  // namespace driver
}  // namespace pytgen
