/***
 * Name: pytgen::driver::ParseCli
 * Purpose: Parse command-line arguments into a CliOptions structure.
 * Inputs:
 *   - argc: Argument count
 *   - argv: Argument vector
 *   - dst: Output options structure to populate
 *   - err: Stream for diagnostics on parse errors
 * Outputs:
 *   - bool: true on successful parse, false if an error occurs
 * Theory of Operation:
 *   Runs the handler table over every argument until "--", after which each
 *   word goes straight to the positional handler. Help stops parsing. The
 *   command word and its one path must both be present.
 */
#include "pytgen/driver/cli.h"
#include "pytgen/driver/cli_parse.h"

#include <cstddef>
#include <ostream>
#include <string>
#include <vector>

namespace pytgen::driver {

auto ParseCli(int argc, const char* const* argv, CliOptions& dst, std::ostream& err) -> bool {
  dst = CliOptions{};
  const std::vector<std::string> args(argv, argv + argc);  // NOLINT(cppcoreguidelines-pro-bounds-pointer-arithmetic)

  bool options_done = false;
  for (int arg_index = 1; arg_index < argc; ++arg_index) {
    const std::string& arg = args[static_cast<std::size_t>(arg_index)];
    if (!options_done && arg == "--") {
      options_done = true;
      continue;
    }
    const detail::OptResult result = options_done ? detail::HandlePositional(arg, true, dst, err)
                                                  : detail::RunHandlers(args, arg_index, argc, dst, err);
    if (result == detail::OptResult::Error) {
      return false;
    }
    if (dst.show_help) {
      return true;
    }
  }

  if (dst.command == CliOptions::Command::None) {
    err << "pytgen: error: no command given (expected extract, validate or clean)" << '\n';
    return false;
  }
  if (dst.input.empty()) {
    err << "pytgen: error: '" << dst.command_word << "' takes exactly one input file" << '\n';
    return false;
  }
  return true;
}

}  // namespace pytgen::driver
